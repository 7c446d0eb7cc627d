// src/queue/event_queue.cpp
#include "agentflow/queue/event_queue.h"
#include "agentflow/core/errors.h"
#include "agentflow/monitor/monitor_service.h"
#include <spdlog/spdlog.h>

namespace agentflow {

EventQueue::EventQueue(Config config, RunFunction run, MonitorService* monitor)
    : config_(config), run_(std::move(run)), monitor_(monitor) {
    if (config_.worker_count == 0) {
        config_.worker_count = 1;
    }
}

EventQueue::~EventQueue() {
    shutdown();
}

void EventQueue::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_ || stopping_) {
        return;
    }
    started_ = true;
    workers_.reserve(config_.worker_count);
    for (size_t i = 0; i < config_.worker_count; ++i) {
        workers_.emplace_back(&EventQueue::worker_loop, this);
    }
    spdlog::info("Event queue started with {} worker(s)", config_.worker_count);
}

void EventQueue::submit(Event event) {
    validate_event(event);
    const std::string key = conversation_key(event);
    const std::string event_id = event.id;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw QueueClosed("Event queue is shut down; rejected event '" + event_id + "'");
        }
        auto& q = queues_[key];
        bool was_empty = q.empty();
        q.push_back(std::move(event));
        ++pending_count_;
        // 有运行中的同 key 事件时，等它结束再入 ready 队列
        if (was_empty && active_keys_.count(key) == 0) {
            ready_keys_.push_back(key);
        }
    }
    cv_.notify_one();

    if (monitor_) {
        monitor_->publish("event.queued", event_id, {{"conversation_key", key}});
    }
}

void EventQueue::worker_loop() {
    while (true) {
        std::string key;
        Event event;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !ready_keys_.empty(); });
            if (ready_keys_.empty()) {
                break; // stopping and fully drained
            }

            key = std::move(ready_keys_.front());
            ready_keys_.pop_front();
            auto& q = queues_[key];
            event = std::move(q.front());
            q.pop_front();
            --pending_count_;
            active_keys_.insert(key);
        }

        try {
            run_(event);
        } catch (const std::exception& e) {
            // 单个运行的失败不影响队列
            spdlog::error("Run for event '{}' escaped with exception: {}", event.id, e.what());
        } catch (...) {
            spdlog::error("Run for event '{}' escaped with a non-standard exception", event.id);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_keys_.erase(key);
            auto it = queues_.find(key);
            if (it != queues_.end() && !it->second.empty()) {
                ready_keys_.push_back(key);
                cv_.notify_one();
            } else if (it != queues_.end()) {
                queues_.erase(it);
            }
            if (pending_count_ == 0 && active_keys_.empty()) {
                idle_cv_.notify_all();
            }
        }
    }
}

void EventQueue::shutdown() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
        workers.swap(workers_);
        if (!started_ && pending_count_ > 0) {
            spdlog::warn("Event queue shut down before start; dropping {} pending event(s)", pending_count_);
            queues_.clear();
            ready_keys_.clear();
            pending_count_ = 0;
        }
    }
    cv_.notify_all();
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    idle_cv_.notify_all();
}

void EventQueue::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() {
        return (pending_count_ == 0 && active_keys_.empty()) || !started_;
    });
}

size_t EventQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_count_;
}

size_t EventQueue::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_keys_.size();
}

bool EventQueue::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_ && !stopping_;
}

} // namespace agentflow
