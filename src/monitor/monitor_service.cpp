// src/monitor/monitor_service.cpp
#include "agentflow/monitor/monitor_service.h"
#include "agentflow/common/utils.h"
#include <spdlog/spdlog.h>

namespace agentflow {

MonitorService::MonitorService() {
    worker_ = std::thread(&MonitorService::worker_loop, this);
}

MonitorService::~MonitorService() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void MonitorService::add_sink(std::shared_ptr<MonitorSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void MonitorService::publish(MonitorEvent event) {
    if (event.timestamp == 0) {
        event.timestamp = now_millis();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back(std::move(event));
    }
    cv_.notify_one();
}

void MonitorService::publish(std::string type, std::string event_id, nlohmann::json payload) {
    publish(MonitorEvent{std::move(type), std::move(event_id), 0, std::move(payload)});
}

void MonitorService::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    drained_cv_.wait(lock, [this]() { return pending_.empty() && !dispatching_; });
}

size_t MonitorService::dropped_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sink_failures_;
}

void MonitorService::worker_loop() {
    while (true) {
        MonitorEvent event;
        std::vector<std::shared_ptr<MonitorSink>> sinks;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !pending_.empty(); });
            // 停止前先排空队列
            if (pending_.empty()) {
                break;
            }
            event = std::move(pending_.front());
            pending_.pop_front();
            sinks = sinks_;
            dispatching_ = true;
        }

        size_t failures = 0;
        for (const auto& sink : sinks) {
            try {
                sink->publish(event);
            } catch (const std::exception& e) {
                ++failures;
                spdlog::warn("Monitor sink failed on '{}': {}", event.type, e.what());
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_failures_ += failures;
            dispatching_ = false;
        }
        drained_cv_.notify_all();
    }
    drained_cv_.notify_all();
}

} // namespace agentflow
