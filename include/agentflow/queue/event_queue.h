// agentflow/queue/event_queue.h
#ifndef AGENTFLOW_QUEUE_EVENT_QUEUE_H
#define AGENTFLOW_QUEUE_EVENT_QUEUE_H

#include "agentflow/core/types/event.h"
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace agentflow {

class MonitorService;

// EventQueue: 按会话 key 分组调度，同一 key 同时最多一个运行
// Strict FIFO per conversation key; distinct keys run concurrently up to
// worker_count. Unbounded: producers needing backpressure wrap submit().
class EventQueue {
public:
    using RunFunction = std::function<void(const Event&)>;

    struct Config {
        size_t worker_count = 4;
        Config() = default;
    };

    EventQueue(Config config, RunFunction run, MonitorService* monitor = nullptr);
    ~EventQueue();

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    // Events submitted before start() are held until dispatch begins
    void start();

    // Validates and enqueues; never blocks. Throws InvalidEvent or QueueClosed.
    void submit(Event event);

    // Stops admission, drains everything pending, joins the workers
    void shutdown();

    // Blocks until nothing is pending or in flight; returns at once before start()
    void wait_idle();

    size_t pending() const;
    size_t in_flight() const;
    bool running() const;

private:
    Config config_;
    RunFunction run_;
    MonitorService* monitor_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::unordered_map<std::string, std::deque<Event>> queues_;
    std::deque<std::string> ready_keys_;           // pending events, no run in flight
    std::unordered_set<std::string> active_keys_;  // run in flight
    size_t pending_count_ = 0;
    bool started_ = false;
    bool stopping_ = false;
    std::vector<std::thread> workers_;

    void worker_loop();
};

} // namespace agentflow

#endif // AGENTFLOW_QUEUE_EVENT_QUEUE_H
