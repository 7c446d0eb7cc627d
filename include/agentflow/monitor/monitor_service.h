// agentflow/monitor/monitor_service.h
#ifndef AGENTFLOW_MONITOR_MONITOR_SERVICE_H
#define AGENTFLOW_MONITOR_MONITOR_SERVICE_H

#include "agentflow/core/types/context_item.h"
#include <nlohmann/json.hpp>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace agentflow {

struct MonitorEvent {
    std::string type;     // e.g. "run.started", "pipeline.replaced"
    std::string event_id; // originating event, empty for runtime-level events
    Timestamp timestamp = 0;
    nlohmann::json payload = nlohmann::json::object();
};

// Collaborator-implemented telemetry sink
class MonitorSink {
public:
    virtual ~MonitorSink() = default;
    virtual void publish(const MonitorEvent& event) = 0;
};

// 显式构造、注入到各组件；publish 永不阻塞调用方
class MonitorService {
public:
    MonitorService();
    ~MonitorService();

    MonitorService(const MonitorService&) = delete;
    MonitorService& operator=(const MonitorService&) = delete;

    void add_sink(std::shared_ptr<MonitorSink> sink);

    // Fire-and-forget; sink failures are logged and swallowed
    void publish(MonitorEvent event);
    void publish(std::string type, std::string event_id, nlohmann::json payload = nlohmann::json::object());

    // Blocks until every event published so far has been dispatched
    void flush();

    size_t dropped_failures() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable drained_cv_;
    std::deque<MonitorEvent> pending_;
    std::vector<std::shared_ptr<MonitorSink>> sinks_;
    bool dispatching_ = false;
    bool stopping_ = false;
    size_t sink_failures_ = 0;
    std::thread worker_;

    void worker_loop();
};

} // namespace agentflow

#endif // AGENTFLOW_MONITOR_MONITOR_SERVICE_H
