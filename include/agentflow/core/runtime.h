// agentflow/core/runtime.h
#ifndef AGENTFLOW_CORE_RUNTIME_H
#define AGENTFLOW_CORE_RUNTIME_H

#include "agentflow/capability/capability_router.h"
#include "agentflow/capability/structured_extractor.h"
#include "agentflow/core/config.h"
#include "agentflow/executor/pipeline_executor.h"
#include "agentflow/monitor/monitor_service.h"
#include "agentflow/planner/pipeline_planner.h"
#include "agentflow/queue/event_queue.h"
#include "agentflow/registry/plugin_registry.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace agentflow {

class MemoryProvider;

// AgentRuntime: 组装各组件，负责两阶段启动
// Registration (plugins, model-provider capabilities) is only allowed before
// start(); afterwards registry and router are read-only.
class AgentRuntime {
public:
    explicit AgentRuntime(RuntimeConfig config = RuntimeConfig{}, MemoryProvider* memory = nullptr);
    ~AgentRuntime();

    AgentRuntime(const AgentRuntime&) = delete;
    AgentRuntime& operator=(const AgentRuntime&) = delete;

    static std::unique_ptr<AgentRuntime> from_config_file(const std::string& config_path,
                                                          MemoryProvider* memory = nullptr);

    void register_plugin(Plugin plugin);
    void register_capability(Capability capability);

    template <typename Func>
    void register_capability(std::string id, std::vector<std::string> aliases, Func&& func) {
        Capability capability;
        capability.id = std::move(id);
        capability.aliases = std::move(aliases);
        capability.handler = std::forward<Func>(func);
        register_capability(std::move(capability));
    }

    void add_monitor_sink(std::shared_ptr<MonitorSink> sink);

    // Phase 2 init then dispatch; startup errors propagate and leave the runtime stopped
    void start();
    void shutdown();
    bool running() const { return started_ && !stopped_ && queue_->running(); }

    // Throws InvalidEvent / QueueClosed
    void submit(Event event);
    void wait_idle();

    // Runs one event on the calling thread, bypassing the queue
    RunOutcome run_sync(const Event& event) const;

    nlohmann::json invoke(const std::string& capability,
                          const nlohmann::json& input,
                          const nlohmann::json& config = nlohmann::json::object(),
                          std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    ExtractionResult extract(const std::string& capability,
                             const Schema& schema,
                             const std::string& instruction,
                             const nlohmann::json& config = nlohmann::json::object(),
                             std::optional<int> max_attempts = std::nullopt) const;

    const RuntimeConfig& config() const { return config_; }
    PluginRegistry& registry() { return registry_; }
    const CapabilityRouter& capabilities() const { return router_; }
    MonitorService& monitor() { return monitor_; }

private:
    RuntimeConfig config_;
    MemoryProvider* memory_;
    MonitorService monitor_; // 最先构造、最后析构
    CapabilityRouter router_;
    PluginRegistry registry_;
    StructuredExtractor extractor_;
    PipelinePlanner planner_;
    PipelineExecutor executor_;
    std::unique_ptr<EventQueue> queue_;
    bool started_ = false;
    bool stopped_ = false;
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_RUNTIME_H
