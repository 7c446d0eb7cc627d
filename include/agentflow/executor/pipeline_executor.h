// agentflow/executor/pipeline_executor.h
#ifndef AGENTFLOW_EXECUTOR_PIPELINE_EXECUTOR_H
#define AGENTFLOW_EXECUTOR_PIPELINE_EXECUTOR_H

#include "agentflow/capability/capability_router.h"
#include "agentflow/core/types/event.h"
#include "agentflow/core/types/run_outcome.h"
#include "agentflow/executor/execution_session.h"
#include "agentflow/planner/pipeline_planner.h"
#include "agentflow/registry/plugin_registry.h"
#include <cstdint>
#include <optional>

namespace agentflow {

class MonitorService;
class MemoryProvider;
class StructuredExtractor;

// 插件 handler 失败后的处理策略
enum class FailurePolicy : uint8_t {
    HALT, // terminate the run as Failed
    SKIP  // record the error item and continue with the next step
};

FailurePolicy parse_failure_policy(const std::string& name); // throws ConfigError

// PipelineExecutor: Planning -> Running -> Replanning <-> Running -> Succeeded | Failed
// Stateless between runs; every run gets its own ExecutionSession.
class PipelineExecutor {
public:
    struct Config {
        int max_steps = 64; // -1: unlimited
        FailurePolicy failure_policy = FailurePolicy::HALT;
        Config() = default;
    };

    PipelineExecutor(Config config,
                     const PluginRegistry& registry,
                     const PipelinePlanner& planner,
                     const CapabilityRouter& router,
                     const StructuredExtractor* extractor = nullptr,
                     MonitorService* monitor = nullptr,
                     MemoryProvider* memory = nullptr);

    // Drives one event to termination and invokes its response handler exactly once.
    // Never throws; failures are reported in the outcome and the chain.
    RunOutcome run(const Event& event) const;

    // Same, starting from a fixed pipeline instead of asking the planner
    RunOutcome run(const Event& event, Pipeline initial) const;

    const Config& config() const { return config_; }

private:
    Config config_;
    const PluginRegistry& registry_;
    const PipelinePlanner& planner_;
    const CapabilityRouter& router_;
    const StructuredExtractor* extractor_;
    MonitorService* monitor_;
    MemoryProvider* memory_;

    RunOutcome drive(const Event& event, std::optional<Pipeline> initial) const;
    void on_planning(ExecutionSession& session) const;
    void on_running(ExecutionSession& session) const;
    void on_replanning(ExecutionSession& session) const;
    void handle_step_failure(ExecutionSession& session, const PipelineStep& step,
                             const std::string& error_kind, const std::string& detail) const;
    void deliver(const Event& event, const RunOutcome& outcome) const;
    void publish(const std::string& type, const std::string& event_id, nlohmann::json payload) const;
};

} // namespace agentflow

#endif // AGENTFLOW_EXECUTOR_PIPELINE_EXECUTOR_H
