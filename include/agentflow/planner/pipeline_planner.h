// agentflow/planner/pipeline_planner.h
#ifndef AGENTFLOW_PLANNER_PIPELINE_PLANNER_H
#define AGENTFLOW_PLANNER_PIPELINE_PLANNER_H

#include "agentflow/capability/capability_router.h"
#include "agentflow/core/context_chain.h"
#include "agentflow/core/types/pipeline.h"
#include "agentflow/registry/plugin_registry.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

class MonitorService;
class MemoryProvider;

struct ReplanDecision {
    enum class Kind : uint8_t { CONTINUE, REPLACE };

    Kind kind = Kind::CONTINUE;
    Pipeline steps;     // only for REPLACE
    std::string reason; // only for REPLACE

    static ReplanDecision keep() { return {}; }
    static ReplanDecision replace(Pipeline steps, std::string reason) {
        return {Kind::REPLACE, std::move(steps), std::move(reason)};
    }
    bool is_replace() const { return kind == Kind::REPLACE; }
};

extern const char* const DEFAULT_PLAN_PROMPT_TEMPLATE;

// PipelinePlanner: 通过一次 planning capability 调用生成/修订计划
class PipelinePlanner {
public:
    struct Config {
        std::string planning_capability = "planning";
        std::string replan_capability = "planning";
        bool replan_enabled = true;
        std::string prompt_template = DEFAULT_PLAN_PROMPT_TEMPLATE;
        size_t history_limit = 10;
        std::optional<std::chrono::milliseconds> timeout; // falls back to the router default
        Config() = default;
    };

    PipelinePlanner(Config config,
                    const PluginRegistry& registry,
                    const CapabilityRouter& router,
                    MonitorService* monitor = nullptr,
                    MemoryProvider* memory = nullptr);

    // Throws PlanningError; an empty pipeline is a valid plan
    Pipeline plan(const ContextChain& chain, const std::vector<StepDescriptor>& available_steps) const;

    // Throws PlanningError on capability failure or an invalid step reference
    ReplanDecision should_replan(const ContextChain& chain, const Pipeline& remaining) const;

    // Accepts {"steps": [...]} or a bare array; steps are {plugin, action} or "plugin.action"
    Pipeline parse_steps(const nlohmann::json& output, const std::vector<StepDescriptor>& available_steps) const;

    const Config& config() const { return config_; }

private:
    Config config_;
    const PluginRegistry& registry_;
    const CapabilityRouter& router_;
    MonitorService* monitor_;
    MemoryProvider* memory_;

    nlohmann::json build_input(const std::string& mode,
                               const ContextChain& chain,
                               const std::vector<StepDescriptor>& available_steps,
                               const Pipeline* remaining) const;
    nlohmann::json load_history(const ContextChain& chain) const;
    nlohmann::json call_capability(const std::string& capability, const nlohmann::json& input) const;
};

} // namespace agentflow

#endif // AGENTFLOW_PLANNER_PIPELINE_PLANNER_H
