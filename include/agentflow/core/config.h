// agentflow/core/config.h
#ifndef AGENTFLOW_CORE_CONFIG_H
#define AGENTFLOW_CORE_CONFIG_H

#include "agentflow/executor/pipeline_executor.h"
#include "agentflow/planner/pipeline_planner.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace agentflow {

struct RuntimeConfig {
    size_t worker_count = 4;
    std::string planning_capability = "planning";
    std::string replan_capability = "planning";
    bool replan_enabled = true;
    int64_t capability_timeout_ms = 0; // 0: no timeout
    int max_steps = 64;                // -1: unlimited
    FailurePolicy failure_policy = FailurePolicy::HALT;
    size_t history_limit = 10;
    int extraction_max_attempts = 3;
    std::string log_level = "info";
    std::string plan_prompt_template = DEFAULT_PLAN_PROMPT_TEMPLATE;

    PipelinePlanner::Config planner_config() const;
    PipelineExecutor::Config executor_config() const;
};

// Unknown keys are ignored; wrong types throw ConfigError
RuntimeConfig parse_runtime_config(const nlohmann::json& j);

// .json via nlohmann::json, .yaml/.yml via yaml-cpp; a missing file yields defaults
RuntimeConfig load_runtime_config(const std::string& config_path = "agentflow.json");

} // namespace agentflow

#endif // AGENTFLOW_CORE_CONFIG_H
