// src/core/config.cpp
#include "agentflow/core/config.h"
#include "agentflow/common/logging.h"
#include "agentflow/common/yaml_json.h"
#include "agentflow/core/errors.h"
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>

namespace agentflow {

PipelinePlanner::Config RuntimeConfig::planner_config() const {
    PipelinePlanner::Config config;
    config.planning_capability = planning_capability;
    config.replan_capability = replan_capability;
    config.replan_enabled = replan_enabled;
    config.prompt_template = plan_prompt_template;
    config.history_limit = history_limit;
    if (capability_timeout_ms > 0) {
        config.timeout = std::chrono::milliseconds(capability_timeout_ms);
    }
    return config;
}

PipelineExecutor::Config RuntimeConfig::executor_config() const {
    PipelineExecutor::Config config;
    config.max_steps = max_steps;
    config.failure_policy = failure_policy;
    return config;
}

namespace {

template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key) || j[key].is_null()) {
        return;
    }
    try {
        out = j[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

void require_type(const nlohmann::json& j, const char* key, bool ok, const char* expected) {
    if (j.contains(key) && !j[key].is_null() && !ok) {
        throw ConfigError(std::string("'") + key + "' must be " + expected);
    }
}

} // namespace

RuntimeConfig parse_runtime_config(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Runtime configuration must be an object");
    }
    RuntimeConfig config;

    require_type(j, "worker_count",
                 j.value("worker_count", nlohmann::json(1)).is_number_integer() &&
                     j.value("worker_count", nlohmann::json(1)).get<int64_t>() > 0,
                 "a positive integer");
    require_type(j, "history_limit",
                 j.value("history_limit", nlohmann::json(0)).is_number_integer() &&
                     j.value("history_limit", nlohmann::json(0)).get<int64_t>() >= 0,
                 "a non-negative integer");
    require_type(j, "max_steps", j.value("max_steps", nlohmann::json(0)).is_number_integer(), "an integer");
    require_type(j, "capability_timeout_ms", j.value("capability_timeout_ms", nlohmann::json(0)).is_number_integer(),
                 "an integer");
    require_type(j, "replan_enabled", j.value("replan_enabled", nlohmann::json(true)).is_boolean(), "a boolean");

    read_field(j, "worker_count", config.worker_count);
    read_field(j, "planning_capability", config.planning_capability);
    read_field(j, "replan_capability", config.replan_capability);
    read_field(j, "replan_enabled", config.replan_enabled);
    read_field(j, "capability_timeout_ms", config.capability_timeout_ms);
    read_field(j, "max_steps", config.max_steps);
    read_field(j, "history_limit", config.history_limit);
    read_field(j, "extraction_max_attempts", config.extraction_max_attempts);
    read_field(j, "log_level", config.log_level);
    read_field(j, "plan_prompt_template", config.plan_prompt_template);

    if (j.contains("failure_policy") && !j["failure_policy"].is_null()) {
        std::string policy;
        read_field(j, "failure_policy", policy);
        config.failure_policy = parse_failure_policy(policy);
    }

    if (config.extraction_max_attempts < 1) {
        throw ConfigError("'extraction_max_attempts' must be at least 1");
    }
    if (config.capability_timeout_ms < 0) {
        throw ConfigError("'capability_timeout_ms' must not be negative");
    }
    parse_log_level(config.log_level); // validates
    return config;
}

RuntimeConfig load_runtime_config(const std::string& config_path) {
    namespace fs = std::filesystem;

    if (!fs::exists(config_path)) {
        spdlog::warn("Config file '{}' not found, using defaults", config_path);
        return RuntimeConfig{};
    }

    const std::string ext = fs::path(config_path).extension().string();
    nlohmann::json j;
    if (ext == ".yaml" || ext == ".yml") {
        try {
            j = yaml_to_json(YAML::LoadFile(config_path));
        } catch (const YAML::Exception& e) {
            throw ConfigError("Failed to parse YAML config '" + config_path + "': " + e.what());
        }
    } else {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            throw ConfigError("Cannot open config file: " + config_path);
        }
        try {
            file >> j;
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigError("Failed to parse JSON config '" + config_path + "': " + e.what());
        }
    }

    // 空 YAML 文件解析为 null
    if (j.is_null()) {
        return RuntimeConfig{};
    }
    return parse_runtime_config(j);
}

} // namespace agentflow
