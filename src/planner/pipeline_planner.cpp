// src/planner/pipeline_planner.cpp
#include "agentflow/planner/pipeline_planner.h"
#include "agentflow/common/template_renderer.h"
#include "agentflow/common/utils.h"
#include "agentflow/core/errors.h"
#include "agentflow/memory/memory_provider.h"
#include "agentflow/monitor/monitor_service.h"
#include <spdlog/spdlog.h>
#include <set>

namespace agentflow {

const char* const DEFAULT_PLAN_PROMPT_TEMPLATE = R"(You are the planner of an agent runtime.
{% if mode == "replan" %}
Decide whether the remaining steps still fit the context below.
Answer {"decision": "continue"} or {"decision": "replace", "steps": [...], "reason": "..."}.
{% else %}
Choose the ordered steps that turn the context below into a response.
Answer {"steps": [{"plugin": "...", "action": "..."}]}; an empty list ends the run.
{% endif %}
Available steps:
{% for s in available_steps %}
- {{ s.plugin }}.{{ s.action }}{% if s.description != "" %}: {{ s.description }}{% endif %}

{% endfor %}
{% if length(history) > 0 %}
Recent conversation:
{% for h in history %}
- [{{ h.timestamp }}] {{ h.content }}
{% endfor %}
{% endif %}
Context so far:
{% for item in chain %}
- ({{ item.type }}) {{ item.plugin_id }}.{{ item.action }}: {{ item.content }}
{% endfor %}
{% if mode == "replan" %}
Remaining steps:
{% for s in remaining %}
- {{ s.plugin }}.{{ s.action }}
{% endfor %}
{% endif %}
)";

namespace {

nlohmann::json steps_to_json(const Pipeline& pipeline) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& step : pipeline) {
        arr.push_back({{"plugin", step.plugin_id}, {"action", step.action}});
    }
    return arr;
}

std::string join_steps(const Pipeline& pipeline) {
    std::string out;
    for (const auto& step : pipeline) {
        if (!out.empty()) out += " -> ";
        out += step.to_string();
    }
    return out.empty() ? "(empty)" : out;
}

PipelineStep parse_step(const nlohmann::json& entry) {
    if (entry.is_string()) {
        const auto text = entry.get<std::string>();
        auto dot = text.rfind('.');
        if (dot == std::string::npos || dot == 0 || dot + 1 == text.size()) {
            throw PlanningError("Malformed step reference '" + text + "', expected 'plugin.action'");
        }
        return {text.substr(0, dot), text.substr(dot + 1)};
    }
    if (!entry.is_object()) {
        throw PlanningError("Malformed step entry: " + entry.dump());
    }
    std::string plugin;
    for (const char* key : {"plugin", "plugin_id", "pluginId"}) {
        if (entry.contains(key) && entry[key].is_string()) {
            plugin = entry[key].get<std::string>();
            break;
        }
    }
    std::string action = (entry.contains("action") && entry["action"].is_string())
                             ? entry["action"].get<std::string>()
                             : std::string{};
    if (plugin.empty() || action.empty()) {
        throw PlanningError("Step entry needs 'plugin' and 'action': " + entry.dump());
    }
    return {plugin, action};
}

} // namespace

PipelinePlanner::PipelinePlanner(Config config,
                                 const PluginRegistry& registry,
                                 const CapabilityRouter& router,
                                 MonitorService* monitor,
                                 MemoryProvider* memory)
    : config_(std::move(config)),
      registry_(registry),
      router_(router),
      monitor_(monitor),
      memory_(memory) {}

nlohmann::json PipelinePlanner::load_history(const ContextChain& chain) const {
    nlohmann::json history = nlohmann::json::array();
    if (!memory_ || chain.empty()) {
        return history;
    }

    // user/platform 来自种子条目
    const auto& seed = chain.front();
    std::optional<std::string> user;
    nlohmann::json platform = nlohmann::json::object();
    if (const auto* ext = seed.extension_as<UserInputExtension>()) {
        user = ext->user;
        platform = ext->platform;
    } else if (const auto* ext = seed.extension_as<GenericExtension>()) {
        if (ext->fields.contains("user") && ext->fields["user"].is_string()) {
            user = ext->fields["user"].get<std::string>();
        }
        platform = ext->fields.value("platform", nlohmann::json::object());
    }
    if (!user) {
        return history;
    }
    std::string platform_id = platform.is_object() && platform.contains("name") && platform["name"].is_string()
                                  ? platform["name"].get<std::string>()
                                  : (platform.empty() ? std::string("default") : platform.dump());

    try {
        for (const auto& entry : memory_->get_recent_conversation_history(*user, platform_id, config_.history_limit)) {
            nlohmann::json h = {{"user", entry.user_id},
                                {"platform", entry.platform},
                                {"content", entry.content},
                                {"timestamp", entry.timestamp}};
            if (entry.message_id) h["message_id"] = *entry.message_id;
            history.push_back(std::move(h));
        }
    } catch (const std::exception& e) {
        // 历史只用于提示，不影响控制流
        spdlog::warn("Conversation history unavailable for '{}': {}", *user, e.what());
    }
    return history;
}

nlohmann::json PipelinePlanner::build_input(const std::string& mode,
                                            const ContextChain& chain,
                                            const std::vector<StepDescriptor>& available_steps,
                                            const Pipeline* remaining) const {
    nlohmann::json steps = nlohmann::json::array();
    for (const auto& desc : available_steps) {
        steps.push_back(desc.to_json());
    }

    nlohmann::json input = {
        {"mode", mode},
        {"available_steps", std::move(steps)},
        {"chain", chain.to_json()},
        {"history", load_history(chain)},
        {"remaining", remaining ? steps_to_json(*remaining) : nlohmann::json::array()}
    };

    try {
        input["prompt"] = InjaTemplateRenderer::render(config_.prompt_template, input);
    } catch (const std::exception& e) {
        throw PlanningError(std::string("Failed to render planning prompt: ") + e.what());
    }
    return input;
}

nlohmann::json PipelinePlanner::call_capability(const std::string& capability, const nlohmann::json& input) const {
    nlohmann::json output;
    try {
        output = router_.invoke(capability, input, nlohmann::json::object(), config_.timeout);
    } catch (const Error& e) {
        throw PlanningError(std::string("Planning capability '") + capability + "' failed: " + e.kind() +
                            ": " + e.what());
    }
    auto parsed = coerce_json(output);
    if (!parsed) {
        throw PlanningError("Planning capability '" + capability + "' returned no structured plan");
    }
    return *parsed;
}

Pipeline PipelinePlanner::parse_steps(const nlohmann::json& output,
                                      const std::vector<StepDescriptor>& available_steps) const {
    const nlohmann::json* steps = &output;
    if (output.is_object()) {
        if (!output.contains("steps")) {
            throw PlanningError("Plan is missing a 'steps' array: " + output.dump());
        }
        steps = &output["steps"];
    }
    if (steps->is_null()) {
        return {};
    }
    if (!steps->is_array()) {
        throw PlanningError("Plan 'steps' must be an array: " + steps->dump());
    }

    std::set<std::pair<std::string, std::string>> allowed;
    for (const auto& desc : available_steps) {
        allowed.emplace(desc.plugin_id, desc.action);
    }

    Pipeline pipeline;
    for (const auto& entry : *steps) {
        PipelineStep step = parse_step(entry);
        // 计划接受时校验：必须是可用步骤且仍在注册表中
        if (allowed.count({step.plugin_id, step.action}) == 0 || !registry_.has_step(step)) {
            throw PlanningError("Plan references unknown step: " + step.to_string());
        }
        pipeline.push_back(std::move(step)); // duplicates kept, in order
    }
    return pipeline;
}

Pipeline PipelinePlanner::plan(const ContextChain& chain, const std::vector<StepDescriptor>& available_steps) const {
    if (!router_.has_capability(config_.planning_capability)) {
        throw PlanningError("No planning capability registered: " + config_.planning_capability);
    }
    auto input = build_input("plan", chain, available_steps, nullptr);
    auto output = call_capability(config_.planning_capability, input);
    Pipeline pipeline = parse_steps(output, available_steps);

    spdlog::debug("Planned {} step(s): {}", pipeline.size(), join_steps(pipeline));
    if (monitor_ && !chain.empty()) {
        monitor_->publish("pipeline.planned", chain.front().id, {{"steps", steps_to_json(pipeline)}});
    }
    return pipeline;
}

ReplanDecision PipelinePlanner::should_replan(const ContextChain& chain, const Pipeline& remaining) const {
    if (!config_.replan_enabled || !router_.has_capability(config_.replan_capability)) {
        return ReplanDecision::keep();
    }

    const auto available_steps = registry_.available_steps();
    auto input = build_input("replan", chain, available_steps, &remaining);
    auto output = call_capability(config_.replan_capability, input);

    if (!output.is_object()) {
        throw PlanningError("Replan decision must be an object: " + output.dump());
    }
    const std::string decision = output.value("decision", "continue");
    if (decision == "continue") {
        return ReplanDecision::keep();
    }
    if (decision != "replace") {
        throw PlanningError("Unknown replan decision '" + decision + "'");
    }

    Pipeline steps = parse_steps(output, available_steps);
    std::string reason = output.contains("reason") && output["reason"].is_string()
                             ? output["reason"].get<std::string>()
                             : std::string{};
    return ReplanDecision::replace(std::move(steps), std::move(reason));
}

} // namespace agentflow
