// src/registry/plugin_registry.cpp
#include "agentflow/registry/plugin_registry.h"
#include "agentflow/core/errors.h"
#include "agentflow/monitor/monitor_service.h"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace agentflow {

nlohmann::json StepDescriptor::to_json() const {
    return {
        {"plugin", plugin_id},
        {"action", action},
        {"description", description},
        {"reads", reads},
        {"appends", appends},
        {"effects", effects}
    };
}

PluginRegistry::PluginRegistry(MonitorService* monitor) : monitor_(monitor) {}

void PluginRegistry::register_plugin(Plugin plugin) {
    if (initializing_ || initialized_) {
        throw RegistryClosed("Cannot register plugin '" + plugin.id + "' after initialization started");
    }
    if (plugin.id.empty()) {
        throw DuplicateRegistration("Plugin id must not be empty");
    }
    if (plugins_.count(plugin.id) > 0) {
        throw DuplicateRegistration("Plugin already registered: " + plugin.id);
    }
    for (const auto& [name, action] : plugin.actions) {
        if (!action.handler) {
            throw DuplicateRegistration("Plugin '" + plugin.id + "' action '" + name + "' has no handler");
        }
    }

    spdlog::debug("Registered plugin '{}' with {} action(s)", plugin.id, plugin.actions.size());
    order_.push_back(plugin.id);
    plugins_.emplace(plugin.id, std::move(plugin));
}

const PluginAction& PluginRegistry::lookup(const std::string& plugin_id, const std::string& action) const {
    auto plugin_it = plugins_.find(plugin_id);
    if (plugin_it == plugins_.end()) {
        throw UnknownStep("Unknown plugin: " + plugin_id + " (step " + plugin_id + "." + action + ")");
    }
    auto action_it = plugin_it->second.actions.find(action);
    if (action_it == plugin_it->second.actions.end()) {
        throw UnknownStep("Unknown action '" + action + "' on plugin '" + plugin_id + "'");
    }
    return action_it->second;
}

const PluginAction& PluginRegistry::lookup(const PipelineStep& step) const {
    return lookup(step.plugin_id, step.action);
}

bool PluginRegistry::has_step(const PipelineStep& step) const {
    auto it = plugins_.find(step.plugin_id);
    return it != plugins_.end() && it->second.actions.count(step.action) > 0;
}

bool PluginRegistry::has_plugin(const std::string& plugin_id) const {
    return plugins_.count(plugin_id) > 0;
}

std::vector<StepDescriptor> PluginRegistry::available_steps() const {
    std::vector<StepDescriptor> steps;
    for (const auto& id : order_) {
        const auto& plugin = plugins_.at(id);
        // 插件内按 action 名排序，保证描述稳定
        std::vector<std::string> names;
        names.reserve(plugin.actions.size());
        for (const auto& [name, _] : plugin.actions) {
            names.push_back(name);
        }
        std::sort(names.begin(), names.end());

        for (const auto& name : names) {
            const auto& action = plugin.actions.at(name);
            steps.push_back({id, name, action.description, action.reads, action.appends, action.effects});
        }
    }
    return steps;
}

std::vector<CapabilityDeclaration> PluginRegistry::list_capability_providers() const {
    std::vector<CapabilityDeclaration> decls;
    for (const auto& id : order_) {
        for (const auto& cap : plugins_.at(id).capabilities) {
            decls.push_back({id, cap.id, cap.aliases});
        }
    }
    return decls;
}

void PluginRegistry::initialize(CapabilityRouter& router) {
    if (initialized_ || initializing_) {
        throw RegistryClosed("Plugin registry already initialized");
    }
    initializing_ = true;

    // 1. 声明的 capability 先全部注册
    for (const auto& id : order_) {
        for (const auto& cap : plugins_.at(id).capabilities) {
            Capability registered = cap;
            if (registered.provider.empty()) {
                registered.provider = id;
            }
            router.register_capability(std::move(registered));
        }
    }

    // 2. init hooks see a fully populated registry and router
    PluginInitContext init_ctx{*this, router};
    for (const auto& id : order_) {
        auto& plugin = plugins_.at(id);
        if (plugin.init) {
            spdlog::debug("Initializing plugin '{}'", id);
            plugin.init(init_ctx);
        }
    }

    for (const auto& id : order_) {
        for (const auto& required : plugins_.at(id).required_capabilities) {
            if (!router.has_capability(required)) {
                throw UnknownCapability("Plugin '" + id + "' requires unknown capability: " + required);
            }
        }
    }

    initializing_ = false;
    initialized_ = true;
    spdlog::info("Plugin registry initialized: {} plugin(s), {} capability(ies)",
                 order_.size(), router.list_capabilities().size());
    if (monitor_) {
        monitor_->publish("registry.initialized", "", {{"plugins", order_}});
    }
}

} // namespace agentflow
