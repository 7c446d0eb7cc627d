// agentflow/registry/plugin.h
#ifndef AGENTFLOW_REGISTRY_PLUGIN_H
#define AGENTFLOW_REGISTRY_PLUGIN_H

#include "agentflow/capability/capability_router.h"
#include "agentflow/core/context_chain.h"
#include "agentflow/core/types/event.h"
#include "agentflow/core/types/pipeline.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace agentflow {

class PluginRegistry;
class StructuredExtractor;
class MemoryProvider;

// What a handler may reach while it runs
struct ActionContext {
    const Event& event;
    const PipelineStep& step;
    const CapabilityRouter& capabilities;
    const StructuredExtractor* extractor = nullptr;
    MemoryProvider* memory = nullptr;
};

struct ActionResult {
    bool success = true;
    std::vector<ContextItem> items; // appended by the executor in order
    std::string error;

    static ActionResult ok(std::vector<ContextItem> items = {}) {
        return ActionResult{true, std::move(items), {}};
    }
    static ActionResult failure(std::string error) {
        return ActionResult{false, {}, std::move(error)};
    }
};

// 读取当前链，返回新条目或失败；抛异常等同于失败
using ActionHandler = std::function<ActionResult(const ContextChain& chain, ActionContext& ctx)>;

struct PluginAction {
    ActionHandler handler;
    std::string description;
    std::vector<std::string> reads;   // item types consumed
    std::vector<std::string> appends; // item types produced
    std::vector<std::string> effects; // declared side effects, e.g. "send_message"
};

struct PluginInitContext {
    PluginRegistry& registry;
    CapabilityRouter& capabilities;
};

using PluginInitHook = std::function<void(PluginInitContext&)>;

struct Plugin {
    std::string id;
    std::unordered_map<std::string, PluginAction> actions;
    std::vector<std::string> required_capabilities;
    std::vector<Capability> capabilities; // registered with the router in phase 2
    PluginInitHook init;

    template <typename Func>
    Plugin& add_action(std::string name, Func&& func, std::string description = {}) {
        PluginAction action;
        action.handler = std::forward<Func>(func);
        action.description = std::move(description);
        actions[std::move(name)] = std::move(action);
        return *this;
    }
};

// Planner-facing description of one registered (plugin, action)
struct StepDescriptor {
    std::string plugin_id;
    std::string action;
    std::string description;
    std::vector<std::string> reads;
    std::vector<std::string> appends;
    std::vector<std::string> effects;

    PipelineStep step() const { return {plugin_id, action}; }
    nlohmann::json to_json() const;
};

struct CapabilityDeclaration {
    std::string plugin_id;
    std::string capability_id;
    std::vector<std::string> aliases;
};

} // namespace agentflow

#endif // AGENTFLOW_REGISTRY_PLUGIN_H
