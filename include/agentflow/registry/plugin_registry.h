// agentflow/registry/plugin_registry.h
#ifndef AGENTFLOW_REGISTRY_PLUGIN_REGISTRY_H
#define AGENTFLOW_REGISTRY_PLUGIN_REGISTRY_H

#include "agentflow/registry/plugin.h"
#include <string>
#include <unordered_map>
#include <vector>

namespace agentflow {

class MonitorService;

// (plugin, action) -> handler 注册表；初始化完成后只读
class PluginRegistry {
public:
    explicit PluginRegistry(MonitorService* monitor = nullptr);

    // Throws DuplicateRegistration, or RegistryClosed once initialization started
    void register_plugin(Plugin plugin);

    // Throws UnknownStep
    const PluginAction& lookup(const std::string& plugin_id, const std::string& action) const;
    const PluginAction& lookup(const PipelineStep& step) const;

    bool has_step(const PipelineStep& step) const;
    bool has_plugin(const std::string& plugin_id) const;

    std::vector<std::string> plugin_ids() const { return order_; }
    std::vector<StepDescriptor> available_steps() const;
    std::vector<CapabilityDeclaration> list_capability_providers() const;

    // Phase 2 of startup: declared capabilities, then init hooks, in registration order
    void initialize(CapabilityRouter& router);
    bool initialized() const { return initialized_; }

private:
    MonitorService* monitor_;
    std::vector<std::string> order_; // 注册顺序即初始化顺序
    std::unordered_map<std::string, Plugin> plugins_;
    bool initializing_ = false;
    bool initialized_ = false;
};

} // namespace agentflow

#endif // AGENTFLOW_REGISTRY_PLUGIN_REGISTRY_H
