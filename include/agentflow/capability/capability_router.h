// agentflow/capability/capability_router.h
#ifndef AGENTFLOW_CAPABILITY_CAPABILITY_ROUTER_H
#define AGENTFLOW_CAPABILITY_CAPABILITY_ROUTER_H

#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentflow {

class MonitorService;

// (input, config) -> output; throws on failure
using CapabilityHandler = std::function<nlohmann::json(const nlohmann::json& input, const nlohmann::json& config)>;

struct Capability {
    std::string id;
    std::vector<std::string> aliases;
    CapabilityHandler handler;
    std::string description;
    std::string provider; // owning plugin / model provider, informational
};

// CapabilityRouter: 将 capability id 或别名解析为唯一的 handler
// Registration happens during startup only; afterwards the router is read
// concurrently by every worker without locking.
class CapabilityRouter {
public:
    explicit CapabilityRouter(MonitorService* monitor = nullptr);

    // Throws CapabilityConflict if the id or an alias already maps elsewhere
    void register_capability(Capability capability);

    // Pure lookup; throws UnknownCapability
    const Capability& resolve(const std::string& id_or_alias) const;
    bool has_capability(const std::string& id_or_alias) const;
    std::string canonical_id(const std::string& id_or_alias) const;

    std::vector<std::string> list_capabilities() const;
    nlohmann::json describe() const;

    // No retry. Handler failure -> CapabilityError, timeout -> CapabilityTimeout.
    // An unset timeout uses the default (zero means wait indefinitely).
    nlohmann::json invoke(const std::string& id_or_alias,
                          const nlohmann::json& input,
                          const nlohmann::json& config = nlohmann::json::object(),
                          std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    void set_default_timeout(std::chrono::milliseconds timeout) { default_timeout_ = timeout; }
    std::chrono::milliseconds default_timeout() const { return default_timeout_; }

private:
    MonitorService* monitor_;
    std::chrono::milliseconds default_timeout_{0};
    std::vector<std::string> order_; // 注册顺序
    std::unordered_map<std::string, std::shared_ptr<const Capability>> capabilities_;
    std::unordered_map<std::string, std::string> aliases_; // alias -> id

    std::optional<std::string> lookup_id(const std::string& id_or_alias) const;
};

} // namespace agentflow

#endif // AGENTFLOW_CAPABILITY_CAPABILITY_ROUTER_H
