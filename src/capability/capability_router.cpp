// src/capability/capability_router.cpp
#include "agentflow/capability/capability_router.h"
#include "agentflow/core/errors.h"
#include "agentflow/monitor/monitor_service.h"
#include <spdlog/spdlog.h>
#include <future>
#include <thread>

namespace agentflow {

CapabilityRouter::CapabilityRouter(MonitorService* monitor) : monitor_(monitor) {}

std::optional<std::string> CapabilityRouter::lookup_id(const std::string& id_or_alias) const {
    if (capabilities_.count(id_or_alias) > 0) {
        return id_or_alias;
    }
    auto it = aliases_.find(id_or_alias);
    if (it != aliases_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void CapabilityRouter::register_capability(Capability capability) {
    if (capability.id.empty()) {
        throw CapabilityConflict("Capability id must not be empty");
    }
    if (!capability.handler) {
        throw CapabilityConflict("Capability '" + capability.id + "' has no handler");
    }

    // 检查 id 与所有别名，全部通过后再写入
    if (auto existing = lookup_id(capability.id)) {
        throw CapabilityConflict("Capability id '" + capability.id +
                                 "' already maps to capability '" + *existing + "'");
    }
    for (const auto& alias : capability.aliases) {
        if (alias == capability.id) continue;
        if (auto existing = lookup_id(alias)) {
            throw CapabilityConflict("Alias '" + alias + "' of capability '" + capability.id +
                                     "' already maps to capability '" + *existing + "'");
        }
    }

    const std::string id = capability.id;
    for (const auto& alias : capability.aliases) {
        if (alias != id) {
            aliases_[alias] = id;
        }
    }
    spdlog::debug("Registered capability '{}' ({} alias(es))", id, capability.aliases.size());
    order_.push_back(id);
    capabilities_[id] = std::make_shared<const Capability>(std::move(capability));

    if (monitor_) {
        monitor_->publish("capability.registered", "", {{"capability", id}});
    }
}

const Capability& CapabilityRouter::resolve(const std::string& id_or_alias) const {
    auto id = lookup_id(id_or_alias);
    if (!id) {
        throw UnknownCapability("Unknown capability: " + id_or_alias);
    }
    return *capabilities_.at(*id);
}

bool CapabilityRouter::has_capability(const std::string& id_or_alias) const {
    return lookup_id(id_or_alias).has_value();
}

std::string CapabilityRouter::canonical_id(const std::string& id_or_alias) const {
    return resolve(id_or_alias).id;
}

std::vector<std::string> CapabilityRouter::list_capabilities() const {
    return order_;
}

nlohmann::json CapabilityRouter::describe() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& id : order_) {
        const auto& cap = capabilities_.at(id);
        arr.push_back({{"id", cap->id},
                       {"aliases", cap->aliases},
                       {"description", cap->description},
                       {"provider", cap->provider}});
    }
    return arr;
}

nlohmann::json CapabilityRouter::invoke(const std::string& id_or_alias,
                                        const nlohmann::json& input,
                                        const nlohmann::json& config,
                                        std::optional<std::chrono::milliseconds> timeout) const {
    auto id = lookup_id(id_or_alias);
    if (!id) {
        throw UnknownCapability("Unknown capability: " + id_or_alias);
    }
    std::shared_ptr<const Capability> capability = capabilities_.at(*id);
    const auto effective_timeout = timeout.value_or(default_timeout_);

    auto call = [capability, input, config]() -> nlohmann::json {
        try {
            return capability->handler(input, config);
        } catch (const CapabilityError&) {
            throw;
        } catch (const std::exception& e) {
            throw CapabilityError("Capability '" + capability->id + "' failed: " + e.what());
        }
    };

    if (effective_timeout.count() <= 0) {
        return call();
    }

    // 超时后 handler 继续在分离线程中运行，结果被丢弃
    auto task = std::make_shared<std::packaged_task<nlohmann::json()>>(std::move(call));
    auto future = task->get_future();
    std::thread([task]() { (*task)(); }).detach();

    if (future.wait_for(effective_timeout) == std::future_status::timeout) {
        spdlog::warn("Capability '{}' timed out after {} ms", *id, effective_timeout.count());
        if (monitor_) {
            monitor_->publish("capability.timeout", "",
                              {{"capability", *id}, {"timeout_ms", effective_timeout.count()}});
        }
        throw CapabilityTimeout("Capability '" + *id + "' timed out after " +
                                std::to_string(effective_timeout.count()) + " ms");
    }
    return future.get();
}

} // namespace agentflow
