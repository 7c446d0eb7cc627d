// agentflow/core/types/context_item.h
#ifndef AGENTFLOW_CORE_TYPES_CONTEXT_ITEM_H
#define AGENTFLOW_CORE_TYPES_CONTEXT_ITEM_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace agentflow {

using Value = nlohmann::json;
using Timestamp = std::int64_t; // 毫秒 (ms since epoch)

// 保留的类型标签，每个标签对应一种扩展负载
namespace item_types {
inline constexpr const char* USER_INPUT = "user_input";
inline constexpr const char* ERROR = "error";
inline constexpr const char* CAPABILITY_RESULT = "capability_result";
} // namespace item_types

// type == "user_input"
struct UserInputExtension {
    std::optional<std::string> user;
    Value platform = Value::object();
};

// type == "error": the failed step and why
struct ErrorExtension {
    std::string error_kind; // e.g. "UnknownStep", "PlanningError", "HandlerFailed"
    std::string step_plugin;
    std::string step_action;
    std::string detail;
};

// type == "capability_result"
struct CapabilityExtension {
    std::string capability;
    int attempts = 1;
};

// Any other tag may carry free-form typed fields
struct GenericExtension {
    Value fields = Value::object();
};

using ItemExtension = std::variant<std::monostate,
                                   UserInputExtension,
                                   ErrorExtension,
                                   CapabilityExtension,
                                   GenericExtension>;

// One immutable fact in a context chain
struct ContextItem {
    std::string id;
    std::string plugin_id;
    std::string action;
    std::string type;
    std::string content;
    Timestamp timestamp = 0;
    ItemExtension extension;

    template <typename T>
    const T* extension_as() const { return std::get_if<T>(&extension); }

    bool is_error() const { return type == item_types::ERROR; }
};

// 检查保留标签与扩展类型是否匹配，失败抛出 InvalidContextItem
void validate_extension(const ContextItem& item);

Value extension_to_json(const ItemExtension& ext);
Value to_json(const ContextItem& item);

ContextItem make_error_item(std::string id,
                            std::string error_kind,
                            std::string step_plugin,
                            std::string step_action,
                            std::string detail);

} // namespace agentflow

#endif // AGENTFLOW_CORE_TYPES_CONTEXT_ITEM_H
