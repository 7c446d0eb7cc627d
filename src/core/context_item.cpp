// src/core/context_item.cpp
#include "agentflow/core/types/context_item.h"
#include "agentflow/core/errors.h"

namespace agentflow {

namespace {

template <typename... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

void validate_extension(const ContextItem& item) {
    if (item.id.empty()) {
        throw InvalidContextItem("Context item has no id");
    }
    if (item.type.empty()) {
        throw InvalidContextItem("Context item '" + item.id + "' has no type tag");
    }

    bool ok = true;
    if (item.type == item_types::USER_INPUT) {
        ok = std::holds_alternative<UserInputExtension>(item.extension);
    } else if (item.type == item_types::ERROR) {
        const auto* err = item.extension_as<ErrorExtension>();
        ok = err != nullptr && !err->error_kind.empty();
    } else if (item.type == item_types::CAPABILITY_RESULT) {
        const auto* cap = item.extension_as<CapabilityExtension>();
        ok = cap != nullptr && !cap->capability.empty();
    } else {
        // 非保留标签不能冒用保留负载
        ok = std::holds_alternative<std::monostate>(item.extension) ||
             std::holds_alternative<GenericExtension>(item.extension);
    }

    if (!ok) {
        throw InvalidContextItem("Extension payload does not match type tag '" + item.type +
                                 "' for item '" + item.id + "'");
    }
}

Value extension_to_json(const ItemExtension& ext) {
    return std::visit(overloaded{
        [](const std::monostate&) -> Value { return Value::object(); },
        [](const UserInputExtension& e) -> Value {
            Value j = {{"platform", e.platform}};
            j["user"] = e.user ? Value(*e.user) : Value(nullptr);
            return j;
        },
        [](const ErrorExtension& e) -> Value {
            return {{"error_kind", e.error_kind},
                    {"step_plugin", e.step_plugin},
                    {"step_action", e.step_action},
                    {"detail", e.detail}};
        },
        [](const CapabilityExtension& e) -> Value {
            return {{"capability", e.capability}, {"attempts", e.attempts}};
        },
        [](const GenericExtension& e) -> Value { return e.fields; }
    }, ext);
}

Value to_json(const ContextItem& item) {
    return {
        {"id", item.id},
        {"plugin_id", item.plugin_id},
        {"action", item.action},
        {"type", item.type},
        {"content", item.content},
        {"timestamp", item.timestamp},
        {"extension", extension_to_json(item.extension)}
    };
}

ContextItem make_error_item(std::string id,
                            std::string error_kind,
                            std::string step_plugin,
                            std::string step_action,
                            std::string detail) {
    ContextItem item;
    item.id = std::move(id);
    item.plugin_id = step_plugin;
    item.action = step_action;
    item.type = item_types::ERROR;
    item.content = detail;
    item.extension = ErrorExtension{std::move(error_kind), std::move(step_plugin),
                                    std::move(step_action), std::move(detail)};
    return item;
}

} // namespace agentflow
