// src/core/event.cpp
#include "agentflow/core/types/event.h"
#include "agentflow/core/errors.h"
#include <vector>

namespace agentflow {

void validate_event(const Event& event) {
    std::vector<std::string> missing;
    if (event.id.empty()) missing.push_back("id");
    if (event.plugin_id.empty()) missing.push_back("pluginId");
    if (event.action.empty()) missing.push_back("action");
    if (event.type.empty()) missing.push_back("type");
    if (event.timestamp <= 0) missing.push_back("timestamp");

    if (!missing.empty()) {
        std::string fields;
        for (size_t i = 0; i < missing.size(); ++i) {
            if (i > 0) fields += ", ";
            fields += missing[i];
        }
        throw InvalidEvent("Event '" + event.id + "' is missing required field(s): " + fields);
    }
    if (event.type == item_types::ERROR || event.type == item_types::CAPABILITY_RESULT) {
        throw InvalidEvent("Event '" + event.id + "' uses reserved type tag '" + event.type + "'");
    }
    if (event.platform.has_value() && !event.platform->is_object()) {
        throw InvalidEvent("Event '" + event.id + "' platform metadata must be an object");
    }
}

std::string platform_name(const Event& event) {
    if (!event.platform.has_value() || event.platform->empty()) {
        return "default";
    }
    const auto& platform = *event.platform;
    if (platform.contains("name") && platform["name"].is_string()) {
        return platform["name"].get<std::string>();
    }
    return platform.dump();
}

std::string conversation_key(const Event& event) {
    if (!event.user.has_value() || event.user->empty()) {
        return "event:" + event.id; // 合成 key：无用户时每个事件独立
    }
    return *event.user + ":" + platform_name(event);
}

ContextItem make_seed_item(const Event& event) {
    ContextItem seed;
    seed.id = event.id;
    seed.plugin_id = event.plugin_id;
    seed.action = event.action;
    seed.type = event.type;
    seed.content = event.content;
    seed.timestamp = event.timestamp;

    if (event.type == item_types::USER_INPUT) {
        UserInputExtension ext;
        ext.user = event.user;
        ext.platform = event.platform.value_or(Value::object());
        seed.extension = std::move(ext);
    } else if (event.user.has_value() || event.platform.has_value()) {
        GenericExtension ext;
        if (event.user) ext.fields["user"] = *event.user;
        if (event.platform) ext.fields["platform"] = *event.platform;
        seed.extension = std::move(ext);
    }
    return seed;
}

} // namespace agentflow
