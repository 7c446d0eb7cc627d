// agentflow/core/types/event.h
#ifndef AGENTFLOW_CORE_TYPES_EVENT_H
#define AGENTFLOW_CORE_TYPES_EVENT_H

#include "agentflow/core/types/context_item.h"
#include "agentflow/core/types/run_outcome.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>

namespace agentflow {

// Invoked exactly once per run, success or failure
using ResponseHandler = std::function<void(const RunOutcome&)>;

// Producer-supplied payload (user message, timer, adapter)
struct Event {
    std::string id;
    std::string plugin_id;
    std::string action;
    std::string type;
    std::string content;
    Timestamp timestamp = 0;
    std::optional<std::string> user;
    std::optional<nlohmann::json> platform;
    ResponseHandler response_handler;
};

// 缺少必填字段时抛出 InvalidEvent
void validate_event(const Event& event);

// user + platform，缺省时使用合成 key
std::string conversation_key(const Event& event);

std::string platform_name(const Event& event);

// Seed item for a fresh chain
ContextItem make_seed_item(const Event& event);

} // namespace agentflow

#endif // AGENTFLOW_CORE_TYPES_EVENT_H
