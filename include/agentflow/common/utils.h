// agentflow/common/utils.h
#ifndef AGENTFLOW_COMMON_UTILS_H
#define AGENTFLOW_COMMON_UTILS_H

#include "agentflow/core/types/context_item.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace agentflow {

// e.g. "item-3f9a0c1b7e2d4a65"
std::string generate_id(std::string_view prefix);

Timestamp now_millis();

// 从模型输出中提取 JSON：```json 代码块、整段文本或第一个平衡的 {...} / [...]
std::optional<nlohmann::json> extract_json(const std::string& text);

// Accepts a json value or a string holding json
std::optional<nlohmann::json> coerce_json(const nlohmann::json& value);

} // namespace agentflow

#endif // AGENTFLOW_COMMON_UTILS_H
