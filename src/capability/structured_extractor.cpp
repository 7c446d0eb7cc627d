// src/capability/structured_extractor.cpp
#include "agentflow/capability/structured_extractor.h"
#include "agentflow/common/utils.h"
#include "agentflow/core/errors.h"
#include "agentflow/monitor/monitor_service.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace agentflow {

std::string retry_instruction(const std::string& base_instruction,
                              int attempt,
                              const std::optional<std::string>& last_error) {
    if (attempt <= 1 || !last_error.has_value()) {
        return base_instruction;
    }
    return base_instruction +
           "\n\nAttempt " + std::to_string(attempt - 1) + " was rejected: " + *last_error +
           "\nRespond with a single JSON object that satisfies the schema exactly.";
}

StructuredExtractor::StructuredExtractor(const CapabilityRouter& router,
                                         MonitorService* monitor,
                                         int default_max_attempts)
    : router_(router),
      monitor_(monitor),
      default_max_attempts_(default_max_attempts > 0 ? default_max_attempts : DEFAULT_MAX_ATTEMPTS) {}

ExtractionResult StructuredExtractor::extract(const std::string& capability,
                                              const Schema& schema,
                                              const std::string& instruction,
                                              const nlohmann::json& config,
                                              std::optional<int> max_attempts,
                                              std::optional<std::chrono::milliseconds> timeout) const {
    const int limit = max_attempts.value_or(default_max_attempts_);
    if (limit < 1) {
        throw std::invalid_argument("max_attempts must be at least 1");
    }
    // 未注册的 capability 不重试
    const std::string id = router_.canonical_id(capability);
    const nlohmann::json schema_description = schema.describe();

    std::optional<std::string> last_error;
    for (int attempt = 1; attempt <= limit; ++attempt) {
        if (attempt > 1) {
            spdlog::debug("Structured extraction via '{}' retry {} of {}: {}", id, attempt, limit, *last_error);
            if (monitor_) {
                monitor_->publish("extraction.retry", "",
                                  {{"capability", id}, {"attempt", attempt}, {"error", *last_error}});
            }
        }

        nlohmann::json input = {
            {"instruction", retry_instruction(instruction, attempt, last_error)},
            {"schema", schema_description},
            {"attempt", attempt}
        };

        nlohmann::json raw;
        try {
            raw = router_.invoke(id, input, config, timeout);
        } catch (const CapabilityError& e) {
            last_error = e.what();
            continue;
        }

        auto parsed = coerce_json(raw);
        if (!parsed) {
            last_error = "response is not valid JSON";
            continue;
        }
        if (auto error = schema.validate(*parsed)) {
            last_error = error->to_string();
            continue;
        }
        return ExtractionResult{std::move(*parsed), attempt};
    }

    spdlog::warn("Structured extraction via '{}' failed after {} attempt(s): {}", id, limit, *last_error);
    throw ExtractionFailed("Structured extraction via '" + id + "' failed after " +
                               std::to_string(limit) + " attempt(s): " + *last_error,
                           limit, *last_error);
}

} // namespace agentflow
