// agentflow/capability/structured_extractor.h
#ifndef AGENTFLOW_CAPABILITY_STRUCTURED_EXTRACTOR_H
#define AGENTFLOW_CAPABILITY_STRUCTURED_EXTRACTOR_H

#include "agentflow/capability/capability_router.h"
#include "agentflow/capability/schema.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace agentflow {

class MonitorService;

struct ExtractionResult {
    nlohmann::json value;
    int attempts = 0;
};

// 下一次尝试的指令：只依赖 (尝试次数, 上次错误)
std::string retry_instruction(const std::string& base_instruction,
                              int attempt,
                              const std::optional<std::string>& last_error);

// Schema-validated extraction with bounded retry over a capability
class StructuredExtractor {
public:
    static constexpr int DEFAULT_MAX_ATTEMPTS = 3;

    StructuredExtractor(const CapabilityRouter& router,
                        MonitorService* monitor = nullptr,
                        int default_max_attempts = DEFAULT_MAX_ATTEMPTS);

    // Throws ExtractionFailed after the last attempt; UnknownCapability is not retried
    ExtractionResult extract(const std::string& capability,
                             const Schema& schema,
                             const std::string& instruction,
                             const nlohmann::json& config = nlohmann::json::object(),
                             std::optional<int> max_attempts = std::nullopt,
                             std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    int default_max_attempts() const { return default_max_attempts_; }

private:
    const CapabilityRouter& router_;
    MonitorService* monitor_;
    int default_max_attempts_;
};

} // namespace agentflow

#endif // AGENTFLOW_CAPABILITY_STRUCTURED_EXTRACTOR_H
