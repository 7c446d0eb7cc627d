// agentflow/common/logging.h
#ifndef AGENTFLOW_COMMON_LOGGING_H
#define AGENTFLOW_COMMON_LOGGING_H

#include <spdlog/spdlog.h>
#include <string>

namespace agentflow {

// Initialize logging with console output (idempotent)
void init_logger(spdlog::level::level_enum level = spdlog::level::info);

void set_log_level(spdlog::level::level_enum level);

// "trace", "debug", "info", "warn", "error", "critical", "off"
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace agentflow

#endif // AGENTFLOW_COMMON_LOGGING_H
