// src/common/logging.cpp
#include "agentflow/common/logging.h"
#include "agentflow/core/errors.h"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace agentflow {

void init_logger(spdlog::level::level_enum level) {
    auto console = spdlog::get("agentflow");
    if (!console) {
        console = spdlog::stdout_color_mt("agentflow");
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str 对未知名称返回 off
    if (level == spdlog::level::off && name != "off") {
        throw ConfigError("Unknown log level: '" + name + "'");
    }
    return level;
}

} // namespace agentflow
