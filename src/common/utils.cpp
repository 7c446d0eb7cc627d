// src/common/utils.cpp
#include "agentflow/common/utils.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <random>
#include <regex>
#include <sstream>

namespace agentflow {

std::string generate_id(std::string_view prefix) {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    static std::atomic<uint32_t> counter{0};

    // 随机数 + 进程内计数器，避免同一毫秒内碰撞
    uint64_t value = rng() ^ (static_cast<uint64_t>(counter.fetch_add(1)) << 40);
    std::ostringstream oss;
    oss << prefix << '-' << std::hex << std::setw(16) << std::setfill('0') << value;
    return oss.str();
}

Timestamp now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

namespace {

std::optional<nlohmann::json> try_parse(const std::string& text) {
    auto parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }
    return parsed;
}

// Scan for the first balanced object/array, honoring string literals
std::optional<std::string> first_balanced_block(const std::string& text) {
    size_t start = text.find_first_of("{[");
    while (start != std::string::npos) {
        char open = text[start];
        char close = (open == '{') ? '}' : ']';
        int depth = 0;
        bool in_string = false;
        bool escaped = false;
        for (size_t i = start; i < text.size(); ++i) {
            char c = text[i];
            if (in_string) {
                if (escaped) escaped = false;
                else if (c == '\\') escaped = true;
                else if (c == '"') in_string = false;
                continue;
            }
            if (c == '"') in_string = true;
            else if (c == open) ++depth;
            else if (c == close && --depth == 0) {
                return text.substr(start, i - start + 1);
            }
        }
        start = text.find_first_of("{[", start + 1);
    }
    return std::nullopt;
}

} // namespace

std::optional<nlohmann::json> extract_json(const std::string& text) {
    if (auto direct = try_parse(text)) {
        return direct;
    }

    static const std::regex fenced(R"(```(?:json)?\s*\n([\s\S]*?)\n?```)", std::regex::ECMAScript);
    std::smatch match;
    if (std::regex_search(text, match, fenced)) {
        if (auto inner = try_parse(match[1].str())) {
            return inner;
        }
    }

    if (auto block = first_balanced_block(text)) {
        return try_parse(*block);
    }
    return std::nullopt;
}

std::optional<nlohmann::json> coerce_json(const nlohmann::json& value) {
    if (value.is_string()) {
        return extract_json(value.get<std::string>());
    }
    if (value.is_null() || value.is_discarded()) {
        return std::nullopt;
    }
    return value;
}

} // namespace agentflow
