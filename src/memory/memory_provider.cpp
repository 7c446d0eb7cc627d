// src/memory/memory_provider.cpp
#include "agentflow/memory/memory_provider.h"
#include <algorithm>

namespace agentflow {

void InMemoryMemoryProvider::store_user_interaction(const std::string& user_id,
                                                    const std::string& platform,
                                                    const std::string& content,
                                                    Timestamp timestamp,
                                                    std::optional<std::string> message_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entries = history_[user_id + ":" + platform];
    Interaction interaction{user_id, platform, content, timestamp, std::move(message_id)};
    // 按时间戳保持有序
    auto pos = std::upper_bound(entries.begin(), entries.end(), timestamp,
                                [](Timestamp ts, const Interaction& i) { return ts < i.timestamp; });
    entries.insert(pos, std::move(interaction));
}

std::vector<Interaction> InMemoryMemoryProvider::get_recent_conversation_history(const std::string& user_id,
                                                                                 const std::string& platform,
                                                                                 std::optional<size_t> limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = history_.find(user_id + ":" + platform);
    if (it == history_.end()) {
        return {};
    }
    const auto& entries = it->second;
    size_t count = limit ? std::min(*limit, entries.size()) : entries.size();
    return std::vector<Interaction>(entries.end() - static_cast<std::ptrdiff_t>(count), entries.end());
}

} // namespace agentflow
