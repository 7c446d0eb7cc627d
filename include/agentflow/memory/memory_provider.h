// agentflow/memory/memory_provider.h
#ifndef AGENTFLOW_MEMORY_MEMORY_PROVIDER_H
#define AGENTFLOW_MEMORY_MEMORY_PROVIDER_H

#include "agentflow/core/types/context_item.h"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentflow {

struct Interaction {
    std::string user_id;
    std::string platform;
    std::string content;
    Timestamp timestamp = 0;
    std::optional<std::string> message_id;
};

// Collaborator-implemented; the core only reads history to seed the planner
class MemoryProvider {
public:
    virtual ~MemoryProvider() = default;

    virtual void store_user_interaction(const std::string& user_id,
                                        const std::string& platform,
                                        const std::string& content,
                                        Timestamp timestamp,
                                        std::optional<std::string> message_id = std::nullopt) = 0;

    // Oldest first, at most `limit` entries
    virtual std::vector<Interaction> get_recent_conversation_history(const std::string& user_id,
                                                                     const std::string& platform,
                                                                     std::optional<size_t> limit = std::nullopt) = 0;
};

// 进程内实现，用于测试和示例
class InMemoryMemoryProvider : public MemoryProvider {
public:
    void store_user_interaction(const std::string& user_id,
                                const std::string& platform,
                                const std::string& content,
                                Timestamp timestamp,
                                std::optional<std::string> message_id = std::nullopt) override;

    std::vector<Interaction> get_recent_conversation_history(const std::string& user_id,
                                                             const std::string& platform,
                                                             std::optional<size_t> limit = std::nullopt) override;

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Interaction>> history_; // "user:platform" -> ordered
};

} // namespace agentflow

#endif // AGENTFLOW_MEMORY_MEMORY_PROVIDER_H
