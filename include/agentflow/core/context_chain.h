// agentflow/core/context_chain.h
#ifndef AGENTFLOW_CORE_CONTEXT_CHAIN_H
#define AGENTFLOW_CORE_CONTEXT_CHAIN_H

#include "agentflow/core/types/context_item.h"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace agentflow {

// ContextChain: 单个事件执行期间的只追加记录
// Items are never mutated or removed; an error is one more item.
class ContextChain {
public:
    using const_iterator = std::vector<ContextItem>::const_iterator;

    ContextChain() = default;
    ContextChain(ContextChain&&) = default;
    ContextChain& operator=(ContextChain&&) = default;
    ContextChain(const ContextChain&) = default;
    ContextChain& operator=(const ContextChain&) = default;

    // Throws DuplicateItemId / InvalidContextItem; returns the stored item
    const ContextItem& append(ContextItem item);

    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    const std::vector<ContextItem>& items() const { return items_; }
    const ContextItem& at(size_t index) const { return items_.at(index); }
    const ContextItem& front() const { return items_.front(); }
    const ContextItem& back() const { return items_.back(); }
    const_iterator begin() const { return items_.begin(); }
    const_iterator end() const { return items_.end(); }

    bool contains(std::string_view id) const;
    const ContextItem* find(std::string_view id) const;
    const ContextItem* last_of_type(std::string_view type) const;
    size_t count_of_type(std::string_view type) const;

    // 序列化视图，交给 planning capability
    nlohmann::json to_json() const;

private:
    std::vector<ContextItem> items_;
    std::unordered_map<std::string, size_t> index_; // id -> position
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_CONTEXT_CHAIN_H
