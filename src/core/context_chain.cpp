// src/core/context_chain.cpp
#include "agentflow/core/context_chain.h"
#include "agentflow/core/errors.h"
#include <algorithm>

namespace agentflow {

const ContextItem& ContextChain::append(ContextItem item) {
    validate_extension(item);
    if (index_.count(item.id) > 0) {
        throw DuplicateItemId("Context item id already in chain: " + item.id);
    }
    index_.emplace(item.id, items_.size());
    items_.push_back(std::move(item));
    return items_.back();
}

bool ContextChain::contains(std::string_view id) const {
    return index_.count(std::string(id)) > 0;
}

const ContextItem* ContextChain::find(std::string_view id) const {
    auto it = index_.find(std::string(id));
    if (it == index_.end()) {
        return nullptr;
    }
    return &items_[it->second];
}

const ContextItem* ContextChain::last_of_type(std::string_view type) const {
    auto it = std::find_if(items_.rbegin(), items_.rend(),
                           [type](const ContextItem& item) { return item.type == type; });
    return it == items_.rend() ? nullptr : &*it;
}

size_t ContextChain::count_of_type(std::string_view type) const {
    return static_cast<size_t>(std::count_if(items_.begin(), items_.end(),
                                             [type](const ContextItem& item) { return item.type == type; }));
}

nlohmann::json ContextChain::to_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& item : items_) {
        arr.push_back(agentflow::to_json(item));
    }
    return arr;
}

} // namespace agentflow
