#pragma once

// Internal container, not installed.

#include <algorithm>
#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace libbeans::internal {

/// Set of bean names that remembers insertion order.  Not synchronized;
/// owners guard it with their own mutex.
class linked_name_set {
public:
    /// Returns false if the name was already present.
    bool insert(const std::string& name) {
        if (!index_.insert(name).second) return false;
        order_.push_back(name);
        return true;
    }

    bool erase(const std::string& name) {
        if (index_.erase(name) == 0) return false;
        order_.erase(std::find(order_.begin(), order_.end(), name));
        return true;
    }

    bool contains(const std::string& name) const {
        return index_.contains(name);
    }

    bool empty() const noexcept { return order_.empty(); }
    std::size_t size() const noexcept { return order_.size(); }

    const std::vector<std::string>& items() const noexcept { return order_; }

    auto begin() const noexcept { return order_.begin(); }
    auto end() const noexcept { return order_.end(); }

    void clear() noexcept {
        order_.clear();
        index_.clear();
    }

private:
    std::vector<std::string> order_;
    std::unordered_set<std::string> index_;
};

} // namespace libbeans::internal
