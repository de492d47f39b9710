#include "creation_tracker.hpp"

#include "libbeans/exceptions.hpp"

#include <algorithm>

namespace libbeans::internal {

void creation_tracker::before_creation(const std::string& name) {
    std::lock_guard lock(mutex_);
    if (exclusions_.contains(name)) return;
    if (!in_creation_.insert(name).second) {
        throw currently_in_creation(name);
    }
}

void creation_tracker::after_creation(const std::string& name) {
    std::lock_guard lock(mutex_);
    if (exclusions_.contains(name)) return;
    if (in_creation_.erase(name) == 0) {
        throw illegal_state("Singleton '" + name + "' isn't currently in creation");
    }
}

void creation_tracker::set_excluded(const std::string& name, bool excluded) {
    std::lock_guard lock(mutex_);
    if (excluded) {
        exclusions_.insert(name);
    } else {
        exclusions_.erase(name);
    }
}

bool creation_tracker::is_excluded(const std::string& name) const {
    std::lock_guard lock(mutex_);
    return exclusions_.contains(name);
}

bool creation_tracker::is_in_creation(const std::string& name) const {
    std::lock_guard lock(mutex_);
    return in_creation_.contains(name);
}

std::vector<std::string> creation_tracker::snapshot() const {
    std::vector<std::string> names;
    {
        std::lock_guard lock(mutex_);
        names.reserve(in_creation_.size());
        for (const auto& entry : in_creation_) {
            names.push_back(entry);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace libbeans::internal
