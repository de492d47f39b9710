#include "dependency_graph.hpp"

#include <utility>

namespace libbeans::internal {

void dependency_graph::register_dependency(const std::string& dependent,
                                           const std::string& depends_on) {
    {
        std::lock_guard lock(dependents_mutex_);
        if (!dependents_[depends_on].insert(dependent)) {
            return;
        }
    }
    std::lock_guard lock(dependencies_mutex_);
    dependencies_[dependent].insert(depends_on);
}

void dependency_graph::register_containment(const std::string& inner,
                                            const std::string& outer) {
    {
        std::lock_guard lock(contained_mutex_);
        if (!contained_[outer].insert(inner)) {
            return;
        }
    }
    register_dependency(outer, inner);
}

bool dependency_graph::is_dependent(const std::string& name,
                                    const std::string& dependent_name) const {
    std::lock_guard lock(dependents_mutex_);
    std::unordered_set<std::string> seen;
    return is_dependent_locked(name, dependent_name, seen);
}

bool dependency_graph::is_dependent_locked(const std::string& name,
                                           const std::string& dependent_name,
                                           std::unordered_set<std::string>& seen) const {
    if (!seen.insert(name).second) {
        return false;
    }
    auto it = dependents_.find(name);
    if (it == dependents_.end() || it->second.empty()) {
        return false;
    }
    if (it->second.contains(dependent_name)) {
        return true;
    }
    for (const auto& transitive : it->second) {
        if (is_dependent_locked(transitive, dependent_name, seen)) {
            return true;
        }
    }
    return false;
}

bool dependency_graph::has_dependents(const std::string& name) const {
    std::lock_guard lock(dependents_mutex_);
    return dependents_.contains(name);
}

std::vector<std::string> dependency_graph::dependents_of(const std::string& name) const {
    std::lock_guard lock(dependents_mutex_);
    auto it = dependents_.find(name);
    if (it == dependents_.end()) return {};
    return it->second.items();
}

std::vector<std::string> dependency_graph::dependencies_of(const std::string& name) const {
    std::lock_guard lock(dependencies_mutex_);
    auto it = dependencies_.find(name);
    if (it == dependencies_.end()) return {};
    return it->second.items();
}

std::vector<std::string> dependency_graph::detach_dependents(const std::string& name) {
    std::lock_guard lock(dependents_mutex_);
    auto node = dependents_.extract(name);
    if (node.empty()) return {};
    return node.mapped().items();
}

std::vector<std::string> dependency_graph::detach_contained(const std::string& name) {
    std::lock_guard lock(contained_mutex_);
    auto node = contained_.extract(name);
    if (node.empty()) return {};
    return node.mapped().items();
}

void dependency_graph::scrub_dependent(const std::string& name) {
    std::lock_guard lock(dependents_mutex_);
    for (auto it = dependents_.begin(); it != dependents_.end();) {
        it->second.erase(name);
        if (it->second.empty()) {
            it = dependents_.erase(it);
        } else {
            ++it;
        }
    }
}

void dependency_graph::remove_dependencies(const std::string& name) {
    std::lock_guard lock(dependencies_mutex_);
    dependencies_.erase(name);
}

void dependency_graph::clear() {
    {
        std::lock_guard lock(contained_mutex_);
        contained_.clear();
    }
    {
        std::lock_guard lock(dependents_mutex_);
        dependents_.clear();
    }
    std::lock_guard lock(dependencies_mutex_);
    dependencies_.clear();
}

} // namespace libbeans::internal
