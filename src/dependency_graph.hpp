#pragma once

// Internal helper, not installed.

#include "linked_name_set.hpp"

#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace libbeans::internal {

/// Destruction-ordering edges between bean names.
///
///   dependents_[b]   = beans that depend on b (destroyed before b)
///   dependencies_[a] = beans that a depends on (mirror of dependents_)
///   contained_[o]    = inner beans owned by outer bean o
///
/// Each map has its own mutex.  Edges may reference names that have no
/// instance yet.
class dependency_graph {
public:
    /// Record that `dependent` depends on `depends_on`.
    void register_dependency(const std::string& dependent, const std::string& depends_on);

    /// Record that `outer` contains `inner`; a new containment edge also
    /// makes `outer` dependent on `inner`.
    void register_containment(const std::string& inner, const std::string& outer);

    /// Reachability from `name` to `dependent_name` over the dependents
    /// edges.  Terminates on cyclic input.
    bool is_dependent(const std::string& name, const std::string& dependent_name) const;
    bool has_dependents(const std::string& name) const;

    std::vector<std::string> dependents_of(const std::string& name) const;
    std::vector<std::string> dependencies_of(const std::string& name) const;

    /// Remove and return the dependents of `name`.
    std::vector<std::string> detach_dependents(const std::string& name);

    /// Remove and return the beans contained in `name`.
    std::vector<std::string> detach_contained(const std::string& name);

    /// Drop `name` from every dependents set; empty sets are erased.
    void scrub_dependent(const std::string& name);

    /// Drop the recorded dependencies of `name`.
    void remove_dependencies(const std::string& name);

    void clear();

private:
    // Requires dependents_mutex_.
    bool is_dependent_locked(const std::string& name, const std::string& dependent_name,
                             std::unordered_set<std::string>& seen) const;

    mutable std::mutex contained_mutex_;
    std::unordered_map<std::string, linked_name_set> contained_;

    mutable std::mutex dependents_mutex_;
    std::unordered_map<std::string, linked_name_set> dependents_;

    mutable std::mutex dependencies_mutex_;
    std::unordered_map<std::string, linked_name_set> dependencies_;
};

} // namespace libbeans::internal
