#pragma once

// Internal helper, not installed.

#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace libbeans::internal {

/// Per-name "in creation" markers:
///   not-in-creation -> in-creation -> not-in-creation
/// Excluded names are never marked; entering and leaving them is a no-op.
class creation_tracker {
public:
    /// Throws currently_in_creation if the name is already marked.
    void before_creation(const std::string& name);

    /// Throws illegal_state if the name is not marked.
    void after_creation(const std::string& name);

    void set_excluded(const std::string& name, bool excluded);
    bool is_excluded(const std::string& name) const;

    /// Raw marker, ignoring exclusions.
    bool is_in_creation(const std::string& name) const;

    /// Marked names, for diagnostics.
    std::vector<std::string> snapshot() const;

private:
    mutable std::mutex mutex_;
    std::unordered_set<std::string> in_creation_;
    std::unordered_set<std::string> exclusions_;
};

} // namespace libbeans::internal
