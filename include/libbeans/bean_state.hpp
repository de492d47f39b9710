#pragma once

#include <string_view>

namespace libbeans {

/// Lifecycle tag of a single bean name inside a singleton_registry.
///
///   absent       : nothing stored under the name
///   pending_early: an early-exposure factory is registered, not yet invoked
///   early_exposed: the early factory ran; its result is visible to
///                   lookups that happen while the bean is in creation
///   finished     : the fully constructed instance is published (write-once)
enum class bean_state {
    absent,
    pending_early,
    early_exposed,
    finished
};

constexpr std::string_view to_string(bean_state s) noexcept {
    constexpr std::string_view names[] = {
        "absent", "pending_early", "early_exposed", "finished"};
    return names[static_cast<int>(s)];
}

/// What get_or_create() does when the coordination lock is held by another
/// thread that is creating a different bean.
enum class lock_contention_policy {
    proceed_unlocked,   // create without the lock; publish is still write-once
    block               // always wait for the lock
};

constexpr std::string_view to_string(lock_contention_policy p) noexcept {
    constexpr std::string_view names[] = {"proceed_unlocked", "block"};
    return names[static_cast<int>(p)];
}

} // namespace libbeans
