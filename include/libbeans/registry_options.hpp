#pragma once

#include "bean_state.hpp"

#include <cstddef>
#include <memory>

namespace spdlog {
class logger;
} // namespace spdlog

namespace libbeans {

/// Construction-time configuration of a singleton_registry.
/// Aggregate, so it can be built with designated initializers:
///   singleton_registry reg({.contention_policy = lock_contention_policy::block});
struct registry_options {
    /// Behaviour of get_or_create() when another thread holds the
    /// coordination lock while creating a different bean.
    lock_contention_policy contention_policy = lock_contention_policy::proceed_unlocked;

    /// Upper bound on secondary exceptions recorded per creation attempt.
    std::size_t suppressed_exceptions_limit = 100;

    /// Record a stacktrace where each finished instance was registered
    /// (no-op unless built with LIBBEANS_HAS_STACKTRACE).
    bool capture_stacktraces = true;

    /// Logger for registry diagnostics; nullptr selects the shared
    /// "libbeans" logger.
    std::shared_ptr<spdlog::logger> logger;
};

} // namespace libbeans
