#pragma once

// Internal state of singleton_registry, not installed.
// Shared by singleton_registry.cpp (lookup/creation) and destruction.cpp.

#include "libbeans/singleton_registry.hpp"

#include "creation_tracker.hpp"
#include "dependency_graph.hpp"
#include "linked_name_set.hpp"
#include "logging.hpp"

#include <any>
#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace libbeans {

namespace internal {

// ---------------------------------------------------------------
// bean_slot: everything stored for one bean name
// ---------------------------------------------------------------

struct bean_slot {
    bean_state     state = bean_state::absent;
    bean_ptr       instance;        // finished or early_exposed
    object_factory early_factory;   // pending_early only
    std::any       registration_trace;
};

} // namespace internal

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

struct singleton_registry::impl {
    registry_options options;
    std::shared_ptr<spdlog::logger> log;

    // Instance stores.  Held only for the map access itself, never while a
    // user callback runs.
    mutable std::shared_mutex slots_mutex;
    std::unordered_map<std::string, internal::bean_slot> slots;
    internal::linked_name_set registered_names;

    std::mutex callbacks_mutex;
    std::unordered_map<std::string, singleton_callback> callbacks;

    // Coordination lock for the multi-step early-exposure and creation
    // protocols.  Recursive: a factory may create its own dependencies.
    std::recursive_mutex singleton_lock;

    // Advisory: thread currently creating under the lock.  Logging only.
    std::atomic<std::thread::id> creation_thread{};

    std::atomic<bool> in_destruction{false};

    internal::creation_tracker creation;

    // Secondary failures of the outermost locked creation attempt.
    std::mutex suppressed_mutex;
    std::optional<std::vector<std::exception_ptr>> suppressed;

    std::mutex disposables_mutex;
    internal::linked_name_set disposable_order;
    std::unordered_map<std::string, std::shared_ptr<disposable>> disposables;

    internal::dependency_graph graph;

    explicit impl(registry_options opts)
        : options(std::move(opts))
        , log(options.logger ? options.logger : internal::default_logger())
    {}

    /// Start recording suppressed exceptions.  Returns false if an outer
    /// creation attempt is already recording.
    bool begin_suppressed_recording() {
        std::lock_guard lock(suppressed_mutex);
        if (suppressed.has_value()) return false;
        suppressed.emplace();
        return true;
    }

    /// Attach what has been recorded so far to a surfaced failure.
    void attach_suppressed(bean_creation_error& error) {
        std::lock_guard lock(suppressed_mutex);
        if (!suppressed.has_value()) return;
        for (const auto& ex : *suppressed) {
            error.add_related_cause(ex);
        }
    }

    std::vector<std::exception_ptr> end_suppressed_recording() {
        std::lock_guard lock(suppressed_mutex);
        std::vector<std::exception_ptr> out;
        if (suppressed.has_value()) {
            out = std::move(*suppressed);
            suppressed.reset();
        }
        return out;
    }

    /// Clear the instance stores and the destruction flag.
    /// Caller holds singleton_lock.
    void clear_singleton_cache() {
        {
            std::unique_lock lock(slots_mutex);
            slots.clear();
            registered_names.clear();
        }
        in_destruction.store(false);
    }
};

} // namespace libbeans
