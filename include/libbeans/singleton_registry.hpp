#pragma once

#include "export.hpp"
#include "bean_ptr.hpp"
#include "bean_state.hpp"
#include "disposable.hpp"
#include "exceptions.hpp"
#include "registry_options.hpp"

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace libbeans {

// ---------------------------------------------------------------
// singleton_registry
// ---------------------------------------------------------------

/// Shared-instance registry keyed by bean name.
///
/// Stores finished singletons, exposes early references to break
/// construction cycles, creates each singleton at most once under
/// concurrent callers and destroys beans dependents-first.
///
/// All operations are synchronous and thread-safe.  Lookups of finished
/// instances never wait for the coordination lock; creation protocols
/// serialize on it.
class LIBBEANS_EXPORT singleton_registry {
public:
    explicit singleton_registry(registry_options options = {});
    virtual ~singleton_registry();

    singleton_registry(const singleton_registry&) = delete;
    singleton_registry& operator=(const singleton_registry&) = delete;

    // ===============================================================
    // Registration
    // ===============================================================

    /// Publish a fully constructed instance.  Throws duplicate_registration
    /// if the name already has a finished instance; the registry is left
    /// unchanged in that case.
    void register_finished(std::string_view name, bean_ptr instance,
                           std::source_location loc = std::source_location::current());

    /// Register (or replace) the early-exposure factory for a name.  The
    /// factory is invoked at most once, by the first get() that asks for an
    /// early reference while the bean is in creation.
    void register_factory(std::string_view name, object_factory early_factory);

    /// Invoke `callback` with the instance once the finished instance for
    /// `name` is published.
    void add_singleton_callback(std::string_view name, singleton_callback callback);

    // ===============================================================
    // Lookup
    // ===============================================================

    /// Return the finished instance, or, while the bean is in creation, an
    /// early reference.  Returns nullptr when absent.  May also return
    /// nullptr transiently if the coordination lock is busy and the early
    /// reference has not been materialized yet.
    bean_ptr get(std::string_view name, bool allow_early_reference = true);

    /// Typed get().  T must be the type the bean was stored as.
    template <typename T>
    std::shared_ptr<T> get_as(std::string_view name, bool allow_early_reference = true) {
        return bean_cast<T>(get(name, allow_early_reference));
    }

    /// Return the singleton, creating it through `factory` if it does not
    /// exist yet.  The factory runs at most once per successful creation.
    /// Throws bean_creation_error (and subclasses) on failure; the name is
    /// left absent so that a later call may retry.
    bean_ptr get_or_create(std::string_view name, const object_factory& factory,
                           std::source_location loc = std::source_location::current());

    /// Typed get_or_create().  `factory` returns std::shared_ptr<T>.
    template <typename T, typename F>
        requires std::is_invocable_r_v<std::shared_ptr<T>, F&>
    std::shared_ptr<T> get_or_create_as(std::string_view name, F factory,
                                        std::source_location loc = std::source_location::current()) {
        return bean_cast<T>(get_or_create(
            name,
            [f = std::move(factory)]() mutable -> bean_ptr { return to_bean<T>(f()); },
            loc));
    }

    /// Lifecycle tag currently stored for `name`.
    bean_state state_of(std::string_view name) const;

    /// True if a finished instance is registered under `name`.
    bool contains(std::string_view name) const;

    /// Names registered through register_finished(), register_factory() or
    /// get_or_create(), in registration order.
    std::vector<std::string> all_names() const;
    std::size_t count() const;

    // ===============================================================
    // Creation tracking
    // ===============================================================

    /// Exclude (`in_creation == false`) or re-include a name in creation
    /// tracking.  Excluded names never raise currently_in_creation.
    void set_currently_in_creation(std::string_view name, bool in_creation);

    /// In creation and not excluded from tracking.
    bool is_currently_in_creation(std::string_view name) const;

    /// Raw creation marker, regardless of exclusions.
    bool is_singleton_currently_in_creation(std::string_view name) const;

    /// Record a secondary failure for the creation attempt that currently
    /// holds the coordination lock.  Recorded exceptions are attached to a
    /// surfaced bean_creation_error as related causes.
    void on_suppressed_exception(std::exception_ptr ex);

    // ===============================================================
    // Disposal and dependency graph
    // ===============================================================

    void register_disposable(std::string_view name, std::shared_ptr<disposable> bean);
    void register_disposable(std::string_view name, std::function<void()> destroy_fn);

    /// `inner` is owned by `outer`: destroying `outer` destroys `inner`,
    /// and `outer` is recorded as dependent on `inner`.
    void register_containment(std::string_view inner, std::string_view outer);

    /// `dependent` depends on `depends_on`, so `dependent` is destroyed
    /// first.  Either bean may not exist yet.
    void register_dependency(std::string_view dependent, std::string_view depends_on);

    /// True if `dependent_name` depends on `name`, directly or transitively.
    bool is_dependent(std::string_view name, std::string_view dependent_name) const;
    bool has_dependents(std::string_view name) const;

    std::vector<std::string> dependents_of(std::string_view name) const;
    std::vector<std::string> dependencies_of(std::string_view name) const;

    // ===============================================================
    // Teardown
    // ===============================================================

    /// Destroy one bean: its dependents first, then its disposable, then
    /// contained beans.  A no-op for unknown names.
    void destroy(std::string_view name);

    /// Destroy every disposable bean in reverse registration order and
    /// clear all stores.  Creation is rejected while this runs.
    void destroy_all();

    /// Remove a single name from the instance stores without calling its
    /// disposable.
    void remove(std::string_view name);

    /// Forced reset: clear every store, disposable and edge without
    /// calling any disposable.
    void remove_all();

    bool in_destruction() const noexcept;

    const registry_options& options() const noexcept;

protected:
    /// Whether the calling thread may block on the coordination lock.
    /// Override to exempt e.g. background bootstrap executors; exempt
    /// threads create without the lock and rely on the write-once publish.
    virtual bool is_current_thread_allowed_to_hold_lock() const;

private:
    struct impl;

    bean_ptr find_finished(const std::string& name) const;
    bean_ptr create_singleton(const std::string& name, const object_factory& factory,
                              bool locked, std::source_location loc);
    void store_finished(const std::string& name, const bean_ptr& instance,
                        bool duplicate_is_bug, std::source_location loc);
    /// Drop what a failed creation left behind: a pending or exposed early
    /// reference and its registered name.
    void discard_early_reference(const std::string& name);
    void notify_singleton_callback(const std::string& name, const bean_ptr& instance);
    void remove_singleton(const std::string& name);

    void destroy_singleton(const std::string& name, std::unordered_set<std::string>& visited);
    void destroy_bean(const std::string& name, const std::shared_ptr<disposable>& bean,
                      std::unordered_set<std::string>& visited);

    std::unique_ptr<impl> impl_;
};

} // namespace libbeans
