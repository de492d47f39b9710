#include "libbeans/singleton_registry.hpp"
#include "libbeans/exceptions.hpp"
#include "registry_impl.hpp"
#include "stacktrace_utils.hpp"

#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <utility>

namespace libbeans {

namespace {

void require_name(std::string_view name, std::source_location loc) {
    if (name.empty()) {
        throw beans_error("Bean name must not be empty", loc);
    }
}

} // namespace

// ---------------------------------------------------------------
// Constructors / Destructor
// ---------------------------------------------------------------

singleton_registry::singleton_registry(registry_options options)
    : impl_(std::make_unique<impl>(std::move(options)))
{}

singleton_registry::~singleton_registry() = default;

const registry_options& singleton_registry::options() const noexcept {
    return impl_->options;
}

bool singleton_registry::in_destruction() const noexcept {
    return impl_->in_destruction.load();
}

bool singleton_registry::is_current_thread_allowed_to_hold_lock() const {
    return true;
}

// ---------------------------------------------------------------
// Registration
// ---------------------------------------------------------------

void singleton_registry::register_finished(std::string_view name, bean_ptr instance,
                                           std::source_location loc) {
    require_name(name, loc);
    if (!instance) {
        throw beans_error("Singleton object must not be null", loc);
    }
    std::string key(name);
    {
        std::lock_guard lock(impl_->singleton_lock);
        store_finished(key, instance, false, loc);
    }
    notify_singleton_callback(key, instance);
}

void singleton_registry::register_factory(std::string_view name, object_factory early_factory) {
    require_name(name, std::source_location::current());
    if (!early_factory) {
        throw beans_error("Singleton factory must not be empty");
    }
    std::string key(name);
    std::unique_lock lock(impl_->slots_mutex);
    auto& slot = impl_->slots[key];
    if (slot.state != bean_state::finished) {
        slot.state = bean_state::pending_early;
        slot.early_factory = std::move(early_factory);
        slot.instance.reset();
    }
    impl_->registered_names.insert(key);
}

void singleton_registry::add_singleton_callback(std::string_view name,
                                                singleton_callback callback) {
    require_name(name, std::source_location::current());
    std::lock_guard lock(impl_->callbacks_mutex);
    impl_->callbacks[std::string(name)] = std::move(callback);
}

void singleton_registry::store_finished(const std::string& name, const bean_ptr& instance,
                                        bool duplicate_is_bug, std::source_location loc) {
    std::any trace;
    if (impl_->options.capture_stacktraces) {
        trace = internal::capture_stacktrace();
    }

    std::unique_lock lock(impl_->slots_mutex);
    auto& slot = impl_->slots[name];
    if (slot.state == bean_state::finished) {
        if (duplicate_is_bug) {
            throw illegal_state("Singleton '" + name + "' was published twice although "
                                "its creation was serialized", loc);
        }
        duplicate_registration ex(name, loc);
        auto detail = internal::format_registration_trace(name, slot.registration_trace);
        if (!detail.empty()) ex.set_diagnostic_detail(std::move(detail));
        throw ex;
    }
    slot.state = bean_state::finished;
    slot.instance = instance;
    slot.early_factory = nullptr;
    slot.registration_trace = std::move(trace);
    impl_->registered_names.insert(name);
}

void singleton_registry::notify_singleton_callback(const std::string& name,
                                                   const bean_ptr& instance) {
    singleton_callback callback;
    {
        std::lock_guard lock(impl_->callbacks_mutex);
        auto it = impl_->callbacks.find(name);
        if (it == impl_->callbacks.end()) return;
        callback = it->second;
    }
    if (callback) callback(instance);
}

// ---------------------------------------------------------------
// Lookup
// ---------------------------------------------------------------

bean_ptr singleton_registry::find_finished(const std::string& name) const {
    std::shared_lock lock(impl_->slots_mutex);
    auto it = impl_->slots.find(name);
    if (it == impl_->slots.end() || it->second.state != bean_state::finished) {
        return nullptr;
    }
    return it->second.instance;
}

bean_ptr singleton_registry::get(std::string_view name, bool allow_early_reference) {
    std::string key(name);
    if (auto finished = find_finished(key)) {
        return finished;
    }
    if (!impl_->creation.is_in_creation(key)) {
        return nullptr;
    }

    {
        std::shared_lock lock(impl_->slots_mutex);
        auto it = impl_->slots.find(key);
        if (it == impl_->slots.end()) return nullptr;
        if (it->second.state == bean_state::early_exposed) return it->second.instance;
        if (it->second.state != bean_state::pending_early || !allow_early_reference) {
            return nullptr;
        }
    }

    // Never wait here: a thread holding the lock may itself be waiting for
    // this caller.  A busy lock reads as "not available yet".
    std::unique_lock coordination(impl_->singleton_lock, std::try_to_lock);
    if (!coordination.owns_lock()) {
        return nullptr;
    }

    object_factory factory;
    {
        std::unique_lock lock(impl_->slots_mutex);
        auto it = impl_->slots.find(key);
        if (it == impl_->slots.end()) return nullptr;
        auto& slot = it->second;
        if (slot.state == bean_state::finished || slot.state == bean_state::early_exposed) {
            return slot.instance;
        }
        if (slot.state != bean_state::pending_early || !slot.early_factory) {
            return nullptr;
        }
        // Taken out before the call so that a re-entrant get() cannot run it twice.
        factory = std::move(slot.early_factory);
        slot.early_factory = nullptr;
    }

    bean_ptr early;
    try {
        early = factory();
    } catch (...) {
        std::unique_lock lock(impl_->slots_mutex);
        auto it = impl_->slots.find(key);
        if (it != impl_->slots.end() && it->second.state == bean_state::pending_early
            && !it->second.early_factory) {
            it->second.early_factory = std::move(factory);
        }
        throw;
    }

    std::unique_lock lock(impl_->slots_mutex);
    auto it = impl_->slots.find(key);
    if (it == impl_->slots.end()) {
        return nullptr;
    }
    auto& slot = it->second;
    if (slot.state == bean_state::finished || slot.state == bean_state::early_exposed) {
        return slot.instance;
    }
    if (slot.state != bean_state::pending_early || slot.early_factory) {
        // Replaced by register_factory() while ours ran: the new one wins.
        return nullptr;
    }
    if (!early) {
        slot.early_factory = std::move(factory);
        return nullptr;
    }
    slot.state = bean_state::early_exposed;
    slot.instance = early;
    return early;
}

// ---------------------------------------------------------------
// Get-or-create
// ---------------------------------------------------------------

bean_ptr singleton_registry::get_or_create(std::string_view name,
                                           const object_factory& factory,
                                           std::source_location loc) {
    require_name(name, loc);
    if (!factory) {
        throw beans_error("Singleton factory must not be empty", loc);
    }
    std::string key(name);
    if (auto existing = find_finished(key)) {
        return existing;
    }

    const bool acquire_lock = is_current_thread_allowed_to_hold_lock();
    std::unique_lock coordination(impl_->singleton_lock, std::defer_lock);
    if (acquire_lock && !coordination.try_lock()) {
        const auto holder = impl_->creation_thread.load();
        if (holder != std::thread::id{}
            && impl_->options.contention_policy == lock_contention_policy::proceed_unlocked) {
            impl_->log->info(
                "Creating singleton bean '{}' in thread {} while thread {} holds singleton "
                "lock for other beans {}",
                key, internal::describe_thread(std::this_thread::get_id()),
                internal::describe_thread(holder),
                internal::join_names(impl_->creation.snapshot()));
        } else {
            coordination.lock();
        }
    }
    if (coordination.owns_lock()) {
        if (auto existing = find_finished(key)) {
            return existing;
        }
    }

    if (impl_->in_destruction.load()) {
        throw creation_not_allowed(
            key,
            "Singleton bean creation not allowed while singletons of this registry are in "
            "destruction (Do not request a bean from a registry in a destroy method "
            "implementation!)",
            loc);
    }
    impl_->log->debug("Creating shared instance of singleton bean '{}'", key);

    // Throws currently_in_creation if this or another thread is creating it.
    impl_->creation.before_creation(key);

    // Published between our first check and the marker?
    if (auto existing = find_finished(key)) {
        impl_->creation.after_creation(key);
        return existing;
    }

    return create_singleton(key, factory, coordination.owns_lock(), loc);
}

bean_ptr singleton_registry::create_singleton(const std::string& name,
                                              const object_factory& factory,
                                              bool locked,
                                              std::source_location loc) {
    // Only the lock holder is advertised; unlocked creators leave it alone.
    // Nested creations restore the outer value on exit.
    std::thread::id previous_holder;
    if (locked) {
        previous_holder = impl_->creation_thread.exchange(std::this_thread::get_id());
    }
    const bool record_suppressed = locked && impl_->begin_suppressed_recording();

    bean_ptr instance;
    bool new_singleton = false;
    std::exception_ptr failure;
    try {
        instance = factory();
        if (!instance) {
            throw bean_creation_error(name, "factory returned an empty instance", loc);
        }
        new_singleton = true;
    } catch (const illegal_state&) {
        // The factory may signal that the singleton appeared meanwhile.
        instance = find_finished(name);
        if (!instance) {
            failure = std::current_exception();
        }
    } catch (bean_creation_error& e) {
        if (record_suppressed) {
            impl_->attach_suppressed(e);
        }
        if (e.bean_name() != name) {
            e.append_creation_context(name);
        }
        failure = std::current_exception();
    } catch (const std::exception& e) {
        bean_creation_error wrapped(name, e, std::current_exception(), loc);
        if (record_suppressed) {
            impl_->attach_suppressed(wrapped);
        }
        failure = std::make_exception_ptr(std::move(wrapped));
    } catch (...) {
        failure = std::current_exception();
    }

    // Publish while still marked, so a racing unlocked creator that marks
    // the name after us is guaranteed to see the finished instance.
    if (new_singleton) {
        try {
            store_finished(name, instance, true, loc);
        } catch (const illegal_state&) {
            new_singleton = false;
            failure = std::current_exception();
        }
    }

    if (failure) {
        discard_early_reference(name);
    }

    if (locked) {
        impl_->creation_thread.store(previous_holder);
    }
    if (record_suppressed) {
        impl_->end_suppressed_recording();
    }
    impl_->creation.after_creation(name);

    if (failure) {
        std::rethrow_exception(failure);
    }
    if (new_singleton) {
        notify_singleton_callback(name, instance);
    }
    return instance;
}

void singleton_registry::discard_early_reference(const std::string& name) {
    std::unique_lock lock(impl_->slots_mutex);
    auto it = impl_->slots.find(name);
    if (it == impl_->slots.end()) return;
    const auto state = it->second.state;
    if (state == bean_state::pending_early || state == bean_state::early_exposed) {
        impl_->slots.erase(it);
        impl_->registered_names.erase(name);
    }
}

// ---------------------------------------------------------------
// Queries
// ---------------------------------------------------------------

bean_state singleton_registry::state_of(std::string_view name) const {
    std::shared_lock lock(impl_->slots_mutex);
    auto it = impl_->slots.find(std::string(name));
    if (it == impl_->slots.end()) return bean_state::absent;
    return it->second.state;
}

bool singleton_registry::contains(std::string_view name) const {
    return find_finished(std::string(name)) != nullptr;
}

std::vector<std::string> singleton_registry::all_names() const {
    std::shared_lock lock(impl_->slots_mutex);
    return impl_->registered_names.items();
}

std::size_t singleton_registry::count() const {
    std::shared_lock lock(impl_->slots_mutex);
    return impl_->registered_names.size();
}

// ---------------------------------------------------------------
// Creation tracking
// ---------------------------------------------------------------

void singleton_registry::set_currently_in_creation(std::string_view name, bool in_creation) {
    require_name(name, std::source_location::current());
    impl_->creation.set_excluded(std::string(name), !in_creation);
}

bool singleton_registry::is_currently_in_creation(std::string_view name) const {
    std::string key(name);
    return !impl_->creation.is_excluded(key) && impl_->creation.is_in_creation(key);
}

bool singleton_registry::is_singleton_currently_in_creation(std::string_view name) const {
    return impl_->creation.is_in_creation(std::string(name));
}

void singleton_registry::on_suppressed_exception(std::exception_ptr ex) {
    if (!ex) return;
    std::lock_guard lock(impl_->suppressed_mutex);
    if (!impl_->suppressed.has_value()
        || impl_->suppressed->size() >= impl_->options.suppressed_exceptions_limit) {
        return;
    }
    auto& recorded = *impl_->suppressed;
    if (std::find(recorded.begin(), recorded.end(), ex) == recorded.end()) {
        recorded.push_back(std::move(ex));
    }
}

// ---------------------------------------------------------------
// Disposal and dependency graph
// ---------------------------------------------------------------

void singleton_registry::register_disposable(std::string_view name,
                                             std::shared_ptr<disposable> bean) {
    require_name(name, std::source_location::current());
    if (!bean) {
        throw beans_error("Disposable must not be null");
    }
    std::string key(name);
    std::lock_guard lock(impl_->disposables_mutex);
    impl_->disposable_order.insert(key);
    impl_->disposables[key] = std::move(bean);
}

void singleton_registry::register_disposable(std::string_view name,
                                             std::function<void()> destroy_fn) {
    if (!destroy_fn) {
        throw beans_error("Destroy callback must not be empty");
    }
    register_disposable(name, make_disposable(std::move(destroy_fn)));
}

void singleton_registry::register_containment(std::string_view inner, std::string_view outer) {
    require_name(inner, std::source_location::current());
    require_name(outer, std::source_location::current());
    impl_->graph.register_containment(std::string(inner), std::string(outer));
}

void singleton_registry::register_dependency(std::string_view dependent,
                                             std::string_view depends_on) {
    require_name(dependent, std::source_location::current());
    require_name(depends_on, std::source_location::current());
    impl_->graph.register_dependency(std::string(dependent), std::string(depends_on));
}

bool singleton_registry::is_dependent(std::string_view name,
                                      std::string_view dependent_name) const {
    return impl_->graph.is_dependent(std::string(name), std::string(dependent_name));
}

bool singleton_registry::has_dependents(std::string_view name) const {
    return impl_->graph.has_dependents(std::string(name));
}

std::vector<std::string> singleton_registry::dependents_of(std::string_view name) const {
    return impl_->graph.dependents_of(std::string(name));
}

std::vector<std::string> singleton_registry::dependencies_of(std::string_view name) const {
    return impl_->graph.dependencies_of(std::string(name));
}

} // namespace libbeans
