#include "libbeans/singleton_registry.hpp"
#include "registry_impl.hpp"

#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace libbeans {

// ---------------------------------------------------------------
// Single-bean destruction
// ---------------------------------------------------------------

void singleton_registry::destroy(std::string_view name) {
    std::unordered_set<std::string> visited;
    destroy_singleton(std::string(name), visited);
}

void singleton_registry::destroy_singleton(const std::string& name,
                                           std::unordered_set<std::string>& visited) {
    if (!visited.insert(name).second) {
        impl_->log->trace("Skipping bean '{}': already being destroyed", name);
        return;
    }

    std::shared_ptr<disposable> bean;
    {
        std::lock_guard lock(impl_->disposables_mutex);
        auto node = impl_->disposables.extract(name);
        if (!node.empty()) {
            bean = std::move(node.mapped());
            impl_->disposable_order.erase(name);
        }
    }

    destroy_bean(name, bean, visited);

    // During destroy_all() instances stay readable until the final clear.
    if (!impl_->in_destruction.load()) {
        std::lock_guard lock(impl_->singleton_lock);
        remove_singleton(name);
    }
}

void singleton_registry::destroy_bean(const std::string& name,
                                      const std::shared_ptr<disposable>& bean,
                                      std::unordered_set<std::string>& visited) {
    // Dependents go first.
    auto dependents = impl_->graph.detach_dependents(name);
    if (!dependents.empty()) {
        impl_->log->trace("Retrieved dependent beans for bean '{}': {}",
                          name, internal::join_names(dependents));
        for (const auto& dependent : dependents) {
            destroy_singleton(dependent, visited);
        }
    }

    if (bean) {
        try {
            bean->destroy();
        } catch (const std::exception& e) {
            impl_->log->warn("Destruction of bean with name '{}' threw an exception: {}",
                             name, e.what());
        } catch (...) {
            impl_->log->warn("Destruction of bean with name '{}' threw a non-standard exception",
                             name);
        }
    }

    auto contained = impl_->graph.detach_contained(name);
    for (const auto& inner : contained) {
        destroy_singleton(inner, visited);
    }

    impl_->graph.scrub_dependent(name);
    impl_->graph.remove_dependencies(name);
}

void singleton_registry::remove_singleton(const std::string& name) {
    std::unique_lock lock(impl_->slots_mutex);
    impl_->slots.erase(name);
    impl_->registered_names.erase(name);
}

// ---------------------------------------------------------------
// Registry-wide teardown
// ---------------------------------------------------------------

void singleton_registry::destroy_all() {
    impl_->log->trace("Destroying singletons in registry {}", static_cast<const void*>(this));
    impl_->in_destruction.store(true);

    std::vector<std::string> names;
    {
        std::lock_guard lock(impl_->disposables_mutex);
        names = impl_->disposable_order.items();
    }

    std::unordered_set<std::string> visited;
    for (auto it = names.rbegin(); it != names.rend(); ++it) {
        destroy_singleton(*it, visited);
    }

    impl_->graph.clear();

    std::lock_guard lock(impl_->singleton_lock);
    impl_->clear_singleton_cache();
}

void singleton_registry::remove(std::string_view name) {
    std::lock_guard lock(impl_->singleton_lock);
    remove_singleton(std::string(name));
}

void singleton_registry::remove_all() {
    std::lock_guard lock(impl_->singleton_lock);
    {
        std::lock_guard disposables_lock(impl_->disposables_mutex);
        impl_->disposables.clear();
        impl_->disposable_order.clear();
    }
    impl_->graph.clear();
    impl_->clear_singleton_cache();
}

} // namespace libbeans
