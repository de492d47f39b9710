#pragma once

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace libbeans {

// ---------------------------------------------------------------
// bean_ptr: type-erased shared instance handle
// ---------------------------------------------------------------

/// Type-erased shared handle to a bean instance.  Shared ownership keeps an
/// instance alive for readers that obtained it before the registry dropped
/// its own reference (e.g. during destroy_all()).
using bean_ptr = std::shared_ptr<void>;

/// Callback that produces an instance.  Used both for full construction
/// (get_or_create) and for early exposure (register_factory).
using object_factory = std::function<bean_ptr()>;

/// Callback invoked with a freshly published finished instance.
using singleton_callback = std::function<void(const bean_ptr&)>;

/// Create a bean_ptr that owns a `new T(args...)`.
template <typename T, typename... Args>
bean_ptr make_bean(Args&&... args) {
    return std::static_pointer_cast<void>(
        std::make_shared<T>(std::forward<Args>(args)...));
}

/// Create a bean_ptr that owns a `new TImpl(args...)`, storing the pointer
/// as `TInterface*` in the void*.  This ensures that `bean_cast<TInterface>`
/// round-trips correctly even under multiple or virtual inheritance.
template <typename TInterface, typename TImpl, typename... Args>
    requires std::is_base_of_v<TInterface, TImpl>
bean_ptr make_bean_as(Args&&... args) {
    std::shared_ptr<TInterface> typed =
        std::make_shared<TImpl>(std::forward<Args>(args)...);
    return std::static_pointer_cast<void>(std::move(typed));
}

/// Wrap an existing typed handle.  The void* stores a `T*`.
template <typename T>
bean_ptr to_bean(std::shared_ptr<T> p) noexcept {
    return std::static_pointer_cast<void>(std::move(p));
}

/// Recover the typed handle.  T must be the type the bean was stored as.
template <typename T>
std::shared_ptr<T> bean_cast(const bean_ptr& p) noexcept {
    return std::static_pointer_cast<T>(p);
}

} // namespace libbeans
