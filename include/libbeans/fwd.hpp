#pragma once

/// @file fwd.hpp
/// Forward declarations for all public libbeans symbols.
/// Include this header when you only need to name a type (pointers,
/// references, function parameters) without requiring its full definition.

#include "export.hpp"

namespace libbeans {

// bean_state.hpp
enum class bean_state;
enum class lock_contention_policy;

// registry_options.hpp
struct registry_options;

// disposable.hpp
class disposable;

// exceptions.hpp
class beans_error;
class illegal_state;
class duplicate_registration;
class bean_creation_error;
class currently_in_creation;
class creation_not_allowed;

// singleton_registry.hpp
class singleton_registry;

} // namespace libbeans
