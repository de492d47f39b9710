#pragma once

#include "libbeans/export.hpp"
#include "libbeans/fwd.hpp"
#include "libbeans/bean_state.hpp"
#include "libbeans/bean_ptr.hpp"
#include "libbeans/disposable.hpp"
#include "libbeans/exceptions.hpp"
#include "libbeans/registry_options.hpp"
#include "libbeans/singleton_registry.hpp"
