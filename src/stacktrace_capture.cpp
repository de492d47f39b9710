#include "stacktrace_utils.hpp"

#include <any>
#include <cstddef>

#ifdef LIBBEANS_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace libbeans::internal {

#ifdef LIBBEANS_HAS_STACKTRACE
namespace {

// Frames of the registry itself (this function and store_finished) are
// not interesting in a duplicate-registration report.
constexpr std::size_t registry_frames = 2;

// Deep enough to reach application code through a few factory layers.
constexpr std::size_t max_frames = 48;

} // namespace
#endif

std::any capture_stacktrace() {
#ifdef LIBBEANS_HAS_STACKTRACE
    return std::any(boost::stacktrace::stacktrace(registry_frames, max_frames));
#else
    return {};
#endif
}

} // namespace libbeans::internal
