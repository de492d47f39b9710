#pragma once

// Internal helper for stacktrace capture and formatting.
// This header is not installed; it is only used by the library's .cpp files.

#include <any>
#include <sstream>
#include <string>

#ifdef LIBBEANS_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace libbeans::internal {

/// Capture the current call stack.  Returns an empty any when stacktrace
/// support is disabled.  Implemented in stacktrace_capture.cpp.
std::any capture_stacktrace();

/// Format a stacktrace stored in a std::any into a human-readable string.
/// Returns an empty string if the any is empty or stacktrace support is
/// disabled.
inline std::string format_stacktrace(const std::any& st) {
#ifdef LIBBEANS_HAS_STACKTRACE
    if (const auto* trace = std::any_cast<boost::stacktrace::stacktrace>(&st)) {
        if (trace->size() > 0) {
            std::ostringstream oss;
            oss << *trace;
            return oss.str();
        }
    }
#else
    (void)st;
#endif
    return {};
}

/// Format where the finished instance of a bean was registered:
///   "Registration stacktrace for 'name':\n  0# ...\n"
/// or an empty string if no stacktrace is available.
inline std::string format_registration_trace(const std::string& bean_name,
                                             const std::any& st) {
    std::string trace = format_stacktrace(st);
    if (trace.empty()) return {};
    return "Registration stacktrace for '" + bean_name + "':\n" + trace;
}

} // namespace libbeans::internal
