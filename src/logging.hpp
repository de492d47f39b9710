#pragma once

// Internal helper, not installed.

#include <spdlog/logger.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace libbeans::internal {

inline constexpr const char* default_logger_name = "libbeans";

/// Shared stderr logger named "libbeans", registered with spdlog so that
/// applications can reconfigure it via spdlog::get("libbeans").
std::shared_ptr<spdlog::logger> default_logger();

/// Printable thread identifier for log messages.
std::string describe_thread(std::thread::id id);

/// "[a, b, c]" rendering of a name list for log messages.
std::string join_names(const std::vector<std::string>& names);

} // namespace libbeans::internal
