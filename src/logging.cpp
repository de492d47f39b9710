#include "logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <sstream>

namespace libbeans::internal {

std::shared_ptr<spdlog::logger> default_logger() {
    static const std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(default_logger_name)) {
            return existing;
        }
        auto created = std::make_shared<spdlog::logger>(
            default_logger_name,
            std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        created->set_level(spdlog::level::info);
        try {
            spdlog::register_logger(created);
        } catch (const spdlog::spdlog_ex&) {
            // Registered concurrently by the application.
            return spdlog::get(default_logger_name);
        }
        return created;
    }();
    return instance;
}

std::string describe_thread(std::thread::id id) {
    if (id == std::thread::id{}) {
        return "<none>";
    }
    std::ostringstream oss;
    oss << id;
    return oss.str();
}

std::string join_names(const std::vector<std::string>& names) {
    std::string out = "[";
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    out += "]";
    return out;
}

} // namespace libbeans::internal
