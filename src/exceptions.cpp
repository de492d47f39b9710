#include "libbeans/exceptions.hpp"

#include <string>
#include <utility>

namespace libbeans {

namespace {

std::string describe(const std::exception_ptr& ep) {
    if (!ep) return "<null>";
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "<non-standard exception>";
    }
}

} // namespace

std::string beans_error::format_message(const std::string& msg,
                                        const std::source_location& loc) {
    return msg + " [at " + loc.file_name() + ":"
           + std::to_string(loc.line()) + "]";
}

beans_error::beans_error(const std::string& message, std::source_location loc)
    : std::runtime_error(format_message(message, loc))
    , location_(loc)
{}

void beans_error::set_diagnostic_detail(std::string detail) {
    diagnostic_detail_ = std::move(detail);
}

void beans_error::append_creation_context(std::string_view bean_name) {
    if (!creation_context_.empty()) {
        creation_context_ += " -> ";
    }
    creation_context_ += "'";
    creation_context_ += bean_name;
    creation_context_ += "'";
    cached_what_.clear();
}

const char* beans_error::what() const noexcept {
    if (creation_context_.empty()) {
        return std::runtime_error::what();
    }
    if (cached_what_.empty()) {
        try {
            cached_what_ = std::string(std::runtime_error::what())
                           + " (while creating " + creation_context_ + ")";
        } catch (const std::bad_alloc&) {
            return std::runtime_error::what();
        }
    }
    return cached_what_.c_str();
}

std::string beans_error::full_diagnostic() const {
    if (diagnostic_detail_.empty()) {
        return what();
    }
    return std::string(what()) + "\n" + diagnostic_detail_;
}

duplicate_registration::duplicate_registration(std::string_view bean_name,
                                               std::source_location loc)
    : illegal_state("Could not register singleton '" + std::string(bean_name)
                    + "': there is already an instance bound", loc)
    , bean_name_(bean_name)
{}

bean_creation_error::bean_creation_error(std::string_view bean_name,
                                         std::string_view reason,
                                         std::source_location loc)
    : beans_error("Error creating bean with name '" + std::string(bean_name)
                  + "': " + std::string(reason), loc)
    , bean_name_(bean_name)
{}

bean_creation_error::bean_creation_error(std::string_view bean_name,
                                         const std::exception& inner,
                                         std::exception_ptr cause,
                                         std::source_location loc)
    : beans_error("Error creating bean with name '" + std::string(bean_name)
                  + "': " + inner.what(), loc)
    , bean_name_(bean_name)
    , cause_(std::move(cause))
{}

void bean_creation_error::add_related_cause(std::exception_ptr ex) {
    related_causes_.push_back(std::move(ex));
}

std::string bean_creation_error::full_diagnostic() const {
    std::string out = beans_error::full_diagnostic();
    if (related_causes_.empty()) {
        return out;
    }
    out += "\nRelated causes:";
    for (const auto& rc : related_causes_) {
        out += "\n  - " + describe(rc);
    }
    return out;
}

currently_in_creation::currently_in_creation(std::string_view bean_name,
                                             std::source_location loc)
    : bean_creation_error(bean_name,
                          "Requested bean is currently in creation: "
                          "Is there an unresolvable circular reference?", loc)
{}

creation_not_allowed::creation_not_allowed(std::string_view bean_name,
                                           std::string_view reason,
                                           std::source_location loc)
    : bean_creation_error(bean_name, reason, loc)
{}

} // namespace libbeans
