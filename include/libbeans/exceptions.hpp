#pragma once

#include "export.hpp"

#include <exception>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace libbeans {

class LIBBEANS_EXPORT beans_error : public std::runtime_error {
public:
    explicit beans_error(const std::string& message,
                         std::source_location loc = std::source_location::current());

    const std::source_location& location() const noexcept { return location_; }

    /// Set extended diagnostic detail (e.g. registration stacktrace).
    void set_diagnostic_detail(std::string detail);

    /// Get extended diagnostic detail (empty if none).
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    /// Return what() plus diagnostic detail (if present), separated by newline.
    virtual std::string full_diagnostic() const;

    /// Append creation context to this exception.  When a factory throws
    /// while another bean is being created, each enclosing get_or_create()
    /// appends its bean name so that what() shows the whole chain, e.g.:
    ///   "... (while creating 'b' -> 'a')"
    void append_creation_context(std::string_view bean_name);

    /// Override to append creation context (if any) to the base message.
    const char* what() const noexcept override;

private:
    std::source_location location_;
    std::string diagnostic_detail_;
    std::string creation_context_;
    mutable std::string cached_what_;

    static std::string format_message(const std::string& msg,
                                      const std::source_location& loc);
};

/// The registry (or a factory) found the registry in a state that makes
/// the requested step impossible.  Also used for internal consistency
/// violations, which indicate a bug rather than a usage error.
class LIBBEANS_EXPORT illegal_state : public beans_error {
public:
    using beans_error::beans_error;
};

class LIBBEANS_EXPORT duplicate_registration : public illegal_state {
public:
    explicit duplicate_registration(std::string_view bean_name,
                                    std::source_location loc = std::source_location::current());

    const std::string& bean_name() const noexcept { return bean_name_; }

private:
    std::string bean_name_;
};

/// Construction of a bean failed.  Secondary failures observed during the
/// same creation attempt are attached as related causes.
class LIBBEANS_EXPORT bean_creation_error : public beans_error {
public:
    bean_creation_error(std::string_view bean_name, std::string_view reason,
                        std::source_location loc = std::source_location::current());

    /// Wrap a foreign exception thrown by a factory.
    bean_creation_error(std::string_view bean_name, const std::exception& inner,
                        std::exception_ptr cause,
                        std::source_location loc = std::source_location::current());

    const std::string& bean_name() const noexcept { return bean_name_; }

    /// The wrapped factory exception, if this error wraps one.
    std::exception_ptr cause() const noexcept { return cause_; }

    void add_related_cause(std::exception_ptr ex);
    const std::vector<std::exception_ptr>& related_causes() const noexcept { return related_causes_; }

    /// what(), diagnostic detail and one line per related cause.
    std::string full_diagnostic() const override;

private:
    std::string bean_name_;
    std::exception_ptr cause_;
    std::vector<std::exception_ptr> related_causes_;
};

/// Re-entrant creation of a bean without early-exposure support, i.e. an
/// unresolvable circular reference.
class LIBBEANS_EXPORT currently_in_creation : public bean_creation_error {
public:
    explicit currently_in_creation(std::string_view bean_name,
                                   std::source_location loc = std::source_location::current());
};

/// Creation attempted while destroy_all() is running.
class LIBBEANS_EXPORT creation_not_allowed : public bean_creation_error {
public:
    creation_not_allowed(std::string_view bean_name, std::string_view reason,
                         std::source_location loc = std::source_location::current());
};

} // namespace libbeans
