#pragma once

#include "export.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <source_location>
#include <typeindex>
#include <vector>

namespace depscope {

namespace internal {
/// Demangle a type_index to human-readable name (GCC/Clang ABI-based).
DEPSCOPE_EXPORT std::string demangle(std::type_index type);
} // namespace internal

/// Base of every error the engine raises.  The message ends with the
/// throw site as " [at file.cpp:line]"; producers the error propagated
/// through are appended as " (while resolving inner -> outer)".
class DEPSCOPE_EXPORT depscope_error : public std::runtime_error {
public:
    explicit depscope_error(const std::string& message,
                            std::source_location loc = std::source_location::current());

    const std::source_location& location() const noexcept { return location_; }

    /// Extra lines shown by full_diagnostic() only, such as the declaration
    /// stacktraces of conflicting descriptors.
    void set_diagnostic_detail(std::string detail);
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    std::string full_diagnostic() const;

    /// Record that the error escaped while entering @p producer_name's
    /// dependencies.  Called once per producer boundary, innermost first.
    void append_resolution_context(const std::string& producer_name);

    /// Producers the error crossed, innermost first.
    const std::vector<std::string>& resolution_path() const noexcept { return resolution_path_; }

    const char* what() const noexcept override;

private:
    void render();

    std::source_location location_;
    std::string base_message_;
    std::string message_;
    std::string diagnostic_detail_;
    std::vector<std::string> resolution_path_;
};

/// Raised by validate_dependencies when more than one exclusive descriptor
/// of a type (or of a shared exclusive ancestor) is declared.
class DEPSCOPE_EXPORT validation_error : public depscope_error {
public:
    validation_error(std::string_view message,
                     std::type_index offending_type,
                     std::vector<std::type_index> conflicting_types,
                     std::source_location loc = std::source_location::current());

    /// The exact type, or the shared ancestor, named by the message.
    std::type_index offending_type() const noexcept { return offending_type_; }

    /// Runtime types of every descriptor involved in the conflict.
    const std::vector<std::type_index>& conflicting_types() const noexcept {
        return conflicting_types_;
    }

private:
    std::type_index offending_type_;
    std::vector<std::type_index> conflicting_types_;
};

/// A shared dependency was requested while no shared scope is open.
class DEPSCOPE_EXPORT no_active_shared_scope : public depscope_error {
public:
    explicit no_active_shared_scope(std::string_view producer_name,
                                    std::source_location loc = std::source_location::current());
};

class DEPSCOPE_EXPORT scope_state_error : public depscope_error {
public:
    explicit scope_state_error(std::string_view message,
                               std::source_location loc = std::source_location::current());
};

class DEPSCOPE_EXPORT argument_error : public depscope_error {
public:
    argument_error(std::string_view parameter, std::string_view reason,
                   std::source_location loc = std::source_location::current());

    const std::string& parameter() const noexcept { return parameter_; }

private:
    std::string parameter_;
};

} // namespace depscope
