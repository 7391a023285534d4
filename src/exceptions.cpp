#include "depscope/exceptions.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>
#include <typeindex>

#if defined(__GNUC__)
#include <cxxabi.h>
#endif

namespace depscope {

namespace internal {

std::string demangle(std::type_index type) {
#if defined(__GNUC__)
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status),
        &std::free);
    if (status == 0 && demangled) {
        return std::string(demangled.get());
    }
#endif
    return std::string(type.name());
}

} // namespace internal

namespace {

std::string_view file_basename(std::string_view path) {
    auto slash = path.find_last_of("/\\");
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

std::string with_location(const std::string& msg, const std::source_location& loc) {
    return msg + " [at " + std::string(file_basename(loc.file_name())) + ":"
           + std::to_string(loc.line()) + "]";
}

} // namespace

depscope_error::depscope_error(const std::string& message, std::source_location loc)
    : std::runtime_error(message)
    , location_(loc)
    , base_message_(with_location(message, loc))
    , message_(base_message_)
{}

void depscope_error::set_diagnostic_detail(std::string detail) {
    diagnostic_detail_ = std::move(detail);
}

void depscope_error::append_resolution_context(const std::string& producer_name) {
    resolution_path_.push_back(producer_name);
    render();
}

void depscope_error::render() {
    message_ = base_message_;
    if (resolution_path_.empty()) return;

    message_ += " (while resolving ";
    for (std::size_t i = 0; i < resolution_path_.size(); ++i) {
        if (i > 0) message_ += " -> ";
        message_ += resolution_path_[i];
    }
    message_ += ")";
}

const char* depscope_error::what() const noexcept {
    return message_.c_str();
}

std::string depscope_error::full_diagnostic() const {
    if (diagnostic_detail_.empty()) {
        return message_;
    }
    return message_ + "\n" + diagnostic_detail_;
}

validation_error::validation_error(std::string_view message,
                                   std::type_index offending_type,
                                   std::vector<std::type_index> conflicting_types,
                                   std::source_location loc)
    : depscope_error(std::string(message), loc)
    , offending_type_(offending_type)
    , conflicting_types_(std::move(conflicting_types))
{}

no_active_shared_scope::no_active_shared_scope(std::string_view producer_name,
                                               std::source_location loc)
    : depscope_error("Shared dependency '" + std::string(producer_name)
                     + "' requested outside of an open shared scope", loc)
{}

scope_state_error::scope_state_error(std::string_view message,
                                     std::source_location loc)
    : depscope_error(std::string(message), loc)
{}

argument_error::argument_error(std::string_view parameter,
                               std::string_view reason,
                               std::source_location loc)
    : depscope_error("Argument '" + std::string(parameter) + "' " + std::string(reason), loc)
    , parameter_(parameter)
{}

} // namespace depscope
