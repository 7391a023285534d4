#pragma once

#include "export.hpp"
#include "exceptions.hpp"

#include <any>
#include <exception>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <typeindex>

namespace depscope {

/// Boxed resolved value.  Values are copied out of caches, so producers that
/// need every consumer to observe one object box a std::shared_ptr.
using value = std::any;

/// Keyword arguments, and the resolved-arguments map of a call.
using arguments = std::map<std::string, value, std::less<>>;

// ---------------------------------------------------------------
// failed_dependency: marker stored in place of a scoped value
// whose producer threw during resolution
// ---------------------------------------------------------------

struct DEPSCOPE_EXPORT failed_dependency {
    std::string parameter;
    std::exception_ptr error;

    /// what() of the captured error.
    std::string message() const;
};

/// Returns the marker held by @p v, or nullptr when @p v is a real value.
inline const failed_dependency* as_failed(const value& v) noexcept {
    return std::any_cast<failed_dependency>(&v);
}

/// Read a typed argument.  Throws argument_error when the argument is
/// missing, holds another type, or holds a failed_dependency marker.
template <typename T>
const T& get(const arguments& args, std::string_view name) {
    auto it = args.find(name);
    if (it == args.end()) {
        throw argument_error(name, "is missing");
    }
    if (const T* typed = std::any_cast<T>(&it->second)) {
        return *typed;
    }
    if (const auto* failed = as_failed(it->second)) {
        throw argument_error(name, "holds a failed dependency: " + failed->message());
    }
    if (!it->second.has_value()) {
        throw argument_error(name, "is empty");
    }
    throw argument_error(name, "holds " + internal::demangle(it->second.type())
                               + ", expected " + internal::demangle(typeid(T)));
}

} // namespace depscope
