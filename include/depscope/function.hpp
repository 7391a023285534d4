#pragma once

#include "export.hpp"
#include "fwd.hpp"
#include "signature.hpp"
#include "value.hpp"

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <variant>

namespace depscope {

// ---------------------------------------------------------------
// function: a callable whose parameters may declare dependencies
// ---------------------------------------------------------------

/// A named callable taking keyword arguments.  Its body runs either
/// synchronously or yields an eventual result.  Identity (the address of
/// the function object) is what bridge() memoizes on.
class DEPSCOPE_EXPORT function {
public:
    using sync_body = std::function<value(const arguments&)>;
    using async_body = std::function<std::future<value>(const arguments&)>;

    function(std::string name, signature sig, sync_body body, std::string doc = {});
    function(std::string name, signature sig, async_body body, std::string doc = {});

    function(const function&) = delete;
    function& operator=(const function&) = delete;

    const std::string& name() const noexcept { return name_; }
    const std::string& doc() const noexcept { return doc_; }
    const signature& get_signature() const noexcept { return signature_; }
    bool is_async() const noexcept { return std::holds_alternative<async_body>(body_); }

    /// Run the body, waiting for an asynchronous one to finish.
    value call(const arguments& args) const;

    /// Run the body; a synchronous body's result comes back ready.
    std::future<value> call_async(const arguments& args) const;

private:
    std::string name_;
    std::string doc_;
    signature signature_;
    std::variant<sync_body, async_body> body_;
};

DEPSCOPE_EXPORT function_ptr make_function(std::string name, signature sig,
                                           function::sync_body body,
                                           std::string doc = {});

DEPSCOPE_EXPORT function_ptr make_async_function(std::string name, signature sig,
                                                 function::async_body body,
                                                 std::string doc = {});

// ---------------------------------------------------------------
// Declaration introspection, cached once per declaration
// ---------------------------------------------------------------

DEPSCOPE_EXPORT const dependency_parameter_map& get_dependency_parameters(const function& fn) noexcept;
DEPSCOPE_EXPORT const dependency_parameter_map& get_dependency_parameters(const producer& factory) noexcept;

/// Never throws; empty when no parameter carries metadata dependencies.
DEPSCOPE_EXPORT const annotation_dependency_map& get_annotation_dependencies(const function& fn) noexcept;
DEPSCOPE_EXPORT const annotation_dependency_map& get_annotation_dependencies(const producer& factory) noexcept;

DEPSCOPE_EXPORT signature get_visible_signature(const function& fn);

} // namespace depscope
