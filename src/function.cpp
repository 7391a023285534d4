#include "depscope/function.hpp"
#include "depscope/producer.hpp"

#include <utility>

namespace depscope {

function::function(std::string name, signature sig, sync_body body, std::string doc)
    : name_(std::move(name))
    , doc_(std::move(doc))
    , signature_(std::move(sig))
    , body_(std::move(body))
{
    if (!std::get<sync_body>(body_)) {
        throw depscope_error("Function body cannot be empty: " + name_);
    }
}

function::function(std::string name, signature sig, async_body body, std::string doc)
    : name_(std::move(name))
    , doc_(std::move(doc))
    , signature_(std::move(sig))
    , body_(std::move(body))
{
    if (!std::get<async_body>(body_)) {
        throw depscope_error("Function body cannot be empty: " + name_);
    }
}

value function::call(const arguments& args) const {
    if (const auto* body = std::get_if<sync_body>(&body_)) {
        return (*body)(args);
    }
    return std::get<async_body>(body_)(args).get();
}

std::future<value> function::call_async(const arguments& args) const {
    if (const auto* body = std::get_if<async_body>(&body_)) {
        return (*body)(args);
    }
    std::promise<value> result;
    try {
        result.set_value(std::get<sync_body>(body_)(args));
    } catch (...) {
        result.set_exception(std::current_exception());
    }
    return result.get_future();
}

function_ptr make_function(std::string name, signature sig,
                           function::sync_body body, std::string doc) {
    return std::make_shared<const function>(std::move(name), std::move(sig),
                                            std::move(body), std::move(doc));
}

function_ptr make_async_function(std::string name, signature sig,
                                 function::async_body body, std::string doc) {
    return std::make_shared<const function>(std::move(name), std::move(sig),
                                            std::move(body), std::move(doc));
}

const dependency_parameter_map& get_dependency_parameters(const function& fn) noexcept {
    return fn.get_signature().dependency_parameters();
}

const dependency_parameter_map& get_dependency_parameters(const producer& factory) noexcept {
    return factory.get_signature().dependency_parameters();
}

const annotation_dependency_map& get_annotation_dependencies(const function& fn) noexcept {
    return fn.get_signature().annotation_dependencies();
}

const annotation_dependency_map& get_annotation_dependencies(const producer& factory) noexcept {
    return factory.get_signature().annotation_dependencies();
}

signature get_visible_signature(const function& fn) {
    return fn.get_signature().visible();
}

} // namespace depscope
