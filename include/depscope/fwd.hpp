#pragma once

/// @file fwd.hpp
/// Forward declarations for all public depscope symbols.
/// Include this header when you only need to name a type (pointers,
/// references, function parameters) without requiring its full definition.

#include "export.hpp"

#include <memory>

namespace depscope {

// value.hpp
struct failed_dependency;

// exceptions.hpp
class depscope_error;
class validation_error;
class no_active_shared_scope;
class scope_state_error;
class argument_error;

// exit_stack.hpp
class exit_stack;

// producer.hpp
class context_manager;
class async_context_manager;
class producer;
using producer_ptr = std::shared_ptr<const producer>;

// dependency.hpp
class dependency;
template <typename Self, typename Base>
class exclusive;

// signature.hpp
struct parameter;
class signature;

// function.hpp
class function;
using function_ptr = std::shared_ptr<const function>;

// resolution_context.hpp
class resolution_context;

// depends.hpp
class producer_dependency;
class scoped_dependency;

// shared.hpp
class shared_context;
class shared_scope;
class shared_dependency;

// resolution.hpp
class resolved_dependencies;

// bridge.hpp
struct bridge_options;
class bridge_cache;

} // namespace depscope
