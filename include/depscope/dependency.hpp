#pragma once

#include "export.hpp"
#include "fwd.hpp"
#include "value.hpp"

#include <any>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace depscope {

namespace internal {
/// Capture the current call stack (empty when stacktrace support is off).
DEPSCOPE_EXPORT std::any capture_stacktrace();
} // namespace internal

// ---------------------------------------------------------------
// dependency: capability every resolvable entity implements
// ---------------------------------------------------------------

/// Base class for all injectable dependencies.
///
/// The engine enters each dependency into a release stack: enter() produces
/// the injected value and exit() runs when the owning scope unwinds, last
/// entered first.  Dependencies are owned through std::shared_ptr.
///
/// Derive through exclusive<Self, Base> to allow at most one instance of
/// that type (or of any type deriving from it) per callable.
class DEPSCOPE_EXPORT dependency : public std::enable_shared_from_this<dependency> {
public:
    dependency();
    dependency(const dependency&);
    dependency& operator=(const dependency&);
    virtual ~dependency();

    /// Acquire the value within the given resolution scope.
    virtual value enter(resolution_context& ctx) = 0;

    /// Release whatever enter() acquired.  @p error is the exception the
    /// scope is unwinding with, or null.  Default does nothing.
    virtual void exit(std::exception_ptr error);

    /// Return an instance bound to a parameter's name and final value
    /// (empty when the parameter has none).  Called for metadata
    /// dependencies; the default returns this instance unchanged.
    virtual std::shared_ptr<dependency> bind_to_parameter(std::string_view name,
                                                          const value& final_value);

    /// Append the exclusive types this instance belongs to, most-derived
    /// first.  Implemented by exclusive<>.
    virtual void collect_exclusive_types(std::vector<std::type_index>& out) const;

    std::vector<std::type_index> exclusive_types() const;
    bool is_exclusive() const;

    std::type_index runtime_type() const noexcept { return typeid(*this); }

    /// Stack captured where this dependency was declared (see stacktrace support).
    const std::any& declaration_stacktrace() const noexcept { return declaration_stacktrace_; }

private:
    std::any declaration_stacktrace_;
};

/// Marks Self as exclusive: at most one dependency whose runtime type is, or
/// derives from, Self may appear across one callable's dependencies.
///
///   struct runtime : exclusive<runtime> { ... };
///   struct timeout : exclusive<timeout, runtime> { ... };
template <typename Self, typename Base = dependency>
class exclusive : public Base {
public:
    using Base::Base;

    void collect_exclusive_types(std::vector<std::type_index>& out) const override {
        out.push_back(std::type_index(typeid(Self)));
        Base::collect_exclusive_types(out);
    }
};

} // namespace depscope
