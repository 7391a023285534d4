#pragma once

#include "export.hpp"
#include "fwd.hpp"
#include "resolution_context.hpp"
#include "value.hpp"

#include <exception>
#include <vector>

namespace depscope {

// ---------------------------------------------------------------
// resolved_dependencies: one resolution pass over a callable
// ---------------------------------------------------------------

/// Resolves every dependency declared by @p fn on construction and owns the
/// resolution scope until destroyed or closed.
///
///   * Parameters present in @p overrides are passed through; their
///     dependency is never entered.
///   * A scoped dependency that throws leaves a failed_dependency marker
///     in resolved() instead of aborting the pass.  Engine misuse
///     (no_active_shared_scope) is never captured.
///   * Metadata dependencies are bound to each parameter's final value and
///     entered after all default dependencies; their failures propagate.
///
/// Acquired resources are released in reverse acquisition order when the
/// object is closed or destroyed, including when construction throws.
class DEPSCOPE_EXPORT resolved_dependencies {
public:
    explicit resolved_dependencies(const function& fn, const arguments& overrides = {});

    resolved_dependencies(const resolved_dependencies&) = delete;
    resolved_dependencies& operator=(const resolved_dependencies&) = delete;

    /// Parameter name -> resolved value (or failed_dependency marker).
    const arguments& resolved() const noexcept { return resolved_; }

    /// Markers of every scoped dependency that failed.
    std::vector<const failed_dependency*> failures() const;

    resolution_context& context() noexcept { return ctx_; }

    /// Release everything acquired, propagating release failures.
    void close(std::exception_ptr pending = nullptr);

private:
    void resolve(const function& fn, const arguments& overrides);

    resolution_context ctx_;
    arguments resolved_;
};

} // namespace depscope
