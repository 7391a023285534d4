#pragma once

#include "export.hpp"
#include "fwd.hpp"
#include "function.hpp"

#include <cstddef>
#include <memory>

namespace depscope {

struct bridge_options {
    /// Maximum number of memoized bridges (least recently used evicted
    /// first).  Zero disables memoization.
    std::size_t cache_capacity = 5000;
};

// ---------------------------------------------------------------
// bridge_cache: memoizes bridged callables per original identity
// ---------------------------------------------------------------

class DEPSCOPE_EXPORT bridge_cache {
public:
    explicit bridge_cache(bridge_options options = {});
    ~bridge_cache();

    bridge_cache(const bridge_cache&) = delete;
    bridge_cache& operator=(const bridge_cache&) = delete;

    /// Memoized bridge(); see the free function.
    function_ptr bridge(const function_ptr& fn);

    std::size_t size() const;
    std::size_t capacity() const noexcept;
    void clear();

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/// Process-wide cache used by bridge().
DEPSCOPE_EXPORT bridge_cache& default_bridge_cache();

/// Produce a callable equivalent to @p fn whose visible parameters omit
/// every dependency-default parameter.  Each invocation opens a fresh
/// resolution scope, resolves the dependencies (caller keywords override
/// them and win on merge), invokes @p fn and releases the scope before
/// returning.  A callable without dependencies is returned unchanged.
/// Results are memoized per @p fn in default_bridge_cache().
DEPSCOPE_EXPORT function_ptr bridge(const function_ptr& fn);

/// Build the bridge of @p fn without memoization.
DEPSCOPE_EXPORT function_ptr make_bridge(const function_ptr& fn);

/// Resolve @p fn's dependencies against @p kwargs, invoke it and release
/// the resolution scope.  The body of every bridged callable.
DEPSCOPE_EXPORT value invoke_resolved(const function& fn, const arguments& kwargs);

} // namespace depscope
