#pragma once

#include "export.hpp"
#include "fwd.hpp"
#include "value.hpp"

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace depscope {

// ---------------------------------------------------------------
// exit_stack: release stack unwound in reverse acquisition order
// ---------------------------------------------------------------

/// Ordered record of acquired resources.  Every entry receives the error
/// the scope is unwinding with (null on normal exit).  A release that
/// throws replaces that error for the entries below it, and close()
/// rethrows it once the whole stack has unwound.
///
/// Pushes are synchronized: a shared scope's stack is fed by concurrent
/// resolutions.
class DEPSCOPE_EXPORT exit_stack {
public:
    using release_fn = std::function<void(std::exception_ptr)>;

    exit_stack();

    /// Unwinds a stack that was never closed.  Release failures are logged.
    ~exit_stack();

    exit_stack(const exit_stack&) = delete;
    exit_stack& operator=(const exit_stack&) = delete;

    /// Register a release callback.  Throws scope_state_error once closed.
    void push(release_fn release);

    /// Enter a dependency and register its exit.
    value enter(const std::shared_ptr<dependency>& dep, resolution_context& ctx);

    /// Enter a synchronous scoped resource and register its exit.
    value enter_context(std::unique_ptr<context_manager> resource);

    /// Enter an asynchronous scoped resource, waiting on its enter and exit.
    value enter_async_context(std::unique_ptr<async_context_manager> resource);

    /// Unwind all entries, last acquired first.  Idempotent.
    void close(std::exception_ptr pending = nullptr);

    std::size_t size() const;
    bool closed() const;

private:
    mutable std::mutex mutex_;
    std::vector<release_fn> entries_;
    bool closed_ = false;
};

} // namespace depscope
