#pragma once

#include "export.hpp"
#include "fwd.hpp"
#include "exit_stack.hpp"
#include "value.hpp"

#include <unordered_map>

namespace depscope {

// ---------------------------------------------------------------
// resolution_context: state of one resolution scope
// ---------------------------------------------------------------

/// One per engine call.  Owns the producer -> value cache and the release
/// stack of that call, and remembers which shared scope was active when
/// the call began.  Threaded explicitly through every dependency::enter,
/// so concurrent calls never observe each other's state.
class DEPSCOPE_EXPORT resolution_context {
public:
    /// Binds to the shared scope active at construction (if any).
    resolution_context();
    explicit resolution_context(shared_context* shared) noexcept;

    resolution_context(const resolution_context&) = delete;
    resolution_context& operator=(const resolution_context&) = delete;

    exit_stack& stack() noexcept { return stack_; }

    /// Cached value for @p key, or nullptr.
    const value* find_cached(const producer* key) const;
    void store(const producer* key, value resolved);

    /// The shared scope captured at construction, or nullptr.
    shared_context* shared() const noexcept { return shared_; }

private:
    std::unordered_map<const producer*, value> cache_;
    exit_stack stack_;
    shared_context* shared_;
};

} // namespace depscope
