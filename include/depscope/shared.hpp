#pragma once

#include "export.hpp"
#include "fwd.hpp"
#include "depends.hpp"
#include "exit_stack.hpp"
#include "value.hpp"

#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <unordered_map>

namespace depscope {

enum class shared_state {
    unopened,
    open,
    closed
};

constexpr std::string_view to_string(shared_state s) noexcept {
    constexpr std::string_view names[] = {"unopened", "open", "closed"};
    return names[static_cast<int>(s)];
}

// ---------------------------------------------------------------
// shared_context: long-lived scope for shared dependencies
// ---------------------------------------------------------------

/// Caches shared producers across every resolution scope that runs while
/// it is open, and releases their resources, last acquired first, when it
/// closes.  Opening installs the context as the active one for the process;
/// closing restores whichever context was active before.  Contexts may close
/// in any order: one closed while a newer context is active is unlinked from
/// the chain, so current() never yields a closed context.
class DEPSCOPE_EXPORT shared_context {
public:
    shared_context();

    /// Closes the context if still open.  Release failures are logged.
    ~shared_context();

    shared_context(const shared_context&) = delete;
    shared_context& operator=(const shared_context&) = delete;

    void open();
    void close(std::exception_ptr pending = nullptr);

    shared_state state() const noexcept { return state_.load(); }
    bool is_open() const noexcept { return state() == shared_state::open; }

    /// Value of @p factory in this context, initializing it exactly once.
    /// The producer's own dependencies are entered into this context's
    /// release stack.  Throws no_active_shared_scope unless open.
    value acquire(const producer& factory, resolution_context& ctx);

    /// Number of producers initialized so far.
    std::size_t size() const;

    /// The open context installed most recently, or nullptr.
    static shared_context* current() noexcept;

private:
    std::optional<value> lookup(const producer* key) const;
    void unlink();

    std::atomic<shared_state> state_{shared_state::unopened};
    mutable std::shared_mutex cache_mutex_;
    std::unordered_map<const producer*, value> resolved_;
    std::mutex init_mutex_;
    exit_stack stack_;
    shared_context* previous_ = nullptr;
};

/// RAII handle over an open shared_context; closes it on destruction.
class DEPSCOPE_EXPORT shared_scope {
public:
    shared_scope();
    ~shared_scope();

    shared_scope(shared_scope&&) noexcept;
    shared_scope& operator=(shared_scope&&) noexcept;

    shared_context& context() noexcept { return *context_; }

    /// Close now, propagating release failures.
    void close(std::exception_ptr pending = nullptr);

private:
    std::unique_ptr<shared_context> context_;
};

/// Open a new shared scope and make it the active one.
[[nodiscard]] DEPSCOPE_EXPORT shared_scope open_shared_scope();

// ---------------------------------------------------------------
// shared_dependency
// ---------------------------------------------------------------

/// Dependency resolved once per shared scope and reused by every call made
/// while that scope is open.  Identity is the producer: every shared()
/// declaration of one producer resolves to the same value.
class DEPSCOPE_EXPORT shared_dependency : public producer_dependency {
public:
    using producer_dependency::producer_dependency;

    value enter(resolution_context& ctx) override;
};

/// Declare a shared dependency on @p factory.
DEPSCOPE_EXPORT std::shared_ptr<shared_dependency> shared(producer_ptr factory);

} // namespace depscope
