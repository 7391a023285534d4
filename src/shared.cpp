#include "depscope/shared.hpp"
#include "depscope/resolution_context.hpp"
#include "log.hpp"

#include <utility>

namespace depscope {

namespace {

// g_active heads a chain linked through shared_context::previous_.
// Writers hold g_chain_mutex; current() reads the head lock-free.
std::atomic<shared_context*> g_active{nullptr};
std::mutex g_chain_mutex;

} // namespace

// ---------------------------------------------------------------
// shared_context
// ---------------------------------------------------------------

shared_context::shared_context() = default;

shared_context::~shared_context() {
    if (!is_open()) return;
    try {
        close();
    } catch (const std::exception& e) {
        DEPSCOPE_LOG_ERROR << "shared scope release failed: " << e.what();
    } catch (...) {
        DEPSCOPE_LOG_ERROR << "shared scope release failed: non-standard exception";
    }
}

shared_context* shared_context::current() noexcept {
    return g_active.load();
}

void shared_context::open() {
    auto expected = shared_state::unopened;
    if (!state_.compare_exchange_strong(expected, shared_state::open)) {
        throw scope_state_error("Shared context cannot be reopened (state: "
                                + std::string(to_string(expected)) + ")");
    }
    std::lock_guard chain(g_chain_mutex);
    previous_ = g_active.load();
    g_active.store(this);
    DEPSCOPE_LOG_TRACE << "shared scope opened";
}

void shared_context::close(std::exception_ptr pending) {
    auto expected = shared_state::open;
    if (!state_.compare_exchange_strong(expected, shared_state::closed)) {
        if (expected == shared_state::closed) return;
        throw scope_state_error("Shared context was never opened");
    }

    std::exception_ptr raised;
    try {
        stack_.close(std::move(pending));
    } catch (...) {
        raised = std::current_exception();
    }

    unlink();
    DEPSCOPE_LOG_TRACE << "shared scope closed (" << size() << " producers released)";

    if (raised) {
        std::rethrow_exception(raised);
    }
}

void shared_context::unlink() {
    std::lock_guard chain(g_chain_mutex);
    if (g_active.load() == this) {
        g_active.store(previous_);
    } else {
        // Closed out of order: splice this context out from under a newer one.
        for (auto* ctx = g_active.load(); ctx; ctx = ctx->previous_) {
            if (ctx->previous_ == this) {
                ctx->previous_ = previous_;
                break;
            }
        }
    }
    previous_ = nullptr;
}

std::optional<value> shared_context::lookup(const producer* key) const {
    std::shared_lock lock(cache_mutex_);
    auto it = resolved_.find(key);
    if (it == resolved_.end()) return std::nullopt;
    return it->second;
}

value shared_context::acquire(const producer& factory, resolution_context& ctx) {
    if (!is_open()) {
        throw no_active_shared_scope(factory.name());
    }

    if (auto hit = lookup(&factory)) {
        return *std::move(hit);
    }

    arguments args = resolve_producer_arguments(factory, ctx, stack_);

    std::lock_guard init(init_mutex_);
    if (auto hit = lookup(&factory)) {
        return *std::move(hit);
    }

    DEPSCOPE_LOG_TRACE << "initializing shared producer '" << factory.name() << "'";
    value resolved = adapt_result(factory(args), stack_);
    {
        std::unique_lock lock(cache_mutex_);
        resolved_.emplace(&factory, resolved);
    }
    return resolved;
}

std::size_t shared_context::size() const {
    std::shared_lock lock(cache_mutex_);
    return resolved_.size();
}

// ---------------------------------------------------------------
// shared_scope
// ---------------------------------------------------------------

shared_scope::shared_scope()
    : context_(std::make_unique<shared_context>())
{
    context_->open();
}

shared_scope::~shared_scope() = default;

shared_scope::shared_scope(shared_scope&&) noexcept = default;
shared_scope& shared_scope::operator=(shared_scope&&) noexcept = default;

void shared_scope::close(std::exception_ptr pending) {
    context_->close(std::move(pending));
}

shared_scope open_shared_scope() {
    return shared_scope();
}

// ---------------------------------------------------------------
// shared_dependency
// ---------------------------------------------------------------

value shared_dependency::enter(resolution_context& ctx) {
    shared_context* scope = ctx.shared();
    if (!scope || !scope->is_open()) {
        throw no_active_shared_scope(factory()->name());
    }
    return scope->acquire(*factory(), ctx);
}

std::shared_ptr<shared_dependency> shared(producer_ptr factory) {
    return std::make_shared<shared_dependency>(std::move(factory));
}

} // namespace depscope
