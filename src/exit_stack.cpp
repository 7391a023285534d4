#include "depscope/exit_stack.hpp"
#include "depscope/dependency.hpp"
#include "depscope/producer.hpp"
#include "log.hpp"

#include <utility>

namespace depscope {

exit_stack::exit_stack() = default;

exit_stack::~exit_stack() {
    if (closed()) return;
    try {
        close();
    } catch (const std::exception& e) {
        DEPSCOPE_LOG_ERROR << "release failed while unwinding: " << e.what();
    } catch (...) {
        DEPSCOPE_LOG_ERROR << "release failed while unwinding: non-standard exception";
    }
}

void exit_stack::push(release_fn release) {
    std::lock_guard lock(mutex_);
    if (closed_) {
        throw scope_state_error("Cannot register a release on a closed scope");
    }
    entries_.push_back(std::move(release));
}

value exit_stack::enter(const std::shared_ptr<dependency>& dep, resolution_context& ctx) {
    value entered = dep->enter(ctx);
    push([dep](std::exception_ptr error) { dep->exit(std::move(error)); });
    return entered;
}

value exit_stack::enter_context(std::unique_ptr<context_manager> resource) {
    std::shared_ptr<context_manager> owned(std::move(resource));
    value entered = owned->enter();
    push([owned](std::exception_ptr error) { owned->exit(std::move(error)); });
    return entered;
}

value exit_stack::enter_async_context(std::unique_ptr<async_context_manager> resource) {
    std::shared_ptr<async_context_manager> owned(std::move(resource));
    value entered = owned->enter().get();
    push([owned](std::exception_ptr error) { owned->exit(std::move(error)).get(); });
    return entered;
}

void exit_stack::close(std::exception_ptr pending) {
    std::vector<release_fn> entries;
    {
        std::lock_guard lock(mutex_);
        if (closed_) return;
        closed_ = true;
        entries.swap(entries_);
    }

    std::exception_ptr raised;
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        try {
            (*it)(raised ? raised : pending);
        } catch (...) {
            raised = std::current_exception();
        }
    }
    if (raised) {
        std::rethrow_exception(raised);
    }
}

std::size_t exit_stack::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

bool exit_stack::closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

} // namespace depscope
