#include "depscope/bridge.hpp"
#include "depscope/resolution.hpp"
#include "log.hpp"

#include <future>
#include <list>
#include <mutex>
#include <unordered_map>

namespace depscope {

// ---------------------------------------------------------------
// Bridged invocation
// ---------------------------------------------------------------

value invoke_resolved(const function& fn, const arguments& kwargs) {
    resolved_dependencies scope(fn, kwargs);

    arguments all = scope.resolved();
    for (const auto& [name, v] : kwargs) {
        all.insert_or_assign(name, v);
    }

    value result;
    try {
        result = fn.call(all);
    } catch (...) {
        scope.close(std::current_exception());
        throw;
    }
    scope.close();
    return result;
}

function_ptr make_bridge(const function_ptr& fn) {
    if (!fn) {
        throw depscope_error("Cannot bridge a null function");
    }
    if (!fn->get_signature().has_dependencies()) {
        return fn;
    }

    // Metadata stays with the original; the bridge itself declares nothing.
    std::vector<parameter> visible;
    for (const auto& p : fn->get_signature().parameters()) {
        if (!p.default_dependency) visible.emplace_back(p.name);
    }

    function_ptr original = fn;
    if (original->is_async()) {
        return make_async_function(
            original->name(), signature(std::move(visible)),
            [original](const arguments& kwargs) -> std::future<value> {
                return std::async(std::launch::deferred, [original, kwargs] {
                    return invoke_resolved(*original, kwargs);
                });
            },
            original->doc());
    }
    return make_function(
        original->name(), signature(std::move(visible)),
        [original](const arguments& kwargs) { return invoke_resolved(*original, kwargs); },
        original->doc());
}

// ---------------------------------------------------------------
// bridge_cache
// ---------------------------------------------------------------

struct bridge_cache::impl {
    struct entry {
        function_ptr original;
        function_ptr bridged;
    };

    explicit impl(bridge_options opts) : options(opts) {}

    bridge_options options;
    mutable std::mutex mutex;
    std::list<entry> recency;  // most recently used first
    std::unordered_map<const function*, std::list<entry>::iterator> index;
};

bridge_cache::bridge_cache(bridge_options options)
    : impl_(std::make_unique<impl>(options))
{}

bridge_cache::~bridge_cache() = default;

function_ptr bridge_cache::bridge(const function_ptr& fn) {
    if (!fn) {
        throw depscope_error("Cannot bridge a null function");
    }
    if (!fn->get_signature().has_dependencies()) {
        return fn;
    }
    if (impl_->options.cache_capacity == 0) {
        return make_bridge(fn);
    }

    std::lock_guard lock(impl_->mutex);
    if (auto it = impl_->index.find(fn.get()); it != impl_->index.end()) {
        impl_->recency.splice(impl_->recency.begin(), impl_->recency, it->second);
        return it->second->bridged;
    }

    impl_->recency.push_front({fn, make_bridge(fn)});
    impl_->index.emplace(fn.get(), impl_->recency.begin());

    while (impl_->recency.size() > impl_->options.cache_capacity) {
        const auto& victim = impl_->recency.back();
        DEPSCOPE_LOG_TRACE << "evicting bridge of " << victim.original->name();
        impl_->index.erase(victim.original.get());
        impl_->recency.pop_back();
    }
    return impl_->recency.front().bridged;
}

std::size_t bridge_cache::size() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->recency.size();
}

std::size_t bridge_cache::capacity() const noexcept {
    return impl_->options.cache_capacity;
}

void bridge_cache::clear() {
    std::lock_guard lock(impl_->mutex);
    impl_->index.clear();
    impl_->recency.clear();
}

bridge_cache& default_bridge_cache() {
    static bridge_cache cache;
    return cache;
}

function_ptr bridge(const function_ptr& fn) {
    return default_bridge_cache().bridge(fn);
}

} // namespace depscope
