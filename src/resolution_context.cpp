#include "depscope/resolution_context.hpp"
#include "depscope/shared.hpp"

namespace depscope {

resolution_context::resolution_context()
    : shared_(shared_context::current())
{}

resolution_context::resolution_context(shared_context* shared) noexcept
    : shared_(shared)
{}

const value* resolution_context::find_cached(const producer* key) const {
    auto it = cache_.find(key);
    return it == cache_.end() ? nullptr : &it->second;
}

void resolution_context::store(const producer* key, value resolved) {
    cache_.insert_or_assign(key, std::move(resolved));
}

} // namespace depscope
