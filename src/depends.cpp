#include "depscope/depends.hpp"
#include "depscope/exit_stack.hpp"
#include "depscope/resolution_context.hpp"

namespace depscope {

arguments resolve_producer_arguments(const producer& factory,
                                     resolution_context& ctx,
                                     exit_stack& stack) {
    arguments args;
    try {
        for (const auto& [name, dep] : factory.get_signature().dependency_parameters()) {
            args[name] = stack.enter(dep, ctx);
        }
    } catch (depscope_error& e) {
        e.append_resolution_context(factory.name());
        throw;
    }
    return args;
}

producer_dependency::producer_dependency(producer_ptr factory)
    : factory_(std::move(factory))
{
    if (!factory_) {
        throw depscope_error("Dependency producer cannot be null");
    }
}

value scoped_dependency::enter(resolution_context& ctx) {
    const producer& source = *factory();
    if (const value* cached = ctx.find_cached(&source)) {
        return *cached;
    }

    arguments args = resolve_producer_arguments(source, ctx, ctx.stack());
    value resolved = adapt_result(source(args), ctx.stack());
    ctx.store(&source, resolved);
    return resolved;
}

std::shared_ptr<scoped_dependency> depends(producer_ptr factory) {
    return std::make_shared<scoped_dependency>(std::move(factory));
}

} // namespace depscope
