#pragma once

#include "export.hpp"
#include "fwd.hpp"
#include "dependency.hpp"
#include "producer.hpp"

#include <memory>

namespace depscope {

/// Enter each of @p factory's own dependencies into @p stack, yielding the
/// keyword arguments to invoke it with.  Engine errors raised on the way
/// get the producer's name appended to their resolution context.
DEPSCOPE_EXPORT arguments resolve_producer_arguments(const producer& factory,
                                                     resolution_context& ctx,
                                                     exit_stack& stack);

/// Base for dependencies that wrap a producer.
class DEPSCOPE_EXPORT producer_dependency : public dependency {
public:
    explicit producer_dependency(producer_ptr factory);

    const producer_ptr& factory() const noexcept { return factory_; }

private:
    producer_ptr factory_;
};

/// Call-scoped dependency: the producer runs at most once per resolution
/// scope, and every parameter declaring it receives that one value.
class DEPSCOPE_EXPORT scoped_dependency : public producer_dependency {
public:
    using producer_dependency::producer_dependency;

    value enter(resolution_context& ctx) override;
};

/// Declare a call-scoped dependency on @p factory.
DEPSCOPE_EXPORT std::shared_ptr<scoped_dependency> depends(producer_ptr factory);

} // namespace depscope
