#pragma once

#include "export.hpp"
#include "fwd.hpp"
#include "signature.hpp"
#include "value.hpp"

#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <variant>

namespace depscope {

// ---------------------------------------------------------------
// Scoped resources a producer may hand back
// ---------------------------------------------------------------

/// Synchronous scoped resource: enter() yields the value, exit() releases it.
class DEPSCOPE_EXPORT context_manager {
public:
    virtual ~context_manager() = default;
    virtual value enter() = 0;
    virtual void exit(std::exception_ptr error) = 0;
};

/// Asynchronous scoped resource: enter and exit complete eventually.
class DEPSCOPE_EXPORT async_context_manager {
public:
    virtual ~async_context_manager() = default;
    virtual std::future<value> enter() = 0;
    virtual std::future<void> exit(std::exception_ptr error) = 0;
};

/// Build a context_manager from callables.  An empty @p exit releases nothing.
DEPSCOPE_EXPORT std::unique_ptr<context_manager> make_context_manager(
    std::function<value()> enter,
    std::function<void(std::exception_ptr)> exit = {});

/// Build an async_context_manager from callables.  An empty @p exit releases nothing.
DEPSCOPE_EXPORT std::unique_ptr<async_context_manager> make_async_context_manager(
    std::function<std::future<value>()> enter,
    std::function<std::future<void>(std::exception_ptr)> exit = {});

// ---------------------------------------------------------------
// factory_result: every shape a producer may return
// ---------------------------------------------------------------

using factory_result = std::variant<value,
                                    std::future<value>,
                                    std::unique_ptr<context_manager>,
                                    std::unique_ptr<async_context_manager>>;

/// Normalize a producer's result into its value.  Scoped resources are
/// entered into @p stack so their release runs when that stack unwinds;
/// eventual values are awaited.
DEPSCOPE_EXPORT value adapt_result(factory_result raw, exit_stack& stack);

// ---------------------------------------------------------------
// producer: a named factory with its own declared dependencies
// ---------------------------------------------------------------

/// Producers are compared by identity: two producers with identical bodies
/// are cached separately, and one producer declared by several callables
/// is cached once.
class DEPSCOPE_EXPORT producer {
public:
    using body_fn = std::function<factory_result(const arguments&)>;

    producer(std::string name, signature sig, body_fn body);

    producer(const producer&) = delete;
    producer& operator=(const producer&) = delete;

    const std::string& name() const noexcept { return name_; }
    const signature& get_signature() const noexcept { return signature_; }

    factory_result operator()(const arguments& args) const;

private:
    std::string name_;
    signature signature_;
    body_fn body_;
};

DEPSCOPE_EXPORT producer_ptr make_producer(std::string name, producer::body_fn body);
DEPSCOPE_EXPORT producer_ptr make_producer(std::string name, signature sig, producer::body_fn body);

} // namespace depscope
