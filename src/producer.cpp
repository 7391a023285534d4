#include "depscope/producer.hpp"
#include "depscope/exit_stack.hpp"

#include <type_traits>
#include <utility>

namespace depscope {

namespace {

template <typename>
inline constexpr bool unhandled_result_shape = false;

class callable_context_manager : public context_manager {
public:
    callable_context_manager(std::function<value()> enter,
                             std::function<void(std::exception_ptr)> exit)
        : enter_(std::move(enter)), exit_(std::move(exit)) {}

    value enter() override { return enter_(); }

    void exit(std::exception_ptr error) override {
        if (exit_) exit_(std::move(error));
    }

private:
    std::function<value()> enter_;
    std::function<void(std::exception_ptr)> exit_;
};

class callable_async_context_manager : public async_context_manager {
public:
    callable_async_context_manager(std::function<std::future<value>()> enter,
                                   std::function<std::future<void>(std::exception_ptr)> exit)
        : enter_(std::move(enter)), exit_(std::move(exit)) {}

    std::future<value> enter() override { return enter_(); }

    std::future<void> exit(std::exception_ptr error) override {
        if (exit_) return exit_(std::move(error));
        std::promise<void> done;
        done.set_value();
        return done.get_future();
    }

private:
    std::function<std::future<value>()> enter_;
    std::function<std::future<void>(std::exception_ptr)> exit_;
};

} // namespace

std::unique_ptr<context_manager> make_context_manager(
        std::function<value()> enter,
        std::function<void(std::exception_ptr)> exit) {
    return std::make_unique<callable_context_manager>(std::move(enter), std::move(exit));
}

std::unique_ptr<async_context_manager> make_async_context_manager(
        std::function<std::future<value>()> enter,
        std::function<std::future<void>(std::exception_ptr)> exit) {
    return std::make_unique<callable_async_context_manager>(std::move(enter), std::move(exit));
}

value adapt_result(factory_result raw, exit_stack& stack) {
    return std::visit([&stack](auto&& result) -> value {
        using T = std::decay_t<decltype(result)>;
        if constexpr (std::is_same_v<T, std::unique_ptr<async_context_manager>>) {
            return stack.enter_async_context(std::move(result));
        } else if constexpr (std::is_same_v<T, std::unique_ptr<context_manager>>) {
            return stack.enter_context(std::move(result));
        } else if constexpr (std::is_same_v<T, std::future<value>>) {
            return result.get();
        } else if constexpr (std::is_same_v<T, value>) {
            return std::move(result);
        } else {
            static_assert(unhandled_result_shape<T>, "unhandled factory_result alternative");
        }
    }, std::move(raw));
}

producer::producer(std::string name, signature sig, body_fn body)
    : name_(std::move(name))
    , signature_(std::move(sig))
    , body_(std::move(body))
{
    if (!body_) {
        throw depscope_error("Producer body cannot be empty: " + name_);
    }
}

factory_result producer::operator()(const arguments& args) const {
    return body_(args);
}

producer_ptr make_producer(std::string name, producer::body_fn body) {
    return std::make_shared<const producer>(std::move(name), signature{}, std::move(body));
}

producer_ptr make_producer(std::string name, signature sig, producer::body_fn body) {
    return std::make_shared<const producer>(std::move(name), std::move(sig), std::move(body));
}

} // namespace depscope
