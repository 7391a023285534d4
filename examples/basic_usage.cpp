/// basic_usage.cpp: depscope introductory example.
///
/// Demonstrates the declare, bridge and call workflow:
///   1. Write producers; a producer may declare dependencies of its own.
///   2. Declare a handler whose parameters default to depends() or shared().
///   3. Validate the declarations, then bridge the handler.
///   4. Call the bridge inside a shared scope; only caller arguments are passed.

#include <depscope.hpp>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

using namespace depscope;

// -----------------------------------------------------------------------
// Producers
// -----------------------------------------------------------------------

struct connection_pool {
    std::string url;
    int checkouts = 0;
};

// Shared: built once per shared scope, closed when the scope closes.
producer_ptr make_pool_producer() {
    auto host = make_producer("get_host", [](const arguments&) -> factory_result {
        return value(std::string("localhost"));
    });

    return make_producer("open_pool", {parameter("host", depends(host))},
        [](const arguments& args) -> factory_result {
            auto url = "postgres://" + depscope::get<std::string>(args, "host") + ":5432";
            return make_context_manager(
                [url] {
                    std::cout << "[pool] open " << url << '\n';
                    return value(std::make_shared<connection_pool>(connection_pool{url}));
                },
                [](std::exception_ptr) { std::cout << "[pool] closed\n"; });
        });
}

// Scoped: one per call, released before the call returns.
producer_ptr make_transaction_producer(producer_ptr pool) {
    return make_producer("begin_transaction", {parameter("pool", shared(pool))},
        [](const arguments& args) -> factory_result {
            auto p = depscope::get<std::shared_ptr<connection_pool>>(args, "pool");
            int id = ++p->checkouts;
            return make_context_manager(
                [id] {
                    std::cout << "  [tx " << id << "] begin\n";
                    return value(id);
                },
                [id](std::exception_ptr error) {
                    std::cout << "  [tx " << id << "] " << (error ? "rollback" : "commit") << '\n';
                });
        });
}

// Tag-bound: observes the parameter it annotates, injects nothing.
class audit : public dependency {
public:
    value enter(resolution_context&) override {
        std::cout << "  [audit] " << parameter_ << " = " << describe() << '\n';
        return {};
    }

    std::shared_ptr<dependency> bind_to_parameter(std::string_view name,
                                                  const value& final_value) override {
        auto bound = std::make_shared<audit>(*this);
        bound->parameter_ = std::string(name);
        bound->value_ = final_value;
        return bound;
    }

private:
    std::string describe() const {
        if (const auto* s = std::any_cast<std::string>(&value_)) return *s;
        return "<unset>";
    }

    std::string parameter_;
    value value_;
};

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main() {
    set_log_level(log_level::warning);

    // ── Declaration phase ─────────────────────────────────────────────
    auto pool = make_pool_producer();
    auto transaction = make_transaction_producer(pool);

    auto handler = make_function("create_user",
        {parameter("username").annotate(std::make_shared<audit>()),
         parameter("tx", depends(transaction)),
         parameter("pool", shared(pool))},
        [](const arguments& args) {
            auto user = depscope::get<std::string>(args, "username");
            auto tx = depscope::get<int>(args, "tx");
            std::cout << "  created " << user << " in tx " << tx << '\n';
            return value(user);
        },
        "Insert a user row.");

    validate_dependencies(*handler);

    // ── Bridging phase ────────────────────────────────────────────────
    auto create_user = bridge(handler);
    assert(create_user == bridge(handler) && "bridges are memoized");
    std::cout << create_user->name() << " takes " << create_user->get_signature().size()
              << " argument(s): " << create_user->doc() << '\n';

    // ── Call phase ────────────────────────────────────────────────────
    {
        auto scope = open_shared_scope();
        create_user->call({{"username", value(std::string("alice"))}});
        create_user->call({{"username", value(std::string("bob"))}});
    }
    // Shared scope closed here; the pool is released once.

    std::cout << "Done.\n";
    return 0;
}
