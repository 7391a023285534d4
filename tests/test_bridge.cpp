#include <catch2/catch_test_macros.hpp>
#include <depscope.hpp>

#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace depscope;

namespace {

using event_log = std::shared_ptr<std::vector<std::string>>;

producer_ptr constant(std::string name, std::string result) {
    return make_producer(std::move(name), [result](const arguments&) -> factory_result {
        return value(result);
    });
}

producer_ptr tracked_resource(std::string label, event_log log) {
    return make_producer(label, [label, log](const arguments&) -> factory_result {
        return make_context_manager(
            [label, log] {
                log->push_back(label + "-acquire");
                return value(label);
            },
            [label, log](std::exception_ptr) { log->push_back(label + "-release"); });
    });
}

std::vector<std::string> names(const signature& sig) {
    std::vector<std::string> result;
    for (const auto& p : sig.parameters()) result.push_back(p.name);
    return result;
}

function_ptr greeter() {
    return make_function("greet",
        {parameter("name"), parameter("greeting", depends(constant("greeting", "hello")))},
        [](const arguments& args) {
            return value(depscope::get<std::string>(args, "greeting") + " "
                         + depscope::get<std::string>(args, "name"));
        },
        "Greet someone.");
}

} // namespace

// ===============================================================
// Shape of the bridged callable
// ===============================================================

TEST_CASE("bridge: callable without dependencies is returned unchanged", "[bridge]") {
    auto fn = make_function("plain", {parameter("x")},
        [](const arguments& args) { return args.at("x"); });
    REQUIRE(bridge(fn).get() == fn.get());
}

TEST_CASE("bridge: dependency parameters are hidden from callers", "[bridge]") {
    auto bridged = bridge(greeter());
    REQUIRE(names(bridged->get_signature()) == std::vector<std::string>{"name"});
    REQUIRE_FALSE(bridged->get_signature().has_dependencies());
}

TEST_CASE("bridge: name and documentation are preserved", "[bridge]") {
    auto fn = greeter();
    auto bridged = bridge(fn);
    REQUIRE(bridged.get() != fn.get());
    REQUIRE(bridged->name() == "greet");
    REQUIRE(bridged->doc() == "Greet someone.");
}

TEST_CASE("bridge: null callable is rejected", "[bridge]") {
    REQUIRE_THROWS_AS(bridge(nullptr), depscope_error);
}

// ===============================================================
// Invocation
// ===============================================================

TEST_CASE("bridge: resolves dependencies and passes caller arguments", "[bridge]") {
    auto result = bridge(greeter())->call({{"name", value(std::string("world"))}});
    REQUIRE(std::any_cast<std::string>(result) == "hello world");
}

TEST_CASE("bridge: caller argument overrides a dependency", "[bridge]") {
    arguments kwargs;
    kwargs["name"] = std::string("world");
    kwargs["greeting"] = std::string("goodbye");
    auto result = bridge(greeter())->call(kwargs);
    REQUIRE(std::any_cast<std::string>(result) == "goodbye world");
}

TEST_CASE("bridge: resources are released before the call returns", "[bridge]") {
    auto log = std::make_shared<std::vector<std::string>>();
    auto fn = make_function("handler", {parameter("db", depends(tracked_resource("db", log)))},
        [log](const arguments&) {
            log->push_back("body");
            return value();
        });

    bridge(fn)->call({});
    REQUIRE(*log == std::vector<std::string>{"db-acquire", "body", "db-release"});
}

TEST_CASE("bridge: resources are released when the body throws", "[bridge]") {
    auto log = std::make_shared<std::vector<std::string>>();
    auto fn = make_function("handler", {parameter("db", depends(tracked_resource("db", log)))},
        [](const arguments&) -> value { throw std::runtime_error("handler failed"); });

    REQUIRE_THROWS_WITH(bridge(fn)->call({}), "handler failed");
    REQUIRE(*log == std::vector<std::string>{"db-acquire", "db-release"});
}

TEST_CASE("bridge: each call opens a fresh scope", "[bridge]") {
    auto calls = std::make_shared<int>(0);
    auto counter = make_producer("counter", [calls](const arguments&) -> factory_result {
        return value(++*calls);
    });
    auto fn = make_function("handler", {parameter("n", depends(counter))},
        [](const arguments& args) { return args.at("n"); });

    auto bridged = bridge(fn);
    REQUIRE(std::any_cast<int>(bridged->call({})) == 1);
    REQUIRE(std::any_cast<int>(bridged->call({})) == 2);
}

TEST_CASE("bridge: failed dependency reaches the body as a marker", "[bridge]") {
    auto broken = make_producer("broken", [](const arguments&) -> factory_result {
        throw std::runtime_error("offline");
    });
    auto fn = make_function("handler", {parameter("svc", depends(broken))},
        [](const arguments& args) {
            const auto* marker = as_failed(args.at("svc"));
            return value(marker ? marker->message() : std::string("ok"));
        });

    REQUIRE(std::any_cast<std::string>(bridge(fn)->call({})) == "offline");
}

TEST_CASE("bridge: asynchronous callable stays asynchronous", "[bridge]") {
    auto fn = make_async_function("fetch",
        {parameter("base", depends(constant("base", "https://example.org"))), parameter("path")},
        [](const arguments& args) {
            auto url = depscope::get<std::string>(args, "base")
                       + depscope::get<std::string>(args, "path");
            return std::async(std::launch::async, [url] { return value(url); });
        });

    auto bridged = bridge(fn);
    REQUIRE(bridged->is_async());
    auto pending = bridged->call_async({{"path", value(std::string("/status"))}});
    REQUIRE(std::any_cast<std::string>(pending.get()) == "https://example.org/status");
}

TEST_CASE("bridge: annotation-only callable is wrapped", "[bridge]") {
    struct seen : dependency {
        explicit seen(std::shared_ptr<int> count) : count(std::move(count)) {}
        value enter(resolution_context&) override {
            ++*count;
            return {};
        }
        std::shared_ptr<int> count;
    };

    auto count = std::make_shared<int>(0);
    auto fn = make_function("handler",
        {parameter("job").annotate(std::make_shared<seen>(count))},
        [](const arguments& args) { return args.at("job"); });

    auto bridged = bridge(fn);
    REQUIRE(bridged.get() != fn.get());
    REQUIRE(names(bridged->get_signature()) == std::vector<std::string>{"job"});
    REQUIRE(std::any_cast<int>(bridged->call({{"job", value(9)}})) == 9);
    REQUIRE(*count == 1);
}

// ===============================================================
// Memoization
// ===============================================================

TEST_CASE("bridge: repeated bridging returns the memoized callable", "[bridge]") {
    auto fn = greeter();
    REQUIRE(bridge(fn).get() == bridge(fn).get());
}

TEST_CASE("bridge_cache: least recently used entry is evicted", "[bridge]") {
    bridge_cache cache(bridge_options{.cache_capacity = 2});
    auto a = greeter();
    auto b = greeter();
    auto c = greeter();

    auto first_a = cache.bridge(a);
    cache.bridge(b);
    REQUIRE(cache.bridge(a).get() == first_a.get());  // a is now most recent

    cache.bridge(c);                                   // evicts b
    REQUIRE(cache.size() == 2);
    REQUIRE(cache.bridge(a).get() == first_a.get());

    auto first_b = cache.bridge(b);                    // rebuilt, evicts c
    REQUIRE(cache.size() == 2);
    REQUIRE(cache.bridge(b).get() == first_b.get());
}

TEST_CASE("bridge_cache: zero capacity disables memoization", "[bridge]") {
    bridge_cache cache(bridge_options{.cache_capacity = 0});
    auto fn = greeter();
    REQUIRE(cache.bridge(fn).get() != cache.bridge(fn).get());
    REQUIRE(cache.size() == 0);
}

TEST_CASE("bridge_cache: clear drops every entry", "[bridge]") {
    bridge_cache cache;
    REQUIRE(cache.capacity() == 5000);
    auto fn = greeter();
    auto before = cache.bridge(fn);
    cache.clear();
    REQUIRE(cache.size() == 0);
    REQUIRE(cache.bridge(fn).get() != before.get());
}
