#include <catch2/catch_test_macros.hpp>
#include <depscope.hpp>

#include <future>
#include <memory>
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

} // namespace

// ===============================================================
// Producer shapes
// ===============================================================

TEST_CASE("depends: plain producer value is injected", "[depends]") {
    auto fn = make_function("handler", {parameter("name", depends(constant("name", "depscope")))},
        [](const arguments& args) { return value(depscope::get<std::string>(args, "name")); });

    resolved_dependencies scope(*fn);
    REQUIRE(depscope::get<std::string>(scope.resolved(), "name") == "depscope");
}

TEST_CASE("depends: eventual producer value is awaited", "[depends]") {
    auto later = make_producer("later", [](const arguments&) -> factory_result {
        return std::async(std::launch::async, [] { return value(7); });
    });
    auto fn = make_function("handler", {parameter("n", depends(later))},
        [](const arguments&) { return value(); });

    resolved_dependencies scope(*fn);
    REQUIRE(depscope::get<int>(scope.resolved(), "n") == 7);
}

TEST_CASE("depends: sync resource lives until the scope closes", "[depends]") {
    auto log = std::make_shared<std::vector<std::string>>();
    auto fn = make_function("handler", {parameter("conn", depends(tracked_resource("conn", log)))},
        [](const arguments&) { return value(); });

    {
        resolved_dependencies scope(*fn);
        REQUIRE(depscope::get<std::string>(scope.resolved(), "conn") == "conn");
        REQUIRE(*log == std::vector<std::string>{"conn-acquire"});
    }
    REQUIRE(*log == std::vector<std::string>{"conn-acquire", "conn-release"});
}

TEST_CASE("depends: async resource is entered and released", "[depends]") {
    auto log = std::make_shared<std::vector<std::string>>();
    auto session = make_producer("session", [log](const arguments&) -> factory_result {
        return make_async_context_manager(
            [log] {
                return std::async(std::launch::async, [log] {
                    log->push_back("open");
                    return value(std::string("session"));
                });
            },
            [log](std::exception_ptr) {
                return std::async(std::launch::async, [log] { log->push_back("close"); });
            });
    });
    auto fn = make_function("handler", {parameter("s", depends(session))},
        [](const arguments&) { return value(); });

    {
        resolved_dependencies scope(*fn);
        REQUIRE(depscope::get<std::string>(scope.resolved(), "s") == "session");
    }
    REQUIRE(*log == std::vector<std::string>{"open", "close"});
}

// ===============================================================
// Per-scope caching
// ===============================================================

TEST_CASE("depends: one producer resolves once per scope", "[depends]") {
    auto calls = std::make_shared<int>(0);
    auto counter = make_producer("counter", [calls](const arguments&) -> factory_result {
        ++*calls;
        return value(std::make_shared<int>(*calls));
    });
    auto fn = make_function("handler",
        {parameter("a", depends(counter)), parameter("b", depends(counter))},
        [](const arguments&) { return value(); });

    resolved_dependencies scope(*fn);
    REQUIRE(*calls == 1);
    auto a = depscope::get<std::shared_ptr<int>>(scope.resolved(), "a");
    auto b = depscope::get<std::shared_ptr<int>>(scope.resolved(), "b");
    REQUIRE(a.get() == b.get());
}

TEST_CASE("depends: separate scopes produce fresh values", "[depends]") {
    auto calls = std::make_shared<int>(0);
    auto counter = make_producer("counter", [calls](const arguments&) -> factory_result {
        return value(++*calls);
    });
    auto fn = make_function("handler", {parameter("n", depends(counter))},
        [](const arguments&) { return value(); });

    {
        resolved_dependencies first(*fn);
        REQUIRE(depscope::get<int>(first.resolved(), "n") == 1);
    }
    {
        resolved_dependencies second(*fn);
        REQUIRE(depscope::get<int>(second.resolved(), "n") == 2);
    }
}

TEST_CASE("depends: producers with equal bodies are not unified", "[depends]") {
    auto calls = std::make_shared<int>(0);
    auto body = [calls](const arguments&) -> factory_result { return value(++*calls); };
    auto fn = make_function("handler",
        {parameter("a", depends(make_producer("p", body))),
         parameter("b", depends(make_producer("p", body)))},
        [](const arguments&) { return value(); });

    resolved_dependencies scope(*fn);
    REQUIRE(*calls == 2);
}

// ===============================================================
// Nesting
// ===============================================================

TEST_CASE("depends: producers declare their own dependencies", "[depends]") {
    auto base = constant("base", "base");
    auto derived = make_producer("derived",
        {parameter("b", depends(base))},
        [](const arguments& args) -> factory_result {
            return value(depscope::get<std::string>(args, "b") + "-derived");
        });
    auto fn = make_function("handler", {parameter("v", depends(derived))},
        [](const arguments&) { return value(); });

    resolved_dependencies scope(*fn);
    REQUIRE(depscope::get<std::string>(scope.resolved(), "v") == "base-derived");
}

TEST_CASE("depends: nested producer shared with the callable resolves once", "[depends]") {
    auto calls = std::make_shared<int>(0);
    auto base = make_producer("base", [calls](const arguments&) -> factory_result {
        return value(++*calls);
    });
    auto doubled = make_producer("doubled", {parameter("b", depends(base))},
        [](const arguments& args) -> factory_result {
            return value(depscope::get<int>(args, "b") * 2);
        });
    auto fn = make_function("handler",
        {parameter("b", depends(base)), parameter("d", depends(doubled))},
        [](const arguments&) { return value(); });

    resolved_dependencies scope(*fn);
    REQUIRE(*calls == 1);
    REQUIRE(depscope::get<int>(scope.resolved(), "d") == 2);
}

TEST_CASE("depends: resources release in reverse acquisition order", "[depends]") {
    auto log = std::make_shared<std::vector<std::string>>();
    auto fn = make_function("handler",
        {parameter("a", depends(tracked_resource("a", log))),
         parameter("b", depends(tracked_resource("b", log)))},
        [](const arguments&) { return value(); });

    {
        resolved_dependencies scope(*fn);
    }
    REQUIRE(*log == std::vector<std::string>{"a-acquire", "b-acquire", "b-release", "a-release"});
}

// ===============================================================
// Overrides
// ===============================================================

TEST_CASE("depends: caller-supplied argument skips the producer", "[depends]") {
    auto calls = std::make_shared<int>(0);
    auto db = make_producer("db", [calls](const arguments&) -> factory_result {
        ++*calls;
        return value(std::string("real"));
    });
    auto fn = make_function("handler", {parameter("db", depends(db))},
        [](const arguments&) { return value(); });

    resolved_dependencies scope(*fn, {{"db", value(std::string("fake"))}});
    REQUIRE(*calls == 0);
    REQUIRE(depscope::get<std::string>(scope.resolved(), "db") == "fake");
}

TEST_CASE("depends: parameters without dependencies are not resolved", "[depends]") {
    auto fn = make_function("handler",
        {parameter("user_id"), parameter("db", depends(constant("db", "db")))},
        [](const arguments&) { return value(); });

    resolved_dependencies scope(*fn);
    REQUIRE(scope.resolved().size() == 1);
    REQUIRE(scope.resolved().count("user_id") == 0);
}

TEST_CASE("depends: null producer is rejected", "[depends]") {
    REQUIRE_THROWS_AS(depends(nullptr), depscope_error);
}
