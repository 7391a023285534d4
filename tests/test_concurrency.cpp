#include <catch2/catch_test_macros.hpp>
#include <depscope.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace depscope;

// ---------------------------------------------------------------
// Test producers
// ---------------------------------------------------------------

namespace {

producer_ptr slow_counter(std::shared_ptr<std::atomic<int>> calls) {
    return make_producer("slow_counter", [calls](const arguments&) -> factory_result {
        int n = ++*calls;
        // Widen the race window
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        return value(std::make_shared<int>(n));
    });
}

} // namespace

// ---------------------------------------------------------------
// Tests
// ---------------------------------------------------------------

TEST_CASE("Concurrency: shared producer initialized once under contention", "[concurrency]") {
    auto calls = std::make_shared<std::atomic<int>>(0);
    auto pool = slow_counter(calls);
    auto fn = make_function("handler", {parameter("pool", shared(pool))},
        [](const arguments& args) { return args.at("pool"); });
    auto bridged = bridge(fn);

    auto scope = open_shared_scope();

    constexpr std::size_t N = 32;
    std::vector<std::shared_ptr<int>> results(N);
    {
        std::vector<std::jthread> threads;
        for (std::size_t i = 0; i < N; ++i) {
            threads.emplace_back([&, i] {
                results[i] = std::any_cast<std::shared_ptr<int>>(bridged->call({}));
            });
        }
    }

    REQUIRE(calls->load() == 1);
    for (const auto& r : results) {
        REQUIRE(r.get() == results.front().get());
    }
}

TEST_CASE("Concurrency: scoped caches are private to each call", "[concurrency]") {
    auto calls = std::make_shared<std::atomic<int>>(0);
    auto counter = slow_counter(calls);
    auto fn = make_function("handler",
        {parameter("a", depends(counter)), parameter("b", depends(counter))},
        [](const arguments& args) {
            auto a = std::any_cast<std::shared_ptr<int>>(args.at("a"));
            auto b = std::any_cast<std::shared_ptr<int>>(args.at("b"));
            return value(a.get() == b.get());
        });
    auto bridged = bridge(fn);

    constexpr std::size_t N = 16;
    std::atomic<int> consistent{0};
    {
        std::vector<std::jthread> threads;
        for (std::size_t i = 0; i < N; ++i) {
            threads.emplace_back([&] {
                if (std::any_cast<bool>(bridged->call({}))) ++consistent;
            });
        }
    }

    REQUIRE(calls->load() == static_cast<int>(N));
    REQUIRE(consistent.load() == static_cast<int>(N));
}

TEST_CASE("Concurrency: resources from concurrent calls are all released", "[concurrency]") {
    auto open_count = std::make_shared<std::atomic<int>>(0);
    auto conn = make_producer("conn", [open_count](const arguments&) -> factory_result {
        return make_context_manager(
            [open_count] {
                ++*open_count;
                return value(1);
            },
            [open_count](std::exception_ptr) { --*open_count; });
    });
    auto fn = make_function("handler", {parameter("conn", depends(conn))},
        [](const arguments&) { return value(); });
    auto bridged = bridge(fn);

    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < 16; ++i) {
            threads.emplace_back([&] {
                for (int j = 0; j < 20; ++j) bridged->call({});
            });
        }
    }
    REQUIRE(open_count->load() == 0);
}

TEST_CASE("Concurrency: concurrent bridging yields one memoized callable", "[concurrency]") {
    bridge_cache cache;
    auto fn = make_function("handler",
        {parameter("x", depends(make_producer("x", [](const arguments&) -> factory_result {
            return value(1);
        })))},
        [](const arguments&) { return value(); });

    constexpr std::size_t N = 16;
    std::vector<function_ptr> results(N);
    {
        std::vector<std::jthread> threads;
        for (std::size_t i = 0; i < N; ++i) {
            threads.emplace_back([&, i] { results[i] = cache.bridge(fn); });
        }
    }

    REQUIRE(cache.size() == 1);
    for (const auto& r : results) {
        REQUIRE(r.get() == results.front().get());
    }
}
