#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "tessera/collection/index_applier.hpp"

using namespace tessera;
using namespace tessera::collection;

TEST_CASE("tasks run in submission order", "[applier]") {
    IndexApplier applier("test.order");
    std::vector<int> seen;
    for (int i = 0; i < 100; ++i) {
        REQUIRE(applier.submit([&seen, i]() -> std::expected<void, core::error> {
            seen.push_back(i);
            return {};
        }));
    }
    applier.wait_idle();
    REQUIRE(applier.pending() == 0);
    REQUIRE(seen.size() == 100);
    for (int i = 0; i < 100; ++i) REQUIRE(seen[static_cast<std::size_t>(i)] == i);
    REQUIRE(applier.failures() == 0);
    REQUIRE_FALSE(applier.needs_reconcile());
}

TEST_CASE("failures are counted and flag reconciliation", "[applier]") {
    IndexApplier applier("test.failures");
    std::atomic<int> ran{0};
    applier.submit([]() -> std::expected<void, core::error> {
        return core::fail(core::error_code::internal, "index full", "test");
    });
    applier.submit([]() -> std::expected<void, core::error> { throw std::runtime_error("bad_alloc"); });
    applier.submit([&]() -> std::expected<void, core::error> {
        ++ran;
        return {};
    });
    applier.wait_idle();

    REQUIRE(applier.failures() == 2);
    REQUIRE(applier.needs_reconcile());
    REQUIRE(ran == 1);  // the queue keeps going after a failure

    applier.clear_needs_reconcile();
    REQUIRE_FALSE(applier.needs_reconcile());
}

TEST_CASE("inline runs share the failure accounting", "[applier]") {
    IndexApplier applier("test.inline");
    auto ok = applier.run([]() -> std::expected<void, core::error> { return {}; });
    REQUIRE(ok.has_value());
    auto bad = applier.run([]() -> std::expected<void, core::error> {
        return core::fail(core::error_code::schema_mismatch, "dim", "test");
    });
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == core::error_code::schema_mismatch);
    REQUIRE(applier.failures() == 1);
}

TEST_CASE("stop drains or discards", "[applier]") {
    SECTION("drain runs everything queued") {
        std::atomic<int> ran{0};
        IndexApplier applier("test.drain");
        for (int i = 0; i < 50; ++i) {
            applier.submit([&]() -> std::expected<void, core::error> {
                ++ran;
                return {};
            });
        }
        applier.stop(true);
        REQUIRE(ran == 50);
        REQUIRE_FALSE(applier.submit([]() -> std::expected<void, core::error> { return {}; }));
    }

    SECTION("discard drops queued work") {
        std::atomic<int> ran{0};
        std::atomic<bool> release{false};
        std::atomic<bool> started{false};
        IndexApplier applier("test.discard");
        applier.submit([&]() -> std::expected<void, core::error> {
            started = true;
            while (!release) std::this_thread::sleep_for(std::chrono::milliseconds(1));
            ++ran;
            return {};
        });
        for (int i = 0; i < 10; ++i) {
            applier.submit([&]() -> std::expected<void, core::error> {
                ++ran;
                return {};
            });
        }
        while (!started) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        std::thread releaser([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            release = true;
        });
        applier.stop(false);
        releaser.join();
        REQUIRE(ran == 1);
        REQUIRE(applier.pending() == 0);
    }
}
