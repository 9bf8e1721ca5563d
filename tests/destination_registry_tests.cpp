#include "torfetch/destination_registry.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <optional>
#include <thread>
#include <utility>

using namespace torfetch;

TEST_CASE("Leases are exclusive per path", "[registry]") {
    DestinationRegistry registry;
    CancellationToken cancel;

    auto lease = registry.acquire("/tmp/torfetch-registry/a.bin", cancel);
    REQUIRE(lease);
    CHECK(lease->held());
    CHECK(registry.isHeld("/tmp/torfetch-registry/a.bin"));
    CHECK(registry.isHeld("/tmp/torfetch-registry/sub/../a.bin"));
    CHECK_FALSE(registry.isHeld("/tmp/torfetch-registry/b.bin"));

    lease->release();
    CHECK_FALSE(lease->held());
    CHECK_FALSE(registry.isHeld("/tmp/torfetch-registry/a.bin"));
}

TEST_CASE("Moved leases release once", "[registry]") {
    DestinationRegistry registry;
    CancellationToken cancel;
    {
        auto first = registry.acquire("/tmp/torfetch-registry/a.bin", cancel);
        REQUIRE(first);
        DestinationLease moved = std::move(*first);
        CHECK_FALSE(first->held());
        CHECK(moved.held());
        CHECK(registry.isHeld("/tmp/torfetch-registry/a.bin"));
    }
    CHECK_FALSE(registry.isHeld("/tmp/torfetch-registry/a.bin"));
}

TEST_CASE("Second holder waits for the first", "[registry]") {
    DestinationRegistry registry;
    CancellationToken cancel;
    std::atomic<bool> second_acquired{false};

    auto lease = registry.acquire("/tmp/torfetch-registry/a.bin", cancel);
    REQUIRE(lease);

    std::thread waiter([&]() {
        auto second = registry.acquire("/tmp/torfetch-registry/a.bin", cancel);
        second_acquired = second.has_value();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    CHECK_FALSE(second_acquired);
    lease.reset();
    waiter.join();
    CHECK(second_acquired);
}

TEST_CASE("Waiting stops on cancellation", "[registry]") {
    DestinationRegistry registry;
    CancellationToken holder_token;
    CancellationToken waiter_token;

    auto lease = registry.acquire("/tmp/torfetch-registry/a.bin", holder_token);
    REQUIRE(lease);

    std::optional<DestinationLease> second;
    std::thread waiter([&]() { second = registry.acquire("/tmp/torfetch-registry/a.bin", waiter_token); });
    waiter_token.cancel();
    waiter.join();

    CHECK_FALSE(second);
    CHECK(registry.isHeld("/tmp/torfetch-registry/a.bin"));
}
