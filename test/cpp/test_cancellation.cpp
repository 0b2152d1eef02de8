#include "catch.hpp"

#include <atomic>
#include <thread>

#include "cancellation.hpp"

using namespace odata_client;

TEST_CASE("Default token is never cancelled", "[cancellation]") {
    CancellationToken token;
    REQUIRE_FALSE(token.CanBeCancelled());
    REQUIRE_FALSE(token.IsCancellationRequested());

    bool called = false;
    auto registration = token.Register([&called]() { called = true; });
    REQUIRE_FALSE(called);
}

TEST_CASE("Cancellation source signals its tokens", "[cancellation]") {
    CancellationSource source;
    auto token = source.Token();
    auto copy = token;

    REQUIRE(token.CanBeCancelled());
    REQUIRE_FALSE(token.IsCancellationRequested());

    source.Cancel();
    REQUIRE(source.IsCancellationRequested());
    REQUIRE(token.IsCancellationRequested());
    REQUIRE(copy.IsCancellationRequested());
}

TEST_CASE("Cancellation callbacks", "[cancellation]") {
    CancellationSource source;
    auto token = source.Token();
    int calls = 0;

    SECTION("Registered callbacks run once") {
        auto registration = token.Register([&calls]() { calls++; });
        source.Cancel();
        source.Cancel();
        REQUIRE(calls == 1);
    }

    SECTION("Released registrations do not run") {
        {
            auto registration = token.Register([&calls]() { calls++; });
        }
        source.Cancel();
        REQUIRE(calls == 0);
    }

    SECTION("Reset detaches the callback") {
        auto registration = token.Register([&calls]() { calls++; });
        registration.Reset();
        source.Cancel();
        REQUIRE(calls == 0);
    }

    SECTION("Registering on a cancelled token runs immediately") {
        source.Cancel();
        auto registration = token.Register([&calls]() { calls++; });
        REQUIRE(calls == 1);
    }

    SECTION("Moved registrations stay attached") {
        CancellationRegistration outer;
        {
            auto inner = token.Register([&calls]() { calls++; });
            outer = std::move(inner);
        }
        source.Cancel();
        REQUIRE(calls == 1);
    }
}

TEST_CASE("Cancellation from another thread", "[cancellation]") {
    CancellationSource source;
    auto token = source.Token();
    std::atomic<bool> observed(false);

    std::thread waiter([token, &observed]() {
        while (!token.IsCancellationRequested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        observed = true;
    });

    source.Cancel();
    waiter.join();
    REQUIRE(observed);
}
