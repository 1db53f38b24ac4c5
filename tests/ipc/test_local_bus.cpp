#include <catch2/catch_test_macros.hpp>

#include "llmgate/ipc/local_bus.hpp"

#include "../test_helpers.hpp"

#include <stdexcept>

using namespace llmgate;
using namespace llmgate::ipc;
using llmgate::test::run_sync;

TEST_CASE("LocalBus invokes registered commands", "[ipc][local_bus]") {
    LocalBus bus;
    bus.register_command("echo", [](json payload) -> awaitable<Result<json>> {
        co_return json{{"echo", payload}};
    });

    CHECK(bus.has_command("echo"));
    CHECK_FALSE(bus.has_command("missing"));

    auto result = run_sync(bus.invoke("echo", {{"x", 1}}));
    REQUIRE(result.has_value());
    CHECK((*result)["echo"]["x"] == 1);

    REQUIRE(bus.invocations().size() == 1);
    CHECK(bus.invocations()[0].first == "echo");
}

TEST_CASE("LocalBus reports unknown and failing commands", "[ipc][local_bus]") {
    LocalBus bus;
    bus.register_command("explode", [](json) -> awaitable<Result<json>> {
        throw std::runtime_error("kaboom");
        co_return json{};
    });
    bus.register_command("refuse", [](json) -> awaitable<Result<json>> {
        co_return make_fail(make_error(ErrorCode::Unauthorized, "nope"));
    });

    auto missing = run_sync(bus.invoke("missing", json::object()));
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code() == ErrorCode::NotFound);

    auto thrown = run_sync(bus.invoke("explode", json::object()));
    REQUIRE_FALSE(thrown.has_value());
    CHECK(thrown.error().code() == ErrorCode::InternalError);

    auto refused = run_sync(bus.invoke("refuse", json::object()));
    REQUIRE_FALSE(refused.has_value());
    CHECK(refused.error().code() == ErrorCode::Unauthorized);
}

TEST_CASE("LocalBus delivers channel messages in order", "[ipc][local_bus]") {
    LocalBus bus;
    std::vector<int> seen;

    auto unsubscribe = run_sync(bus.subscribe("numbers", [&seen](const json& payload) {
        seen.push_back(payload.get<int>());
    }));
    REQUIRE(unsubscribe.has_value());
    CHECK(bus.subscription_count("numbers") == 1);

    CHECK(bus.emit("numbers", 1) == 1);
    CHECK(bus.emit("numbers", 2) == 1);
    CHECK(bus.emit("other", 3) == 0);
    CHECK(seen == std::vector<int>{1, 2});

    (*unsubscribe)();
    CHECK(bus.subscription_count("numbers") == 0);
    CHECK(bus.unsubscribe_count() == 1);
    CHECK(bus.emit("numbers", 4) == 0);

    // A second call is a no-op.
    (*unsubscribe)();
    CHECK(bus.unsubscribe_count() == 1);
}

TEST_CASE("LocalBus handler may unsubscribe itself during emit", "[ipc][local_bus]") {
    LocalBus bus;
    Unsubscribe first_unsub;
    int first_calls = 0;
    int second_calls = 0;

    auto first = run_sync(bus.subscribe("c", [&](const json&) {
        ++first_calls;
        first_unsub();
    }));
    REQUIRE(first.has_value());
    first_unsub = *first;

    auto second = run_sync(bus.subscribe("c", [&](const json&) { ++second_calls; }));
    REQUIRE(second.has_value());

    CHECK(bus.emit("c", json::object()) == 2);
    CHECK(bus.emit("c", json::object()) == 1);
    CHECK(first_calls == 1);
    CHECK(second_calls == 2);
    CHECK(bus.subscription_count() == 1);
}

TEST_CASE("Unsubscribe handle outliving the bus is harmless", "[ipc][local_bus]") {
    Unsubscribe unsub;
    {
        LocalBus bus;
        auto r = run_sync(bus.subscribe("c", [](const json&) {}));
        REQUIRE(r.has_value());
        unsub = *r;
    }
    CHECK_NOTHROW(unsub());
}
