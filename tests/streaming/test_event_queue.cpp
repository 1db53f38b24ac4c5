#include <catch2/catch_test_macros.hpp>

#include "llmgate/streaming/event_queue.hpp"

#include "../test_helpers.hpp"

#include <boost/asio/io_context.hpp>

#include <string>
#include <vector>

using llmgate::streaming::EventQueue;
using llmgate::test::spawn;
using boost::asio::awaitable;

TEST_CASE("EventQueue delivers values pushed before the consumer", "[streaming][queue]") {
    boost::asio::io_context ioc;
    EventQueue<std::string> queue(ioc.get_executor());
    queue.push("A");
    queue.push("B");
    queue.push("C");
    queue.finish();
    CHECK(queue.pending() == 3);

    std::vector<std::string> got;
    auto consumer = [&]() -> awaitable<void> {
        while (auto v = co_await queue.next()) got.push_back(*v);
    };
    spawn(ioc, consumer());
    ioc.run();

    CHECK(got == std::vector<std::string>{"A", "B", "C"});
}

TEST_CASE("EventQueue hands values to a waiting consumer", "[streaming][queue]") {
    boost::asio::io_context ioc;
    EventQueue<std::string> queue(ioc.get_executor());

    std::vector<std::string> got;
    bool ended = false;
    auto consumer = [&]() -> awaitable<void> {
        while (auto v = co_await queue.next()) got.push_back(*v);
        ended = true;
    };
    spawn(ioc, consumer());
    ioc.poll();
    CHECK(got.empty());
    CHECK_FALSE(ended);

    queue.push("A");
    queue.push("B");
    queue.push("C");
    queue.finish();
    ioc.run();

    CHECK(got == std::vector<std::string>{"A", "B", "C"});
    CHECK(ended);
}

TEST_CASE("EventQueue interleaved push and pull keeps order", "[streaming][queue]") {
    boost::asio::io_context ioc;
    EventQueue<int> queue(ioc.get_executor());

    std::vector<int> got;
    auto consumer = [&]() -> awaitable<void> {
        while (auto v = co_await queue.next()) got.push_back(*v);
    };
    spawn(ioc, consumer());

    for (int i = 0; i < 10; ++i) {
        queue.push(i);
        if (i % 3 == 0) ioc.poll();
    }
    queue.finish();
    ioc.run();

    REQUIRE(got.size() == 10);
    for (int i = 0; i < 10; ++i) CHECK(got[i] == i);
}

TEST_CASE("EventQueue ignores pushes after finish", "[streaming][queue]") {
    boost::asio::io_context ioc;
    EventQueue<int> queue(ioc.get_executor());
    queue.push(1);
    queue.finish();
    queue.push(2);
    CHECK(queue.finished());
    CHECK(queue.pending() == 1);
}

TEST_CASE("EventQueue compacts its drained buffer", "[streaming][queue]") {
    boost::asio::io_context ioc;
    EventQueue<int> queue(ioc.get_executor());
    constexpr int kCount = 5000;
    for (int i = 0; i < kCount; ++i) queue.push(i);
    queue.finish();

    int consumed = 0;
    bool in_order = true;
    auto consumer = [&]() -> awaitable<void> {
        while (auto v = co_await queue.next()) {
            if (*v != consumed) in_order = false;
            ++consumed;
        }
    };
    spawn(ioc, consumer());
    ioc.run();

    CHECK(consumed == kCount);
    CHECK(in_order);
    CHECK(queue.buffered() == 0);
    CHECK(queue.pending() == 0);
}
