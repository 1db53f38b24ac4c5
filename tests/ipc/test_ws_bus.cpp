#include <catch2/catch_test_macros.hpp>

#include "llmgate/ipc/frame.hpp"
#include "llmgate/ipc/ws_bus.hpp"

#include "../test_helpers.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include <memory>

using namespace llmgate;
using namespace llmgate::ipc;
using llmgate::test::spawn;
using namespace std::chrono_literals;

namespace {

// Accepts one client and answers every request frame with an empty
// payload, recording the method names in arrival order.
auto serve_engine(tcp::acceptor& acceptor, std::vector<std::string>& methods)
    -> awaitable<void> {
    auto socket = co_await acceptor.async_accept(net::use_awaitable);
    websocket::stream<beast::tcp_stream> ws(std::move(socket));
    co_await ws.async_accept(net::use_awaitable);

    beast::flat_buffer buffer;
    for (;;) {
        boost::system::error_code ec;
        co_await ws.async_read(buffer, net::redirect_error(net::use_awaitable, ec));
        if (ec) co_return;
        auto frame = parse_frame(beast::buffers_to_string(buffer.data()));
        buffer.consume(buffer.size());
        if (!frame) continue;
        const auto* req = std::get_if<RequestFrame>(&*frame);
        if (!req) continue;
        methods.push_back(req->method);

        auto reply = serialize_frame(Frame{make_response(req->id, json::object())});
        ws.text(true);
        co_await ws.async_write(net::buffer(reply), net::redirect_error(net::use_awaitable, ec));
        if (ec) co_return;
    }
}

struct EngineFixture {
    net::io_context ioc;
    tcp::acceptor acceptor{ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)};
    std::vector<std::string> methods;

    EngineFixture() { spawn(ioc, serve_engine(acceptor, methods)); }

    [[nodiscard]] auto port() const -> std::string {
        return std::to_string(acceptor.local_endpoint().port());
    }
};

} // anonymous namespace

TEST_CASE("WsBus releases a channel when its last handler goes", "[ipc][ws_bus]") {
    EngineFixture engine;
    WsBus bus(engine.ioc);

    auto client = [&]() -> awaitable<void> {
        auto connected = co_await bus.connect("127.0.0.1", engine.port());
        REQUIRE(connected.has_value());

        auto first = co_await bus.subscribe("llm-stream-a", [](const json&) {});
        REQUIRE(first.has_value());
        auto second = co_await bus.subscribe("llm-stream-a", [](const json&) {});
        REQUIRE(second.has_value());

        (*first)();
        (*second)();
        (*second)();

        net::steady_timer settle(engine.ioc, 50ms);
        co_await settle.async_wait(net::use_awaitable);
        co_await bus.disconnect();
    };
    spawn(engine.ioc, client());
    engine.ioc.run();

    CHECK(engine.methods == std::vector<std::string>{"subscribe", "unsubscribe"});
}

TEST_CASE("WsBus destroyed before a channel release runs", "[ipc][ws_bus]") {
    EngineFixture engine;
    auto bus = std::make_unique<WsBus>(engine.ioc);

    auto client = [&]() -> awaitable<void> {
        auto connected = co_await bus->connect("127.0.0.1", engine.port());
        REQUIRE(connected.has_value());

        auto unsubscribe = co_await bus->subscribe("llm-stream-b", [](const json&) {});
        REQUIRE(unsubscribe.has_value());

        // The release is queued on the io_context; the bus goes first.
        (*unsubscribe)();
        bus.reset();
    };
    spawn(engine.ioc, client());
    engine.ioc.run();

    CHECK(bus == nullptr);
    CHECK(engine.methods == std::vector<std::string>{"subscribe"});
}
