#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include "llmgate/ipc/bus.hpp"
#include "llmgate/ipc/frame.hpp"

namespace llmgate::ipc {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

/// MessageBus over a WebSocket connection to the remote engine.
///
/// Commands travel as "req" frames and are answered by "res" frames with
/// the same id. Channel messages arrive as "event" frames whose event name
/// is the channel. Subscribing sends a "subscribe" request the first time a
/// channel gains a local handler and "unsubscribe" when it loses the last.
class WsBus : public MessageBus {
public:
    explicit WsBus(net::io_context& ioc);
    ~WsBus() override;

    WsBus(const WsBus&) = delete;
    WsBus& operator=(const WsBus&) = delete;

    /// Connect and start reading. When an auth token is set it is sent as
    /// the first message and the reply must not be an error.
    auto connect(std::string_view host, std::string_view port, std::string_view path = "/")
        -> awaitable<Result<void>>;

    auto disconnect() -> awaitable<void>;

    void set_auth_token(std::string token);

    [[nodiscard]] auto is_connected() const noexcept -> bool;

    auto invoke(std::string_view command, json payload) -> awaitable<Result<json>> override;
    auto subscribe(std::string channel, EventHandler handler)
        -> awaitable<Result<Unsubscribe>> override;

private:
    using WsStream = websocket::stream<beast::tcp_stream>;

    /// A call waiting for its response frame. The waiter parks on `timer`
    /// and the read loop cancels it once `result` is set.
    struct PendingCall {
        std::optional<Result<json>> result;
        std::shared_ptr<net::steady_timer> timer;
    };

    struct Channels {
        std::map<std::string, std::map<uint64_t, EventHandler>, std::less<>> handlers;
        uint64_t next_id = 1;
    };

    auto send(const Frame& frame) -> awaitable<Result<void>>;
    auto read_loop() -> awaitable<void>;
    void dispatch_event(const EventFrame& frame);
    void resolve(const ResponseFrame& frame);
    void fail_pending(const Error& error);
    void release_channel(const std::string& channel);

    net::io_context& ioc_;
    std::unique_ptr<WsStream> ws_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string auth_token_;
    bool connected_ = false;

    std::unordered_map<std::string, std::shared_ptr<PendingCall>> pending_;
    std::shared_ptr<Channels> channels_;
    // Expires with the bus; coroutines spawned by it check it after resuming.
    std::shared_ptr<bool> alive_;

    // Parked at time_point::max(); cancelled when a write completes.
    std::shared_ptr<net::steady_timer> write_gate_;
    bool writing_ = false;
};

} // namespace llmgate::ipc
