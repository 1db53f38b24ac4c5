#include "llmgate/ipc/ws_bus.hpp"

#include "llmgate/core/logger.hpp"
#include "llmgate/core/utils.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/field.hpp>

namespace llmgate::ipc {

WsBus::WsBus(net::io_context& ioc)
    : ioc_(ioc)
    , channels_(std::make_shared<Channels>())
    , alive_(std::make_shared<bool>(true))
    , write_gate_(std::make_shared<net::steady_timer>(ioc, net::steady_timer::time_point::max())) {}

WsBus::~WsBus() {
    connected_ = false;
}

auto WsBus::connect(std::string_view host, std::string_view port, std::string_view path)
    -> awaitable<Result<void>> {
    host_ = std::string(host);
    port_ = std::string(port);
    path_ = std::string(path);

    try {
        tcp::resolver resolver(ioc_);
        auto results = co_await resolver.async_resolve(host_, port_, net::use_awaitable);

        ws_ = std::make_unique<WsStream>(ioc_);
        auto ep = co_await beast::get_lowest_layer(*ws_).async_connect(
            results, net::use_awaitable);
        auto host_str = host_ + ":" + std::to_string(ep.port());

        ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_->set_option(websocket::stream_base::decorator(
            [](websocket::request_type& req) {
                req.set(beast::http::field::user_agent, "llmgate/0.1.0");
            }));

        co_await ws_->async_handshake(host_str, path_, net::use_awaitable);
        connected_ = true;
        LOG_INFO("Connected to engine at {}:{}{}", host_, port_, path_);

        if (!auth_token_.empty()) {
            LOG_DEBUG("Authenticating with token {}", utils::fingerprint(auth_token_));
            json auth_msg = json{{"token", auth_token_}};
            ws_->text(true);
            co_await ws_->async_write(net::buffer(auth_msg.dump()), net::use_awaitable);

            beast::flat_buffer buf;
            co_await ws_->async_read(buf, net::use_awaitable);
            auto reply = beast::buffers_to_string(buf.data());

            auto frame = parse_frame(reply);
            if (frame) {
                if (auto* resp = std::get_if<ResponseFrame>(&*frame); resp && resp->is_error()) {
                    connected_ = false;
                    co_return make_fail(
                        make_error(ErrorCode::Unauthorized, response_error(*resp).what()));
                }
            } else {
                LOG_WARN("Unexpected auth reply: {}", frame.error().what());
            }
        }

        net::co_spawn(ioc_, read_loop(), net::detached);
        co_return ok_result();

    } catch (const boost::system::system_error& e) {
        LOG_ERROR("Failed to connect to {}:{}: {}", host_, port_, e.what());
        connected_ = false;
        co_return make_fail(
            make_error(ErrorCode::ConnectionFailed, "WebSocket connection failed", e.what()));
    }
}

auto WsBus::disconnect() -> awaitable<void> {
    if (!connected_ || !ws_) co_return;
    connected_ = false;

    try {
        co_await ws_->async_close(websocket::close_code::normal, net::use_awaitable);
    } catch (const boost::system::system_error& e) {
        LOG_DEBUG("Disconnect error (expected): {}", e.what());
    }
    fail_pending(make_error(ErrorCode::ConnectionClosed, "Disconnected"));
    LOG_INFO("Disconnected from engine");
}

void WsBus::set_auth_token(std::string token) {
    auth_token_ = std::move(token);
}

auto WsBus::is_connected() const noexcept -> bool {
    return connected_;
}

auto WsBus::send(const Frame& frame) -> awaitable<Result<void>> {
    // Beast allows one outstanding write per stream.
    while (writing_) {
        boost::system::error_code ec;
        co_await write_gate_->async_wait(net::redirect_error(net::use_awaitable, ec));
    }

    if (!connected_ || !ws_) {
        co_return make_fail(make_error(ErrorCode::ConnectionClosed, "Not connected"));
    }

    writing_ = true;
    std::optional<Error> failure;
    try {
        auto text = serialize_frame(frame);
        ws_->text(true);
        co_await ws_->async_write(net::buffer(text), net::use_awaitable);
    } catch (const boost::system::system_error& e) {
        LOG_WARN("Send error: {}", e.what());
        failure = make_error(ErrorCode::TransportError, "WebSocket write failed", e.what());
    }
    writing_ = false;
    write_gate_->cancel();

    if (failure) {
        co_return make_fail(std::move(*failure));
    }
    co_return ok_result();
}

auto WsBus::invoke(std::string_view command, json payload) -> awaitable<Result<json>> {
    if (!connected_ || !ws_) {
        co_return make_fail(make_error(ErrorCode::ConnectionClosed, "Not connected"));
    }

    auto id = utils::generate_id(16);
    auto call = std::make_shared<PendingCall>();
    call->timer = std::make_shared<net::steady_timer>(
        ioc_, net::steady_timer::time_point::max());
    pending_[id] = call;

    LOG_DEBUG("invoke {} (frame {})", command, id);
    auto sent = co_await send(Frame{make_request(id, std::string(command), std::move(payload))});
    if (!sent) {
        pending_.erase(id);
        co_return make_fail(sent.error());
    }

    while (!call->result) {
        boost::system::error_code ec;
        co_await call->timer->async_wait(net::redirect_error(net::use_awaitable, ec));
    }
    pending_.erase(id);
    co_return std::move(*call->result);
}

auto WsBus::subscribe(std::string channel, EventHandler handler)
    -> awaitable<Result<Unsubscribe>> {
    auto id = channels_->next_id++;
    bool first = !channels_->handlers.contains(channel);
    channels_->handlers[channel][id] = std::move(handler);

    if (first) {
        json payload{{"channel", channel}};
        auto ack = co_await invoke("subscribe", std::move(payload));
        if (!ack) {
            if (auto it = channels_->handlers.find(channel); it != channels_->handlers.end()) {
                it->second.erase(id);
                if (it->second.empty()) channels_->handlers.erase(it);
            }
            co_return make_fail(ack.error());
        }
    }
    LOG_DEBUG("Subscribed #{} to {}", id, channel);

    std::weak_ptr<Channels> weak = channels_;
    Unsubscribe unsubscribe = [this, weak, channel, id]() {
        auto channels = weak.lock();
        if (!channels) return;
        auto it = channels->handlers.find(channel);
        if (it == channels->handlers.end() || it->second.erase(id) == 0) return;
        if (it->second.empty()) {
            channels->handlers.erase(it);
            release_channel(channel);
        }
    };
    co_return unsubscribe;
}

void WsBus::release_channel(const std::string& channel) {
    if (!connected_) return;
    std::weak_ptr<bool> alive = alive_;
    net::co_spawn(ioc_, [this, alive, channel]() -> awaitable<void> {
        // The bus may be gone, or the channel subscribed again, by the time
        // this runs.
        if (alive.expired() || !connected_ || channels_->handlers.contains(channel)) {
            co_return;
        }
        json payload{{"channel", channel}};
        auto result = co_await invoke("unsubscribe", std::move(payload));
        if (!result) {
            LOG_DEBUG("Remote unsubscribe from {} failed: {}", channel, result.error().what());
        }
    }, net::detached);
}

auto WsBus::read_loop() -> awaitable<void> {
    std::weak_ptr<bool> alive = alive_;
    beast::flat_buffer buffer;

    while (connected_ && ws_) {
        try {
            co_await ws_->async_read(buffer, net::use_awaitable);
            if (alive.expired()) co_return;
            auto data = beast::buffers_to_string(buffer.data());
            buffer.consume(buffer.size());

            auto frame = parse_frame(data);
            if (!frame) {
                LOG_WARN("Bad frame from engine: {}", frame.error().what());
                continue;
            }

            if (auto* resp = std::get_if<ResponseFrame>(&*frame)) {
                resolve(*resp);
            } else if (auto* event = std::get_if<EventFrame>(&*frame)) {
                dispatch_event(*event);
            } else {
                LOG_DEBUG("Ignoring request frame from engine");
            }

        } catch (const boost::system::system_error& e) {
            if (alive.expired()) co_return;
            if (e.code() == websocket::error::closed) {
                LOG_INFO("Engine closed the connection");
            } else {
                LOG_WARN("Read error: {}", e.what());
            }
            connected_ = false;
            break;
        }
    }

    fail_pending(make_error(ErrorCode::ConnectionClosed,
                            "Connection closed while waiting for response"));
}

void WsBus::resolve(const ResponseFrame& frame) {
    auto it = pending_.find(frame.id);
    if (it == pending_.end()) {
        LOG_DEBUG("Response for unknown frame {}", frame.id);
        return;
    }
    if (frame.is_error()) {
        it->second->result = Result<json>(std::unexpected(response_error(frame)));
    } else {
        it->second->result = Result<json>(frame.result.value_or(json::object()));
    }
    it->second->timer->cancel();
}

void WsBus::dispatch_event(const EventFrame& frame) {
    auto it = channels_->handlers.find(frame.event);
    if (it == channels_->handlers.end()) {
        LOG_TRACE("No subscriber for {}", frame.event);
        return;
    }

    auto snapshot = it->second;
    for (auto& [id, handler] : snapshot) {
        auto live = channels_->handlers.find(frame.event);
        if (live == channels_->handlers.end() || !live->second.contains(id)) {
            continue;
        }
        try {
            handler(frame.data);
        } catch (const std::exception& e) {
            LOG_WARN("Handler for {} threw: {}", frame.event, e.what());
        }
    }
}

void WsBus::fail_pending(const Error& error) {
    for (auto& [id, call] : pending_) {
        if (!call->result) {
            call->result = Result<json>(std::unexpected(error));
            call->timer->cancel();
        }
    }
}

} // namespace llmgate::ipc
