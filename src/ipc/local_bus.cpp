#include "llmgate/ipc/local_bus.hpp"

#include "llmgate/core/logger.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace llmgate::ipc {

LocalBus::LocalBus()
    : state_(std::make_shared<State>()) {}

LocalBus::~LocalBus() = default;

void LocalBus::register_command(std::string name, CommandHandler handler) {
    LOG_DEBUG("LocalBus: registering command {}", name);
    commands_[std::move(name)] = std::move(handler);
}

auto LocalBus::has_command(std::string_view name) const -> bool {
    return commands_.contains(std::string(name));
}

auto LocalBus::invoke(std::string_view command, json payload) -> awaitable<Result<json>> {
    invocations_.emplace_back(std::string(command), payload);

    auto it = commands_.find(std::string(command));
    if (it == commands_.end()) {
        co_return make_fail(
            make_error(ErrorCode::NotFound, "Command not found: " + std::string(command)));
    }

    // Copy so the handler survives re-registration while suspended.
    auto handler = it->second;
    try {
        co_return co_await handler(std::move(payload));
    } catch (const std::exception& e) {
        LOG_ERROR("LocalBus: command {} threw: {}", command, e.what());
        co_return make_fail(
            make_error(ErrorCode::InternalError, "Command execution failed", e.what()));
    }
}

auto LocalBus::subscribe(std::string channel, EventHandler handler)
    -> awaitable<Result<Unsubscribe>> {
    if (subscribe_delay_.count() > 0) {
        auto executor = co_await boost::asio::this_coro::executor;
        boost::asio::steady_timer timer(executor, subscribe_delay_);
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    auto id = state_->next_id++;
    state_->channels[channel][id] = std::move(handler);
    LOG_TRACE("LocalBus: subscribed #{} to {}", id, channel);

    std::weak_ptr<State> weak = state_;
    Unsubscribe unsubscribe = [weak, channel, id]() {
        auto state = weak.lock();
        if (!state) return;
        auto it = state->channels.find(channel);
        if (it == state->channels.end()) return;
        if (it->second.erase(id) > 0) {
            ++state->unsubscribed;
        }
        if (it->second.empty()) {
            state->channels.erase(it);
        }
    };
    co_return unsubscribe;
}

auto LocalBus::emit(std::string_view channel, const json& payload) -> std::size_t {
    auto it = state_->channels.find(channel);
    if (it == state_->channels.end()) {
        return 0;
    }

    // Handlers may unsubscribe while being called.
    auto snapshot = it->second;
    std::size_t delivered = 0;
    for (auto& [id, handler] : snapshot) {
        auto live = state_->channels.find(channel);
        if (live == state_->channels.end() || !live->second.contains(id)) {
            continue;
        }
        handler(payload);
        ++delivered;
    }
    return delivered;
}

void LocalBus::set_subscribe_delay(std::chrono::milliseconds delay) {
    subscribe_delay_ = delay;
}

auto LocalBus::subscription_count(std::string_view channel) const -> std::size_t {
    auto it = state_->channels.find(channel);
    return it == state_->channels.end() ? 0 : it->second.size();
}

auto LocalBus::subscription_count() const -> std::size_t {
    std::size_t total = 0;
    for (const auto& [_, handlers] : state_->channels) {
        total += handlers.size();
    }
    return total;
}

auto LocalBus::unsubscribe_count() const -> std::size_t {
    return state_->unsubscribed;
}

auto LocalBus::invocations() const -> const std::vector<std::pair<std::string, json>>& {
    return invocations_;
}

} // namespace llmgate::ipc
