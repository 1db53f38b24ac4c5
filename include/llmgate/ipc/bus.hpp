#pragma once

#include <functional>
#include <string>
#include <string_view>

#include <utility>
#include <boost/asio/awaitable.hpp>

#include "llmgate/core/error.hpp"
#include "llmgate/core/types.hpp"

namespace llmgate::ipc {

using boost::asio::awaitable;

/// Receives one message published on a channel.
using EventHandler = std::function<void(const json& payload)>;

/// Detaches a subscription. Calling it more than once has no further effect.
using Unsubscribe = std::function<void()>;

/// The message-passing boundary to the remote engine.
///
/// Implementations deliver messages on one channel in publication order
/// and make no ordering promise across channels.
class MessageBus {
public:
    virtual ~MessageBus() = default;

    /// Runs a remote command and returns its response payload.
    virtual auto invoke(std::string_view command, json payload)
        -> awaitable<Result<json>> = 0;

    /// Registers `handler` for messages on `channel`. When this returns,
    /// the subscription is active.
    virtual auto subscribe(std::string channel, EventHandler handler)
        -> awaitable<Result<Unsubscribe>> = 0;
};

} // namespace llmgate::ipc
