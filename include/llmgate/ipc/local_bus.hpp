#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "llmgate/ipc/bus.hpp"

namespace llmgate::ipc {

/// Handler for a command served in-process.
using CommandHandler = std::function<awaitable<Result<json>>(json payload)>;

/// In-process MessageBus. Commands are registered by name and channel
/// messages are published with emit(). Backs tests and embedded engines.
class LocalBus : public MessageBus {
public:
    LocalBus();
    ~LocalBus() override;

    LocalBus(const LocalBus&) = delete;
    LocalBus& operator=(const LocalBus&) = delete;

    void register_command(std::string name, CommandHandler handler);
    [[nodiscard]] auto has_command(std::string_view name) const -> bool;

    auto invoke(std::string_view command, json payload) -> awaitable<Result<json>> override;
    auto subscribe(std::string channel, EventHandler handler)
        -> awaitable<Result<Unsubscribe>> override;

    /// Delivers `payload` to every current subscriber of `channel`.
    /// Returns the number of handlers called.
    auto emit(std::string_view channel, const json& payload) -> std::size_t;

    /// Suspends each subscribe() call for `delay` before it takes effect.
    void set_subscribe_delay(std::chrono::milliseconds delay);

    [[nodiscard]] auto subscription_count(std::string_view channel) const -> std::size_t;
    [[nodiscard]] auto subscription_count() const -> std::size_t;

    /// Number of subscriptions removed through their Unsubscribe handle.
    [[nodiscard]] auto unsubscribe_count() const -> std::size_t;

    /// Commands seen by invoke(), in call order.
    [[nodiscard]] auto invocations() const -> const std::vector<std::pair<std::string, json>>&;

private:
    struct State {
        std::map<std::string, std::map<uint64_t, EventHandler>, std::less<>> channels;
        uint64_t next_id = 1;
        std::size_t unsubscribed = 0;
    };

    std::unordered_map<std::string, CommandHandler> commands_;
    std::shared_ptr<State> state_;
    std::chrono::milliseconds subscribe_delay_{0};
    std::vector<std::pair<std::string, json>> invocations_;
};

} // namespace llmgate::ipc
