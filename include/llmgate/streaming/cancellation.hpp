#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>

namespace llmgate::streaming {

/// Caller-owned abort flag shared by copies of the same signal.
///
/// fire() may be called at any time and any number of times; listeners
/// run once, on the first call. A listener added after the signal fired
/// is not called.
class CancellationSignal {
public:
    using Listener = std::function<void()>;
    using ListenerId = uint64_t;

    CancellationSignal();

    void fire();
    [[nodiscard]] auto aborted() const noexcept -> bool;

    auto add_listener(Listener listener) -> ListenerId;
    void remove_listener(ListenerId id);

    [[nodiscard]] auto listener_count() const noexcept -> std::size_t;

private:
    struct State {
        bool aborted = false;
        ListenerId next_id = 1;
        std::map<ListenerId, Listener> listeners;
    };

    std::shared_ptr<State> state_;
};

} // namespace llmgate::streaming
