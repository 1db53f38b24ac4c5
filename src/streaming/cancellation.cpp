#include "llmgate/streaming/cancellation.hpp"

#include "llmgate/core/logger.hpp"

namespace llmgate::streaming {

CancellationSignal::CancellationSignal()
    : state_(std::make_shared<State>()) {}

void CancellationSignal::fire() {
    if (state_->aborted) return;
    state_->aborted = true;

    // Listeners commonly remove themselves; detach the set before calling.
    auto listeners = std::move(state_->listeners);
    state_->listeners.clear();
    LOG_DEBUG("Cancellation fired ({} listeners)", listeners.size());
    for (auto& [id, listener] : listeners) {
        listener();
    }
}

auto CancellationSignal::aborted() const noexcept -> bool {
    return state_->aborted;
}

auto CancellationSignal::add_listener(Listener listener) -> ListenerId {
    auto id = state_->next_id++;
    if (!state_->aborted) {
        state_->listeners.emplace(id, std::move(listener));
    }
    return id;
}

void CancellationSignal::remove_listener(ListenerId id) {
    state_->listeners.erase(id);
}

auto CancellationSignal::listener_count() const noexcept -> std::size_t {
    return state_->listeners.size();
}

} // namespace llmgate::streaming
