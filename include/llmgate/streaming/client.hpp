#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <utility>
#include <boost/asio/awaitable.hpp>

#include "llmgate/core/error.hpp"
#include "llmgate/ipc/bus.hpp"
#include "llmgate/models/model.hpp"
#include "llmgate/providers/credentials.hpp"
#include "llmgate/streaming/cancellation.hpp"
#include "llmgate/streaming/event.hpp"
#include "llmgate/streaming/request.hpp"

namespace llmgate::streaming {

using boost::asio::awaitable;

/// Remote command that starts a streamed generation.
inline constexpr std::string_view kStreamCommand = "llm_stream_text";

/// Channel carrying the events of one request: "llm-stream-<requestId>".
auto stream_channel_name(std::string_view request_id) -> std::string;

/// Lifecycle of one streaming request. Done, Error and Aborted are final.
enum class StreamState {
    Created,
    Listening,
    Sent,
    Streaming,
    Done,
    Error,
    Aborted,
};

auto stream_state_name(StreamState state) -> std::string_view;

struct StreamSession;

/// The caller's view of one streaming request: a single-pass sequence of
/// events ending after the terminal event or on cancellation. Dropping it
/// early is allowed; the subscription is still released by the terminal
/// event or by firing the request's cancellation signal.
class EventStream {
public:
    [[nodiscard]] auto request_id() const -> const std::string&;

    /// Next event, or nullopt once the stream has ended.
    auto next() -> awaitable<std::optional<StreamEvent>>;

    [[nodiscard]] auto state() const -> StreamState;

    /// True when the stream ended because its cancellation signal fired.
    [[nodiscard]] auto cancelled() const -> bool;

private:
    friend class LlmClient;
    explicit EventStream(std::shared_ptr<StreamSession> session);

    std::shared_ptr<StreamSession> session_;
};

/// Text assembled from a whole stream.
struct CollectedText {
    std::string text;
    std::optional<std::string> finish_reason;
};

/// Issues streaming requests to the remote engine over a MessageBus.
///
/// Each request subscribes to its channel before the remote call is made,
/// so no event can be emitted before a listener exists.
class LlmClient {
public:
    explicit LlmClient(ipc::MessageBus& bus);

    /// Starts a streamed generation. Fails with Cancelled when `signal`
    /// fires before the stream is handed back, RequestIdMismatch when the
    /// engine echoes a different request id, and with the bus error when
    /// subscription or invocation fails. Every failure path tears down.
    auto stream_text(StreamTextRequest request, CancellationSignal signal = {})
        -> awaitable<Result<EventStream>>;

    /// Drains a stream, concatenating text deltas. Error events are
    /// logged, not raised.
    auto collect_text(StreamTextRequest request, CancellationSignal signal = {})
        -> awaitable<Result<CollectedText>>;

    auto list_available_models() -> awaitable<Result<std::vector<models::AvailableModel>>>;
    auto is_model_available_remote(std::string_view model_identifier) -> awaitable<Result<bool>>;
    auto set_setting(std::string_view key, std::string_view value) -> awaitable<Result<void>>;
    auto refresh_oauth(std::string_view provider_id) -> awaitable<Result<providers::OAuthBundle>>;

    /// Requests that have not been torn down yet.
    [[nodiscard]] auto live_requests() const -> std::size_t;

private:
    ipc::MessageBus& bus_;
    std::shared_ptr<std::set<std::string, std::less<>>> live_ids_;
};

} // namespace llmgate::streaming
