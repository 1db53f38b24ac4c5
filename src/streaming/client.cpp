#include "llmgate/streaming/client.hpp"

#include "llmgate/core/logger.hpp"
#include "llmgate/core/utils.hpp"
#include "llmgate/streaming/event_queue.hpp"

#include <boost/asio/this_coro.hpp>

namespace llmgate::streaming {

/// Per-request state shared by the caller's EventStream, the channel
/// handler and the cancellation listener.
struct StreamSession {
    StreamSession(boost::asio::any_io_executor executor, std::string id,
                  CancellationSignal sig,
                  std::weak_ptr<std::set<std::string, std::less<>>> live)
        : request_id(std::move(id))
        , queue(std::move(executor))
        , signal(std::move(sig))
        , live_ids(std::move(live)) {}

    std::string request_id;
    StreamState state = StreamState::Created;
    EventQueue<StreamEvent> queue;
    CancellationSignal signal;
    std::optional<CancellationSignal::ListenerId> listener;
    ipc::Unsubscribe unsubscribe;
    std::weak_ptr<std::set<std::string, std::less<>>> live_ids;
    bool torn_down = false;
    bool cancelled = false;

    void on_message(const json& payload);
    void teardown(StreamState final_state);
};

namespace {

auto cancelled_error(const std::string& request_id) -> Error {
    return make_error(ErrorCode::Cancelled, "Stream request cancelled", request_id);
}

void log_event(const std::string& request_id, const StreamEvent& event) {
    if (const auto* err = std::get_if<ErrorEvent>(&event)) {
        LOG_ERROR("[{}] stream error: {}", request_id, err->message);
    } else if (const auto* done = std::get_if<Done>(&event)) {
        LOG_INFO("[{}] stream done ({})", request_id, done->finish_reason.value_or("none"));
    } else if (const auto* call = std::get_if<ToolCall>(&event)) {
        LOG_INFO("[{}] tool call {} ({})", request_id, call->tool_name, call->tool_call_id);
    } else if (const auto* usage = std::get_if<Usage>(&event)) {
        LOG_DEBUG("[{}] usage in={} out={}", request_id, usage->input_tokens,
                  usage->output_tokens);
    } else {
        LOG_DEBUG("[{}] {}", request_id, event_type_name(event));
    }
}

} // anonymous namespace

void StreamSession::on_message(const json& payload) {
    if (torn_down) {
        LOG_DEBUG("[{}] dropping event after teardown", request_id);
        return;
    }
    state = StreamState::Streaming;

    auto parsed = parse_stream_event(normalize_stream_event(payload));
    StreamEvent event = parsed
        ? std::move(*parsed)
        : StreamEvent{ErrorEvent{parsed.error().what(), "ProtocolError"}};

    log_event(request_id, event);
    bool terminal = is_terminal(event);
    bool failed = std::holds_alternative<ErrorEvent>(event);
    queue.push(std::move(event));

    if (terminal) {
        teardown(failed ? StreamState::Error : StreamState::Done);
    }
}

void StreamSession::teardown(StreamState final_state) {
    if (torn_down) return;
    torn_down = true;
    state = final_state;

    if (unsubscribe) {
        auto release = std::move(unsubscribe);
        unsubscribe = nullptr;
        release();
    }
    queue.finish();
    if (listener) {
        signal.remove_listener(*listener);
        listener.reset();
    }
    if (auto live = live_ids.lock()) {
        live->erase(request_id);
    }
    LOG_DEBUG("[{}] torn down ({})", request_id, stream_state_name(final_state));
}

auto stream_channel_name(std::string_view request_id) -> std::string {
    return "llm-stream-" + std::string(request_id);
}

auto stream_state_name(StreamState state) -> std::string_view {
    switch (state) {
        case StreamState::Created: return "created";
        case StreamState::Listening: return "listening";
        case StreamState::Sent: return "sent";
        case StreamState::Streaming: return "streaming";
        case StreamState::Done: return "done";
        case StreamState::Error: return "error";
        case StreamState::Aborted: return "aborted";
    }
    return "created";
}

// -- EventStream --

EventStream::EventStream(std::shared_ptr<StreamSession> session)
    : session_(std::move(session)) {}

auto EventStream::request_id() const -> const std::string& {
    return session_->request_id;
}

auto EventStream::next() -> awaitable<std::optional<StreamEvent>> {
    // Keep the session alive across the suspension.
    auto session = session_;
    co_return co_await session->queue.next();
}

auto EventStream::state() const -> StreamState {
    return session_->state;
}

auto EventStream::cancelled() const -> bool {
    return session_->cancelled;
}

// -- LlmClient --

LlmClient::LlmClient(ipc::MessageBus& bus)
    : bus_(bus)
    , live_ids_(std::make_shared<std::set<std::string, std::less<>>>()) {}

auto LlmClient::stream_text(StreamTextRequest request, CancellationSignal signal)
    -> awaitable<Result<EventStream>> {
    std::string request_id = request.request_id.value_or("");
    if (request_id.empty()) {
        request_id = utils::generate_uuid();
    }
    if (live_ids_->contains(request_id)) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
                                       "Request id already in use", request_id));
    }
    if (signal.aborted()) {
        LOG_INFO("[{}] cancelled before start", request_id);
        co_return make_fail(cancelled_error(request_id));
    }

    request.request_id = request_id;
    if (!request.trace_context) {
        request.trace_context = TraceContext{};
    }
    request.trace_context->metadata["client_start_ms"] = std::to_string(utils::timestamp_ms());

    auto executor = co_await boost::asio::this_coro::executor;
    auto session = std::make_shared<StreamSession>(executor, request_id, signal, live_ids_);
    live_ids_->insert(request_id);

    std::weak_ptr<StreamSession> weak = session;
    session->listener = signal.add_listener([weak]() {
        if (auto s = weak.lock()) {
            LOG_INFO("[{}] cancelled in state {}", s->request_id, stream_state_name(s->state));
            s->cancelled = true;
            s->teardown(StreamState::Aborted);
        }
    });

    LOG_INFO("[{}] stream_text model={} messages={}", request_id, request.model,
             request.messages.size());

    auto channel = stream_channel_name(request_id);
    auto subscription = co_await bus_.subscribe(
        channel, [session](const json& payload) { session->on_message(payload); });
    if (!subscription) {
        LOG_ERROR("[{}] subscribe to {} failed: {}", request_id, channel,
                  subscription.error().what());
        session->teardown(StreamState::Error);
        co_return make_fail(subscription.error());
    }
    if (session->torn_down) {
        // Cancelled while the subscription was being set up.
        (*subscription)();
        co_return make_fail(cancelled_error(request_id));
    }
    session->unsubscribe = std::move(*subscription);
    session->state = StreamState::Listening;
    LOG_DEBUG("[{}] listening on {}", request_id, channel);

    json payload{{"request", request}};
    auto response = co_await bus_.invoke(kStreamCommand, std::move(payload));
    if (session->cancelled) {
        co_return make_fail(cancelled_error(request_id));
    }
    if (!response) {
        LOG_ERROR("[{}] {} failed: {}", request_id, kStreamCommand, response.error().what());
        session->teardown(StreamState::Error);
        co_return make_fail(response.error());
    }

    std::string echoed;
    if (response->is_object() && response->contains("request_id") &&
        (*response)["request_id"].is_string()) {
        echoed = (*response)["request_id"].get<std::string>();
    }
    if (echoed != request_id) {
        LOG_ERROR("[{}] engine answered for request '{}'", request_id, echoed);
        session->teardown(StreamState::Error);
        co_return make_fail(make_error(ErrorCode::RequestIdMismatch,
                                       "Request id mismatch",
                                       "expected " + request_id + ", got " + echoed));
    }

    if (session->state == StreamState::Listening) {
        session->state = StreamState::Sent;
    }
    LOG_DEBUG("[{}] request sent", request_id);
    co_return EventStream(session);
}

auto LlmClient::collect_text(StreamTextRequest request, CancellationSignal signal)
    -> awaitable<Result<CollectedText>> {
    auto stream = co_await stream_text(std::move(request), std::move(signal));
    if (!stream) {
        co_return make_fail(stream.error());
    }

    CollectedText collected;
    while (auto event = co_await stream->next()) {
        if (const auto* delta = std::get_if<TextDelta>(&*event)) {
            collected.text += delta->text;
        } else if (const auto* done = std::get_if<Done>(&*event)) {
            collected.finish_reason = done->finish_reason;
        } else if (const auto* err = std::get_if<ErrorEvent>(&*event)) {
            LOG_ERROR("[{}] collect_text saw error event: {}", stream->request_id(),
                      err->message);
        }
    }

    if (stream->cancelled()) {
        co_return make_fail(cancelled_error(stream->request_id()));
    }
    co_return collected;
}

auto LlmClient::list_available_models()
    -> awaitable<Result<std::vector<models::AvailableModel>>> {
    auto response = co_await bus_.invoke("llm_list_available_models", json::object());
    if (!response) {
        co_return make_fail(response.error());
    }
    try {
        const auto& list = response->is_object() && response->contains("models")
            ? (*response)["models"] : *response;
        co_return list.get<std::vector<models::AvailableModel>>();
    } catch (const json::exception& e) {
        co_return make_fail(make_error(ErrorCode::SerializationError,
                                       "Invalid model list", e.what()));
    }
}

auto LlmClient::is_model_available_remote(std::string_view model_identifier)
    -> awaitable<Result<bool>> {
    json payload{{"modelIdentifier", std::string(model_identifier)}};
    auto response = co_await bus_.invoke("llm_is_model_available", std::move(payload));
    if (!response) {
        co_return make_fail(response.error());
    }
    if (response->is_boolean()) {
        co_return response->get<bool>();
    }
    co_return response->is_object() && response->value("available", false);
}

auto LlmClient::set_setting(std::string_view key, std::string_view value)
    -> awaitable<Result<void>> {
    json payload{{"key", std::string(key)}, {"value", std::string(value)}};
    auto response = co_await bus_.invoke("llm_set_setting", std::move(payload));
    if (!response) {
        co_return make_fail(response.error());
    }
    co_return ok_result();
}

auto LlmClient::refresh_oauth(std::string_view provider_id)
    -> awaitable<Result<providers::OAuthBundle>> {
    json payload{{"provider", std::string(provider_id)}};
    auto response = co_await bus_.invoke("llm_oauth_refresh", std::move(payload));
    if (!response) {
        co_return make_fail(response.error());
    }
    try {
        auto bundle = response->get<providers::OAuthBundle>();
        if (bundle.access_token.empty()) {
            co_return make_fail(make_error(ErrorCode::Unauthorized,
                                           "OAuth refresh returned no token",
                                           std::string(provider_id)));
        }
        co_return bundle;
    } catch (const json::exception& e) {
        co_return make_fail(make_error(ErrorCode::SerializationError,
                                       "Invalid OAuth refresh response", e.what()));
    }
}

auto LlmClient::live_requests() const -> std::size_t {
    return live_ids_->size();
}

} // namespace llmgate::streaming
