#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace llmgate::streaming {

/// Push-to-pull adapter: producers call push()/finish() from callbacks and
/// a single consumer pulls values in push order with `co_await next()`.
///
/// A push that finds the consumer suspended on an empty buffer hands the
/// value over directly. The consumed prefix of the buffer is dropped once
/// it has been fully drained past kCompactThreshold entries. All calls must
/// come from the executor the queue was built with.
template <typename T>
class EventQueue {
public:
    static constexpr std::size_t kCompactThreshold = 1024;

    explicit EventQueue(boost::asio::any_io_executor executor)
        : timer_(executor, boost::asio::steady_timer::time_point::max()) {}

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    /// Enqueues a value. Ignored once finish() has been called.
    void push(T value) {
        if (done_) return;
        if (waiting_) {
            waiting_ = false;
            handoff_ = std::move(value);
            timer_.cancel();
            return;
        }
        buffer_.push_back(std::move(value));
    }

    /// Ends the sequence. Buffered values are still delivered.
    void finish() {
        if (done_) return;
        done_ = true;
        if (waiting_) {
            waiting_ = false;
            timer_.cancel();
        }
    }

    /// Next value in push order, or nullopt once finished and drained.
    auto next() -> boost::asio::awaitable<std::optional<T>> {
        for (;;) {
            if (handoff_) {
                auto value = std::move(handoff_);
                handoff_.reset();
                co_return value;
            }
            if (read_index_ < buffer_.size()) {
                auto value = std::move(buffer_[read_index_++]);
                compact();
                co_return std::optional<T>(std::move(value));
            }
            if (done_) {
                co_return std::nullopt;
            }

            waiting_ = true;
            boost::system::error_code ec;
            co_await timer_.async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            waiting_ = false;
        }
    }

    [[nodiscard]] auto finished() const noexcept -> bool { return done_; }

    /// Values pushed but not yet consumed.
    [[nodiscard]] auto pending() const noexcept -> std::size_t {
        return buffer_.size() - read_index_ + (handoff_ ? 1 : 0);
    }

    /// Slots held by the buffer, consumed ones included.
    [[nodiscard]] auto buffered() const noexcept -> std::size_t { return buffer_.size(); }

private:
    void compact() {
        if (read_index_ > kCompactThreshold && read_index_ == buffer_.size()) {
            buffer_.clear();
            read_index_ = 0;
        }
    }

    std::vector<T> buffer_;
    std::size_t read_index_ = 0;
    std::optional<T> handoff_;
    bool waiting_ = false;
    bool done_ = false;
    boost::asio::steady_timer timer_;
};

} // namespace llmgate::streaming
