#ifndef AGENTBOX_MAILBOX_HPP
#define AGENTBOX_MAILBOX_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>
#include "agentbox/detail/config.hpp"

namespace agentbox {

/**
 * @brief Cancellable, optionally bounded FIFO queue with a single consumer.
 *
 * Any number of threads may post; one thread (the owning agent's body)
 * receives. Messages are handed out in the order their enqueue completed.
 *
 * @par Shutdown
 * Two independent mechanisms close the mailbox:
 * - Stop(): marks it closed; every pending and future operation
 *   reports Closed.
 * - The stop token given at construction: once stop is requested, every
 *   pending and future operation reports Cancelled.
 * TryReceive() is the exception: it only ever reports Success or Empty.
 *
 * Messages still queued when the mailbox closes stay in the structure but
 * are never handed out. A message is either received exactly once or
 * rejected at post time.
 *
 * @par Thread Safety
 * All methods are thread-safe. The queue is guarded by one mutex; waiting
 * posters and the receiver park on separate condition variables that also
 * observe the stop token.
 *
 * @tparam T Message type (must be move-constructible)
 */
template<typename T>
class Mailbox {
public:
    // Statistics (relaxed atomics)
    struct Stats {
        uint64_t messages_posted;
        uint64_t messages_received;
        uint64_t failed_posts;      // Closed + Cancelled + QueueFull + Timeout
        uint64_t failed_receives;   // Closed + Cancelled + Timeout (Empty not counted)
    };

    explicit Mailbox(MailboxConfig config = {}, std::stop_token token = {})
        : config_(config.Normalize())
        , token_(std::move(token))
    {
    }

    ~Mailbox() {
        Stop();
    }

    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;
    Mailbox(Mailbox&&) = delete;
    Mailbox& operator=(Mailbox&&) = delete;

    // Blocking post
    // BLOCKS: While bounded and full
    // WAKES: On Receive(), Stop(), stop request or timeout
    // WAKES ONE: Waiting receiver on success
    [[nodiscard]] PostResult Post(T message, std::chrono::milliseconds timeout = kNoTimeout) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (const auto rejected = PostRejection(); rejected.has_value()) {
            return FailPost(*rejected);
        }

        if (!HasSpace()) {
            const bool ready = WaitWithTimeout(not_full_, lock, timeout, [this]() {
                return closed_.load(std::memory_order_relaxed) || HasSpace();
            });

            if (const auto rejected = PostRejection(); rejected.has_value()) {
                return FailPost(*rejected);
            }
            if (!ready) {
                return FailPost(PostResult::Timeout);
            }
        }

        queue_.push_back(std::move(message));
        lock.unlock();

        messages_posted_.fetch_add(1, std::memory_order_relaxed);
        not_empty_.notify_one();
        return PostResult::Success;
    }

    // Non-blocking post
    // RETURNS: QueueFull immediately if bounded and full
    [[nodiscard]] PostResult TryPost(T message) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (const auto rejected = PostRejection(); rejected.has_value()) {
            return FailPost(*rejected);
        }
        if (!HasSpace()) {
            return FailPost(PostResult::QueueFull);
        }

        queue_.push_back(std::move(message));
        lock.unlock();

        messages_posted_.fetch_add(1, std::memory_order_relaxed);
        not_empty_.notify_one();
        return PostResult::Success;
    }

    // Blocking receive
    // BLOCKS: Until a message is queued
    // WAKES: On Post(), Stop(), stop request or timeout
    // POSTCONDITION: On Success, the message is removed from the queue
    [[nodiscard]] std::pair<ReceiveResult, std::optional<T>> Receive(
        std::chrono::milliseconds timeout = kNoTimeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);

        if (const auto rejected = ReceiveRejection(); rejected.has_value()) {
            return FailReceive(*rejected);
        }

        if (queue_.empty()) {
            const bool ready = WaitWithTimeout(not_empty_, lock, timeout, [this]() {
                return closed_.load(std::memory_order_relaxed) || !queue_.empty();
            });

            if (const auto rejected = ReceiveRejection(); rejected.has_value()) {
                return FailReceive(*rejected);
            }
            if (!ready) {
                return FailReceive(ReceiveResult::Timeout);
            }
        }

        return PopFront(lock);
    }

    // Non-blocking receive
    // RETURNS: Empty immediately if nothing can be taken (not an error);
    //          a closed or cancelled mailbox hands out nothing, so it is Empty too
    [[nodiscard]] std::pair<ReceiveResult, std::optional<T>> TryReceive() {
        std::unique_lock<std::mutex> lock(mutex_);

        if (ReceiveRejection().has_value() || queue_.empty()) {
            return {ReceiveResult::Empty, std::nullopt};
        }

        return PopFront(lock);
    }

    // Close the mailbox and release every waiter (idempotent)
    void Stop() noexcept {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_.exchange(true, std::memory_order_acq_rel)) {
                return;
            }
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    // Query state (approximate when read concurrently)
    [[nodiscard]] bool IsClosed() const noexcept {
        return closed_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool IsCancelled() const noexcept {
        return token_.stop_requested();
    }

    [[nodiscard]] size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] std::optional<size_t> Capacity() const noexcept {
        return config_.capacity;
    }

    // Returns the normalized configuration
    [[nodiscard]] MailboxConfig GetConfig() const noexcept {
        return config_;
    }

    [[nodiscard]] std::stop_token GetStopToken() const noexcept {
        return token_;
    }

    [[nodiscard]] Stats GetStats() const noexcept {
        return Stats{
            .messages_posted = messages_posted_.load(std::memory_order_relaxed),
            .messages_received = messages_received_.load(std::memory_order_relaxed),
            .failed_posts = failed_posts_.load(std::memory_order_relaxed),
            .failed_receives = failed_receives_.load(std::memory_order_relaxed)
        };
    }

private:
    // Caller holds mutex_
    [[nodiscard]] bool HasSpace() const noexcept {
        return !config_.capacity.has_value() || queue_.size() < *config_.capacity;
    }

    // Closed wins over Cancelled when both apply
    [[nodiscard]] std::optional<PostResult> PostRejection() const noexcept {
        if (closed_.load(std::memory_order_relaxed)) {
            return PostResult::Closed;
        }
        if (token_.stop_requested()) {
            return PostResult::Cancelled;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<ReceiveResult> ReceiveRejection() const noexcept {
        if (closed_.load(std::memory_order_relaxed)) {
            return ReceiveResult::Closed;
        }
        if (token_.stop_requested()) {
            return ReceiveResult::Cancelled;
        }
        return std::nullopt;
    }

    PostResult FailPost(PostResult result) noexcept {
        failed_posts_.fetch_add(1, std::memory_order_relaxed);
        return result;
    }

    std::pair<ReceiveResult, std::optional<T>> FailReceive(ReceiveResult result) noexcept {
        failed_receives_.fetch_add(1, std::memory_order_relaxed);
        return {result, std::nullopt};
    }

    // Caller holds `lock` on a non-empty queue; releases it
    std::pair<ReceiveResult, std::optional<T>> PopFront(std::unique_lock<std::mutex>& lock) {
        std::optional<T> message(std::move(queue_.front()));
        queue_.pop_front();
        lock.unlock();

        messages_received_.fetch_add(1, std::memory_order_relaxed);
        not_full_.notify_one();
        return {ReceiveResult::Success, std::move(message)};
    }

    // Returns the predicate's final value (false on timeout or stop request)
    template<typename Predicate>
    bool WaitWithTimeout(
        std::condition_variable_any& cv,
        std::unique_lock<std::mutex>& lock,
        std::chrono::milliseconds timeout,
        Predicate predicate)
    {
        const auto deadline = detail::DeadlineAfter(timeout);
        if (!deadline.has_value()) {
            return cv.wait(lock, token_, predicate);
        }
        return cv.wait_until(lock, token_, *deadline, predicate);
    }

    const MailboxConfig config_;
    const std::stop_token token_;

    mutable std::mutex mutex_;
    std::condition_variable_any not_empty_;
    std::condition_variable_any not_full_;
    std::deque<T> queue_;
    std::atomic<bool> closed_{false};

    std::atomic<uint64_t> messages_posted_{0};
    std::atomic<uint64_t> messages_received_{0};
    std::atomic<uint64_t> failed_posts_{0};
    std::atomic<uint64_t> failed_receives_{0};
};

} // namespace agentbox

#endif // AGENTBOX_MAILBOX_HPP
