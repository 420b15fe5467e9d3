#ifndef AGENTBOX_REPLY_CHANNEL_HPP
#define AGENTBOX_REPLY_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include "agentbox/detail/config.hpp"

namespace agentbox {

/**
 * @brief Capability to answer one request.
 *
 * A message that expects an answer carries a ReplyChannel. The consumer
 * calls Reply() while handling the message; the poster waiting in
 * Agent::PostAndReply() receives the value. Only the first Reply() has an
 * effect, later calls (or a reply after the poster gave up) return false.
 *
 * Copies share the same destination.
 *
 * @tparam R Reply type
 */
template<typename R>
class ReplyChannel {
public:
    using Resolver = std::function<bool(R)>;

    ReplyChannel() = default;

    explicit ReplyChannel(Resolver resolver)
        : resolver_(std::move(resolver))
    {
    }

    // Returns true if this call resolved the request
    bool Reply(R value) const {
        if (!resolver_) {
            return false;
        }
        return resolver_(std::move(value));
    }

    [[nodiscard]] bool IsValid() const noexcept {
        return static_cast<bool>(resolver_);
    }

    explicit operator bool() const noexcept {
        return IsValid();
    }

private:
    Resolver resolver_;
};

namespace detail {

/**
 * @brief Single-assignment cell backing one PostAndReply() call.
 *
 * Exactly one of TrySetResult / TryCancel / TryTimeout wins; the rest
 * are no-ops returning false.
 */
template<typename R>
class ReplySlot {
public:
    enum class State {
        Pending,
        Resolved,
        Cancelled,
        TimedOut
    };

    bool TrySetResult(R value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != State::Pending) {
                return false;
            }
            value_.emplace(std::move(value));
            state_ = State::Resolved;
        }
        cv_.notify_all();
        return true;
    }

    bool TryCancel() {
        return TrySetTerminal(State::Cancelled);
    }

    bool TryTimeout() {
        return TrySetTerminal(State::TimedOut);
    }

    // BLOCKS: Until resolved, cancelled, or the deadline passes.
    // On deadline the slot is marked TimedOut unless it resolved first.
    [[nodiscard]] std::pair<ReplyResult, std::optional<R>> Wait(
        std::optional<std::chrono::steady_clock::time_point> deadline)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        const auto settled = [this]() { return state_ != State::Pending; };

        if (deadline.has_value()) {
            if (!cv_.wait_until(lock, *deadline, settled)) {
                state_ = State::TimedOut;
            }
        } else {
            cv_.wait(lock, settled);
        }

        switch (state_) {
            case State::Resolved:
                return {ReplyResult::Success, std::move(value_)};
            case State::Cancelled:
                return {ReplyResult::Cancelled, std::nullopt};
            case State::TimedOut:
            case State::Pending:
                break;
        }
        return {ReplyResult::TimedOut, std::nullopt};
    }

    [[nodiscard]] State GetState() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

private:
    bool TrySetTerminal(State terminal) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != State::Pending) {
                return false;
            }
            state_ = terminal;
        }
        cv_.notify_all();
        return true;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    State state_ = State::Pending;
    std::optional<R> value_;
};

// Channel whose replies land in `slot`
template<typename R>
[[nodiscard]] ReplyChannel<R> MakeReplyChannel(const std::shared_ptr<ReplySlot<R>>& slot) {
    return ReplyChannel<R>([slot](R value) {
        return slot->TrySetResult(std::move(value));
    });
}

} // namespace detail

} // namespace agentbox

#endif // AGENTBOX_REPLY_CHANNEL_HPP
