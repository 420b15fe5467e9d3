#ifndef AGENTBOX_DETAIL_CONFIG_HPP
#define AGENTBOX_DETAIL_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace agentbox {

// Sentinel meaning "wait forever"
inline constexpr std::chrono::milliseconds kNoTimeout = std::chrono::milliseconds::max();

namespace detail {

// Absolute steady-clock deadline `timeout` from now.
// nullopt for kNoTimeout and for timeouts past the clock's range, which
// callers treat as waiting forever.
[[nodiscard]] inline std::optional<std::chrono::steady_clock::time_point> DeadlineAfter(
    std::chrono::milliseconds timeout) noexcept
{
    using Clock = std::chrono::steady_clock;
    if (timeout == kNoTimeout) {
        return std::nullopt;
    }
    const auto now = Clock::now();
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    if (timeout >= headroom) {
        return std::nullopt;
    }
    return now + std::chrono::duration_cast<Clock::duration>(timeout);
}

} // namespace detail

// Post operation result codes
enum class PostResult {
    Success,
    Closed,
    Cancelled,
    QueueFull,
    Timeout
};

// Receive operation result codes
enum class ReceiveResult {
    Success,
    Closed,
    Cancelled,
    Empty,
    Timeout
};

// Agent start result codes
enum class StartResult {
    Success,
    AlreadyStarted,
    PoolUnavailable     // Thread pool is shut down
};

// Request/reply result codes
enum class ReplyResult {
    Success,
    Closed,
    Cancelled,
    TimedOut
};

[[nodiscard]] std::string_view ToString(PostResult result) noexcept;
[[nodiscard]] std::string_view ToString(ReceiveResult result) noexcept;
[[nodiscard]] std::string_view ToString(StartResult result) noexcept;
[[nodiscard]] std::string_view ToString(ReplyResult result) noexcept;

// Mailbox configuration parameters
struct MailboxConfig {
    static constexpr size_t kMinCapacity = 1;
    static constexpr size_t kMaxCapacity = 1'048'576;

    std::optional<size_t> capacity;     // nullopt = unbounded

    [[nodiscard]] bool IsBounded() const noexcept {
        return capacity.has_value();
    }

    // Normalize configuration to valid values
    [[nodiscard]] MailboxConfig Normalize() const noexcept {
        MailboxConfig normalized = *this;
        if (capacity.has_value()) {
            normalized.capacity = std::clamp(*capacity, kMinCapacity, kMaxCapacity);
        }
        return normalized;
    }

    // Validate configuration
    [[nodiscard]] bool IsValid() const noexcept {
        if (!capacity.has_value()) {
            return true;
        }
        return *capacity >= kMinCapacity && *capacity <= kMaxCapacity;
    }
};

// Agent configuration parameters
struct AgentConfig {
    std::string name = "agent";                                         // Used in log lines only
    MailboxConfig mailbox{};
    std::chrono::milliseconds default_reply_timeout = kNoTimeout;       // PostAndReply fallback
    std::chrono::milliseconds stop_grace_period = std::chrono::milliseconds(1000);  // Destructor wait

    [[nodiscard]] AgentConfig Normalize() const {
        AgentConfig normalized = *this;
        normalized.mailbox = mailbox.Normalize();
        if (normalized.name.empty()) {
            normalized.name = "agent";
        }
        // Negative durations are meaningless for both knobs
        normalized.default_reply_timeout = std::max(default_reply_timeout, std::chrono::milliseconds::zero());
        normalized.stop_grace_period = std::max(stop_grace_period, std::chrono::milliseconds::zero());
        return normalized;
    }

    [[nodiscard]] bool IsValid() const noexcept {
        return !name.empty()
            && mailbox.IsValid()
            && default_reply_timeout >= std::chrono::milliseconds::zero()
            && stop_grace_period >= std::chrono::milliseconds::zero();
    }
};

} // namespace agentbox

#endif // AGENTBOX_DETAIL_CONFIG_HPP
