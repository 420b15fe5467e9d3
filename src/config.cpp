#include "agentbox/detail/config.hpp"

namespace agentbox {

std::string_view ToString(PostResult result) noexcept {
    switch (result) {
        case PostResult::Success: return "Success";
        case PostResult::Closed: return "Closed";
        case PostResult::Cancelled: return "Cancelled";
        case PostResult::QueueFull: return "QueueFull";
        case PostResult::Timeout: return "Timeout";
    }
    return "Unknown";
}

std::string_view ToString(ReceiveResult result) noexcept {
    switch (result) {
        case ReceiveResult::Success: return "Success";
        case ReceiveResult::Closed: return "Closed";
        case ReceiveResult::Cancelled: return "Cancelled";
        case ReceiveResult::Empty: return "Empty";
        case ReceiveResult::Timeout: return "Timeout";
    }
    return "Unknown";
}

std::string_view ToString(StartResult result) noexcept {
    switch (result) {
        case StartResult::Success: return "Success";
        case StartResult::AlreadyStarted: return "AlreadyStarted";
        case StartResult::PoolUnavailable: return "PoolUnavailable";
    }
    return "Unknown";
}

std::string_view ToString(ReplyResult result) noexcept {
    switch (result) {
        case ReplyResult::Success: return "Success";
        case ReplyResult::Closed: return "Closed";
        case ReplyResult::Cancelled: return "Cancelled";
        case ReplyResult::TimedOut: return "TimedOut";
    }
    return "Unknown";
}

} // namespace agentbox
