#ifndef AGENTBOX_EVENT_STREAM_HPP
#define AGENTBOX_EVENT_STREAM_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace agentbox {

// Unique subscription identifier
struct SubscriptionId {
    uint64_t id;

    bool operator==(const SubscriptionId& other) const noexcept = default;
};

template<typename E>
class Subscription;

/**
 * @brief Minimal multicast notification primitive.
 *
 * Emit() synchronously invokes every observer subscribed at the time of
 * the call, in subscription order. Nothing is buffered: observers that
 * subscribe later never see earlier values.
 *
 * @par Thread Safety
 * Subscribe/Unsubscribe/Emit may be called from any thread. Observers run
 * on the emitting thread, outside the stream's lock, so an observer may
 * itself subscribe or unsubscribe. Exceptions thrown by an observer
 * propagate out of Emit().
 *
 * @tparam E Value type carried by the stream
 */
template<typename E>
class EventStream {
public:
    using Observer = std::function<void(const E&)>;

    EventStream()
        : state_(std::make_shared<State>())
    {
    }

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    // Register an observer; returns the id needed to unsubscribe
    [[nodiscard]] SubscriptionId Subscribe(Observer observer) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        SubscriptionId id{state_->next_id++};
        state_->observers.push_back({id, std::make_shared<Observer>(std::move(observer))});
        return id;
    }

    // Register an observer that is removed when the guard is destroyed
    [[nodiscard]] Subscription<E> SubscribeScoped(Observer observer) {
        return Subscription<E>(state_, Subscribe(std::move(observer)));
    }

    // Returns true if the subscription was found and removed
    bool Unsubscribe(SubscriptionId id) {
        return Remove(*state_, id);
    }

    // Deliver `value` to every current observer
    void Emit(const E& value) const {
        std::vector<std::shared_ptr<Observer>> snapshot;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            snapshot.reserve(state_->observers.size());
            for (const auto& entry : state_->observers) {
                snapshot.push_back(entry.observer);
            }
        }

        for (const auto& observer : snapshot) {
            (*observer)(value);
        }
    }

    [[nodiscard]] size_t SubscriberCount() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->observers.size();
    }

private:
    friend class Subscription<E>;

    struct Entry {
        SubscriptionId id;
        std::shared_ptr<Observer> observer;
    };

    // Shared with Subscription guards so they can outlive the stream
    struct State {
        mutable std::mutex mutex;
        std::vector<Entry> observers;
        uint64_t next_id = 1;
    };

    static bool Remove(State& state, SubscriptionId id) {
        std::lock_guard<std::mutex> lock(state.mutex);
        auto it = std::find_if(state.observers.begin(), state.observers.end(),
            [id](const Entry& entry) { return entry.id == id; });
        if (it == state.observers.end()) {
            return false;
        }
        state.observers.erase(it);
        return true;
    }

    std::shared_ptr<State> state_;
};

/**
 * @brief RAII guard that unsubscribes when destroyed.
 *
 * Safe to destroy after the stream itself is gone.
 */
template<typename E>
class Subscription {
public:
    Subscription() = default;

    ~Subscription() {
        Reset();
    }

    // Move-only
    Subscription(Subscription&& other) noexcept
        : state_(std::move(other.state_))
        , id_(other.id_)
    {
        other.state_.reset();
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            Reset();
            state_ = std::move(other.state_);
            id_ = other.id_;
            other.state_.reset();
        }
        return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    // Unsubscribe now
    void Reset() {
        if (auto state = state_.lock()) {
            EventStream<E>::Remove(*state, id_);
        }
        state_.reset();
    }

    // Release ownership without unsubscribing
    SubscriptionId Release() noexcept {
        state_.reset();
        return id_;
    }

    [[nodiscard]] SubscriptionId Id() const noexcept { return id_; }

private:
    friend class EventStream<E>;

    Subscription(std::weak_ptr<typename EventStream<E>::State> state, SubscriptionId id)
        : state_(std::move(state))
        , id_(id)
    {
    }

    std::weak_ptr<typename EventStream<E>::State> state_;
    SubscriptionId id_{0};
};

} // namespace agentbox

#endif // AGENTBOX_EVENT_STREAM_HPP
