#ifndef AGENTBOX_AGENT_HPP
#define AGENTBOX_AGENT_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include "agentbox/detail/config.hpp"
#include "agentbox/detail/worker_task.hpp"
#include "agentbox/errors.hpp"
#include "agentbox/event_stream.hpp"
#include "agentbox/logger.hpp"
#include "agentbox/mailbox.hpp"
#include "agentbox/reply_channel.hpp"
#include "agentbox/thread_pool.hpp"

namespace agentbox {

/**
 * @brief Background worker draining a private mailbox.
 *
 * An agent owns one Mailbox<T> and a body. Start() schedules the body on a
 * ThreadPool, passing the agent itself so the body can Receive() messages
 * that other threads Post(). The body runs until it returns, throws, or
 * observes that the agent was stopped.
 *
 * @par Lifecycle
 * Idle -> Start() -> Running -> (Stop() | body exits) -> Idle
 * - Start() on a running agent returns AlreadyStarted and changes nothing.
 * - Stop() on an idle agent is a no-op.
 * - A body that exits (normally or by exception) returns the agent to Idle;
 *   it is never restarted automatically. Stop() closes the mailbox for
 *   good, so a stopped agent that is started again only sees Closed from
 *   Receive(); a body that returned on its own can be started again.
 *
 * @par Errors
 * Every exception escaping the body, OperationCancelled included, is
 * emitted once on Errors() and logged. Stop() rethrows it unless it is an
 * OperationCancelled, the expected way for a body to leave on shutdown;
 * only the others count as body faults in GetStats().
 *
 * @par Thread Safety
 * All methods are thread-safe. The lifecycle state and the worker handle
 * are only ever changed with compare-and-set.
 *
 * @par Lifetime
 * The destructor stops the agent and waits up to
 * AgentConfig::stop_grace_period for the worker. A body that ignores
 * shutdown for longer than that outlives its agent, which is undefined
 * behavior; bodies must return once Receive() reports a failure.
 *
 * @code
 * agentbox::Agent<std::string> printer([](auto& self) {
 *     while (true) {
 *         auto [result, msg] = self.Receive();
 *         if (result != agentbox::ReceiveResult::Success) {
 *             return;
 *         }
 *         std::cout << *msg << "\n";
 *     }
 * });
 * printer.Start();
 * printer.Post("hello");
 * printer.Stop();
 * @endcode
 *
 * @tparam T Message type (must be move-constructible)
 */
template<typename T>
class Agent {
public:
    using Body = std::function<void(Agent&)>;
    using ErrorStream = EventStream<std::exception_ptr>;

    enum class State : int {
        Idle = 0,
        Running = 1
    };

    // Statistics (relaxed atomics)
    struct Stats {
        typename Mailbox<T>::Stats mailbox;
        uint64_t starts;
        uint64_t body_faults;
        uint64_t replies_timed_out;
    };

    /**
     * @param body  Function run on the worker; receives this agent
     * @param config Agent configuration (auto-normalized)
     * @param token Cancellation signal governing the mailbox
     * @param pool  Execution context for the body; must outlive the agent
     */
    explicit Agent(
        Body body,
        AgentConfig config = {},
        std::stop_token token = {},
        ThreadPool& pool = ThreadPool::Shared())
        : config_(config.Normalize())
        , body_(std::move(body))
        , token_(token)
        , pool_(pool)
        , mailbox_(config_.mailbox, std::move(token))
        , default_reply_timeout_(config_.default_reply_timeout)
    {
    }

    ~Agent() {
        if (!StopFor(config_.stop_grace_period)) {
            detail::Logger()->warn("agent '{}' worker did not finish within {}ms; abandoning it",
                config_.name, config_.stop_grace_period.count());
        }
    }

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;
    Agent(Agent&&) = delete;
    Agent& operator=(Agent&&) = delete;

    /**
     * @brief Start the body on the thread pool.
     *
     * @return Success, AlreadyStarted (running, or a stopped run whose body
     *         has not returned yet), or PoolUnavailable (pool shut down)
     */
    StartResult Start() {
        auto task = std::make_shared<detail::WorkerTask>();

        // Claim the worker slot first: a non-null handle means a run is
        // still active, even if Stop() already flipped the state to Idle.
        // A run whose body already returned only has cleanup left, so it is
        // waited out; an agent observed Idle after its body exits can start.
        std::shared_ptr<detail::WorkerTask> current;
        while (!task_.compare_exchange_strong(current, task, std::memory_order_acq_rel)) {
            if (!current->HasExited() || current->IsCurrentThread()) {
                detail::Logger()->warn("agent '{}' already started", config_.name);
                return StartResult::AlreadyStarted;
            }
            current->Wait();
            current.reset();
        }

        int expected = static_cast<int>(State::Idle);
        if (!state_.compare_exchange_strong(expected, static_cast<int>(State::Running),
                                            std::memory_order_acq_rel)) {
            ReleaseHandle(task);
            detail::Logger()->warn("agent '{}' already started", config_.name);
            return StartResult::AlreadyStarted;
        }

        starts_.fetch_add(1, std::memory_order_relaxed);

        const bool submitted = pool_.Submit([this, task]() {
            RunBody(task);
        });

        if (!submitted) {
            int running = static_cast<int>(State::Running);
            state_.compare_exchange_strong(running, static_cast<int>(State::Idle), std::memory_order_acq_rel);
            ReleaseHandle(task);
            task->RequestStop();
            task->Complete(nullptr);
            detail::Logger()->error("agent '{}' could not start: thread pool is shut down", config_.name);
            return StartResult::PoolUnavailable;
        }

        detail::Logger()->info("agent '{}' started (run {})", config_.name, task->Id());
        return StartResult::Success;
    }

    /**
     * @brief Stop the agent and wait for the body to return.
     *
     * No-op unless the agent is running. Closes the mailbox, so the body's
     * pending Receive() fails, then waits for the worker. When called from
     * inside the body it does not wait.
     *
     * @throws Any exception that escaped the body, except OperationCancelled
     */
    void Stop() {
        auto task = BeginStop();
        if (!task || task->IsCurrentThread()) {
            return;
        }

        task->Wait();

        auto failure = task->Failure();
        if (failure && !IsCancellation(failure)) {
            std::rethrow_exception(failure);
        }
    }

    /**
     * @brief Stop without propagating body faults, waiting at most `grace`.
     *
     * Also waits for a run that is already winding down on its own.
     *
     * @return true if no worker is left running
     */
    bool StopFor(std::chrono::milliseconds grace) {
        BeginStop();

        auto task = task_.load(std::memory_order_acquire);
        if (!task || task->IsCurrentThread()) {
            return true;
        }
        return task->WaitFor(grace);
    }

    /**
     * @brief Queue a message for the body.
     *
     * @return Success, or the mailbox failure when the agent is running;
     *         Cancelled for any failure once the agent is not running
     */
    [[nodiscard]] PostResult Post(T message, std::chrono::milliseconds timeout = kNoTimeout) {
        return TranslatePost(mailbox_.Post(std::move(message), timeout));
    }

    // Non-blocking Post (QueueFull while running and full)
    [[nodiscard]] PostResult TryPost(T message) {
        return TranslatePost(mailbox_.TryPost(std::move(message)));
    }

    /**
     * @brief Post a request and wait for its reply.
     *
     * `make_message` receives a fresh ReplyChannel<R> and returns the
     * message to post. The body answers by calling Reply() on the channel
     * it finds in the message.
     *
     * @param timeout Overrides the default reply timeout; kNoTimeout waits
     *                forever
     * @return {Success, reply}, or {Cancelled | TimedOut | Closed, nullopt}.
     *         Cancelled when the agent's stop token fires, the agent stops,
     *         or the run that would have answered exits.
     */
    template<typename R, typename MakeMessage>
    [[nodiscard]] std::pair<ReplyResult, std::optional<R>> PostAndReply(
        MakeMessage&& make_message,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt)
    {
        const auto deadline = detail::DeadlineAfter(timeout.value_or(GetDefaultReplyTimeout()));

        auto slot = std::make_shared<detail::ReplySlot<R>>();

        // Derived scope: fires on the agent's cancellation, on the current
        // run stopping, or on timeout expiry
        std::stop_source scope;
        std::stop_callback link_agent(token_, [&scope]() { scope.request_stop(); });
        std::optional<std::stop_callback<std::function<void()>>> link_run;
        if (auto task = task_.load(std::memory_order_acquire)) {
            link_run.emplace(task->GetStopToken(), std::function<void()>([&scope]() { scope.request_stop(); }));
        }
        std::stop_callback cancel_reply(scope.get_token(), [slot]() { slot->TryCancel(); });

        T message = std::invoke(std::forward<MakeMessage>(make_message), detail::MakeReplyChannel(slot));

        const auto posted = Post(std::move(message), Remaining(deadline));
        if (posted != PostResult::Success) {
            slot->TryCancel();
            return {ToReplyResult(posted), std::nullopt};
        }

        auto outcome = slot->Wait(deadline);
        if (outcome.first == ReplyResult::TimedOut) {
            replies_timed_out_.fetch_add(1, std::memory_order_relaxed);
            scope.request_stop();
        }
        return outcome;
    }

    /**
     * @brief Take the next message; meant to be called from the body.
     *
     * BLOCKS: Until a message is queued, the agent stops or is cancelled,
     *         or the timeout elapses.
     * @return Mailbox result while running; Cancelled for any failure once
     *         the agent is not running
     */
    [[nodiscard]] std::pair<ReceiveResult, std::optional<T>> Receive(
        std::chrono::milliseconds timeout = kNoTimeout)
    {
        auto received = mailbox_.Receive(timeout);
        received.first = TranslateReceive(received.first);
        return received;
    }

    // Non-blocking Receive; Empty when nothing can be taken, including once
    // the agent is stopped or cancelled
    [[nodiscard]] std::pair<ReceiveResult, std::optional<T>> TryReceive() {
        auto received = mailbox_.TryReceive();
        received.first = TranslateReceive(received.first);
        return received;
    }

    // Publish a fault on Errors() without leaving the body
    void ReportError(std::exception_ptr error) {
        detail::Logger()->error("agent '{}' error: {}", config_.name, Describe(error));
        errors_.Emit(error);
    }

    // Faults raised by the body
    [[nodiscard]] ErrorStream& Errors() noexcept { return errors_; }

    // Running and not cancelled
    [[nodiscard]] bool IsRunning() const noexcept {
        return state_.load(std::memory_order_acquire) == static_cast<int>(State::Running)
            && !token_.stop_requested();
    }

    [[nodiscard]] State GetState() const noexcept {
        return static_cast<State>(state_.load(std::memory_order_acquire));
    }

    [[nodiscard]] std::chrono::milliseconds GetDefaultReplyTimeout() const noexcept {
        return default_reply_timeout_.load(std::memory_order_relaxed);
    }

    void SetDefaultReplyTimeout(std::chrono::milliseconds timeout) noexcept {
        default_reply_timeout_.store(std::max(timeout, std::chrono::milliseconds::zero()),
                                     std::memory_order_relaxed);
    }

    [[nodiscard]] std::stop_token GetStopToken() const noexcept { return token_; }
    [[nodiscard]] const std::string& Name() const noexcept { return config_.name; }

    // Returns the normalized configuration
    [[nodiscard]] const AgentConfig& GetConfig() const noexcept { return config_; }

    [[nodiscard]] size_t PendingMessages() const { return mailbox_.Size(); }

    [[nodiscard]] Stats GetStats() const noexcept {
        return Stats{
            .mailbox = mailbox_.GetStats(),
            .starts = starts_.load(std::memory_order_relaxed),
            .body_faults = body_faults_.load(std::memory_order_relaxed),
            .replies_timed_out = replies_timed_out_.load(std::memory_order_relaxed)
        };
    }

private:
    // Runs the exit step when the body returns or throws, even if an
    // error observer throws
    class CompletionGuard {
    public:
        CompletionGuard(Agent& agent, std::shared_ptr<detail::WorkerTask> task)
            : agent_(agent)
            , task_(std::move(task))
        {
        }

        ~CompletionGuard() {
            agent_.OnWorkerExit(task_, failure_);
        }

        CompletionGuard(const CompletionGuard&) = delete;
        CompletionGuard& operator=(const CompletionGuard&) = delete;

        void SetFailure(std::exception_ptr failure) noexcept { failure_ = std::move(failure); }

    private:
        Agent& agent_;
        std::shared_ptr<detail::WorkerTask> task_;
        std::exception_ptr failure_;
    };

    void RunBody(const std::shared_ptr<detail::WorkerTask>& task) {
        task->BindToCurrentThread();
        CompletionGuard guard(*this, task);

        std::exception_ptr failure;
        try {
            body_(*this);
        } catch (...) {
            failure = std::current_exception();
        }

        if (failure) {
            guard.SetFailure(failure);
            if (!IsCancellation(failure)) {
                body_faults_.fetch_add(1, std::memory_order_relaxed);
            }
            ReportError(failure);
        }
    }

    // Runs exactly once per Start(). After the handle is released `this`
    // may be destroyed at any time, so only `task` is touched afterwards.
    void OnWorkerExit(const std::shared_ptr<detail::WorkerTask>& task, const std::exception_ptr& failure) {
        task->MarkExited();
        detail::Logger()->info("agent '{}' run {} finished{}", config_.name, task->Id(),
            failure ? (IsCancellation(failure) ? " (cancelled)" : " with error") : "");

        int running = static_cast<int>(State::Running);
        state_.compare_exchange_strong(running, static_cast<int>(State::Idle), std::memory_order_acq_rel);
        ReleaseHandle(task);

        task->RequestStop();
        task->Complete(failure);
    }

    void ReleaseHandle(const std::shared_ptr<detail::WorkerTask>& task) noexcept {
        auto expected = task;
        task_.compare_exchange_strong(expected, nullptr, std::memory_order_acq_rel);
    }

    // Running -> Idle; returns the run to wait for, or null if not running
    std::shared_ptr<detail::WorkerTask> BeginStop() {
        int expected = static_cast<int>(State::Running);
        if (!state_.compare_exchange_strong(expected, static_cast<int>(State::Idle),
                                            std::memory_order_acq_rel)) {
            return nullptr;
        }

        auto task = task_.load(std::memory_order_acquire);
        detail::Logger()->info("agent '{}' stopping", config_.name);

        mailbox_.Stop();
        if (task) {
            task->RequestStop();
        }
        return task;
    }

    // Shutdown masks the precise failure: any failure while not running is Cancelled
    [[nodiscard]] PostResult TranslatePost(PostResult result) const noexcept {
        if (result == PostResult::Success || IsRunning()) {
            return result;
        }
        return PostResult::Cancelled;
    }

    [[nodiscard]] ReceiveResult TranslateReceive(ReceiveResult result) const noexcept {
        if (result == ReceiveResult::Success || result == ReceiveResult::Empty || IsRunning()) {
            return result;
        }
        return ReceiveResult::Cancelled;
    }

    [[nodiscard]] static ReplyResult ToReplyResult(PostResult result) noexcept {
        switch (result) {
            case PostResult::Closed: return ReplyResult::Closed;
            case PostResult::Timeout: return ReplyResult::TimedOut;
            case PostResult::Success:
            case PostResult::Cancelled:
            case PostResult::QueueFull:
                break;
        }
        return ReplyResult::Cancelled;
    }

    [[nodiscard]] static std::chrono::milliseconds Remaining(
        const std::optional<std::chrono::steady_clock::time_point>& deadline) noexcept
    {
        if (!deadline.has_value()) {
            return kNoTimeout;
        }
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            *deadline - std::chrono::steady_clock::now());
        return std::max(left, std::chrono::milliseconds::zero());
    }

    const AgentConfig config_;
    const Body body_;
    const std::stop_token token_;
    ThreadPool& pool_;

    Mailbox<T> mailbox_;
    ErrorStream errors_;

    std::atomic<int> state_{static_cast<int>(State::Idle)};
    std::atomic<std::shared_ptr<detail::WorkerTask>> task_;
    std::atomic<std::chrono::milliseconds> default_reply_timeout_;

    std::atomic<uint64_t> starts_{0};
    std::atomic<uint64_t> body_faults_{0};
    std::atomic<uint64_t> replies_timed_out_{0};
};

/**
 * @brief Construct an agent and start it in one call.
 *
 * @return Start result and the agent (non-null even if Start() failed)
 */
template<typename T>
[[nodiscard]] std::pair<StartResult, std::unique_ptr<Agent<T>>> StartAgent(
    typename Agent<T>::Body body,
    AgentConfig config = {},
    std::stop_token token = {},
    ThreadPool& pool = ThreadPool::Shared())
{
    auto agent = std::make_unique<Agent<T>>(std::move(body), std::move(config), std::move(token), pool);
    const auto result = agent->Start();
    return {result, std::move(agent)};
}

} // namespace agentbox

#endif // AGENTBOX_AGENT_HPP
