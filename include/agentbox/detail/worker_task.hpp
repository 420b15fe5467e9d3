#ifndef AGENTBOX_DETAIL_WORKER_TASK_HPP
#define AGENTBOX_DETAIL_WORKER_TASK_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <mutex>
#include <stop_token>
#include <thread>

namespace agentbox::detail {

/**
 * @brief Handle to one run of an agent body.
 *
 * Created by Agent::Start() before the body is scheduled and completed by
 * the worker after lifecycle cleanup has run, so a caller that observes
 * IsDone() also observes the agent back in Idle.
 *
 * @par Thread Safety
 * All methods are thread-safe. Complete() is first-wins.
 */
class WorkerTask {
public:
    WorkerTask();

    WorkerTask(const WorkerTask&) = delete;
    WorkerTask& operator=(const WorkerTask&) = delete;

    // Sequence number, unique per process (for log lines)
    [[nodiscard]] uint64_t Id() const noexcept { return id_; }

    // Record the thread running the body
    void BindToCurrentThread() noexcept;

    // True when called from the thread running the body
    [[nodiscard]] bool IsCurrentThread() const noexcept;

    // Record the outcome (null = success) and wake waiters.
    // Returns false if the task had already completed.
    bool Complete(std::exception_ptr failure);

    // BLOCKS: Until Complete()
    void Wait() const;

    // BLOCKS: Until Complete() or timeout; returns IsDone()
    [[nodiscard]] bool WaitFor(std::chrono::milliseconds timeout) const;

    [[nodiscard]] bool IsDone() const noexcept;

    // The body has returned; only lifecycle cleanup is left before Complete()
    void MarkExited() noexcept { exited_.store(true, std::memory_order_release); }
    [[nodiscard]] bool HasExited() const noexcept { return exited_.load(std::memory_order_acquire); }

    // Outcome recorded by Complete(); null while running or on success
    [[nodiscard]] std::exception_ptr Failure() const;

    // Fired when the run is asked to stop or has exited; requests waiting
    // on a reply from this run link to it
    [[nodiscard]] std::stop_token GetStopToken() const noexcept { return run_scope_.get_token(); }
    void RequestStop() noexcept { run_scope_.request_stop(); }

private:
    const uint64_t id_;
    std::atomic<std::thread::id> thread_{};
    std::atomic<bool> exited_{false};
    std::atomic<bool> done_{false};
    std::stop_source run_scope_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::exception_ptr failure_;
};

} // namespace agentbox::detail

#endif // AGENTBOX_DETAIL_WORKER_TASK_HPP
