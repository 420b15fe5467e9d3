#ifndef AGENTBOX_THREAD_POOL_HPP
#define AGENTBOX_THREAD_POOL_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace agentbox {

/**
 * @brief Elastic worker pool that agent bodies are scheduled onto.
 *
 * Jobs are taken from one shared FIFO queue. A body usually blocks in
 * Receive() for its whole lifetime, so the pool starts a new worker
 * whenever a job is queued and no idle worker is left to take it, up to
 * max_threads. Workers never exit before Shutdown().
 *
 * @par Thread Safety
 * All methods are thread-safe.
 */
class ThreadPool {
public:
    using Job = std::function<void()>;

    static constexpr size_t kDefaultMaxThreads = 256;

    // Approximate counters
    struct Stats {
        size_t threads;          ///< Live workers (0 once Shutdown() has joined them)
        size_t idle_threads;     ///< Workers parked waiting for a job
        size_t queued_jobs;      ///< Jobs not yet picked up
        uint64_t jobs_completed; ///< Jobs that returned or threw
        uint64_t jobs_failed;    ///< Jobs that threw
    };

    /**
     * @brief Create a pool.
     *
     * @param min_threads Workers started immediately
     * @param max_threads Upper bound on workers (clamped to >= 1 and >= min_threads)
     */
    explicit ThreadPool(size_t min_threads = 0, size_t max_threads = kDefaultMaxThreads);

    // Shutdown() and join
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /**
     * @brief Process-wide pool used by agents that are not given one.
     *
     * Like any leaked singleton it is never destroyed, so agents alive
     * during static destruction can still finish their jobs.
     */
    [[nodiscard]] static ThreadPool& Shared() noexcept;

    /**
     * @brief Queue a job.
     *
     * @return false if the pool is shutting down (job is dropped)
     *
     * @par Exceptions
     * Exceptions escaping a job are logged and counted in
     * Stats::jobs_failed; they never terminate the worker.
     */
    bool Submit(Job job);

    /**
     * @brief Stop accepting jobs, run what is queued, join workers.
     *
     * Idempotent. When called from one of the pool's own workers, that
     * worker is detached instead of joined.
     */
    void Shutdown();

    [[nodiscard]] bool IsShutdown() const noexcept;
    [[nodiscard]] size_t MaxThreads() const noexcept;
    [[nodiscard]] Stats GetStats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace agentbox

#endif // AGENTBOX_THREAD_POOL_HPP
