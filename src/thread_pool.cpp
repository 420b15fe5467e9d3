#include "agentbox/thread_pool.hpp"
#include "agentbox/logger.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace agentbox {

struct ThreadPool::Impl {
    const size_t max_threads;

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<Job> queue;
    std::vector<std::thread> workers;
    size_t idle = 0;
    bool stopping = false;

    std::atomic<bool> shutdown_flag{false};
    std::atomic<uint64_t> jobs_completed{0};
    std::atomic<uint64_t> jobs_failed{0};

    explicit Impl(size_t max)
        : max_threads(max)
    {
    }

    // Caller holds mutex
    void SpawnWorker() {
        workers.emplace_back([this]() { WorkerLoop(); });
        detail::Logger()->debug("thread pool grew to {} workers", workers.size());
    }

    void WorkerLoop() {
        std::unique_lock<std::mutex> lock(mutex);
        while (true) {
            ++idle;
            cv.wait(lock, [this]() { return stopping || !queue.empty(); });
            --idle;

            if (queue.empty()) {
                // stopping and drained
                return;
            }

            Job job = std::move(queue.front());
            queue.pop_front();
            lock.unlock();

            RunJob(job);

            lock.lock();
        }
    }

    void RunJob(Job& job) {
        try {
            job();
        } catch (const std::exception& e) {
            jobs_failed.fetch_add(1, std::memory_order_relaxed);
            detail::Logger()->error("thread pool job threw: {}", e.what());
        } catch (...) {
            jobs_failed.fetch_add(1, std::memory_order_relaxed);
            detail::Logger()->error("thread pool job threw a non-standard exception");
        }
        jobs_completed.fetch_add(1, std::memory_order_relaxed);
    }
};

ThreadPool::ThreadPool(size_t min_threads, size_t max_threads)
    : pimpl_(std::make_unique<Impl>(std::max({max_threads, min_threads, size_t(1)})))
{
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    for (size_t i = 0; i < min_threads; ++i) {
        pimpl_->SpawnWorker();
    }
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

ThreadPool& ThreadPool::Shared() noexcept {
    // Never destroyed: agents may still submit or finish jobs while other
    // translation units' statics are being torn down.
    static ThreadPool* instance = new ThreadPool();
    return *instance;
}

bool ThreadPool::Submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (pimpl_->stopping) {
            return false;
        }

        pimpl_->queue.push_back(std::move(job));

        // Every queued job needs a free worker, since bodies block
        if (pimpl_->idle < pimpl_->queue.size() && pimpl_->workers.size() < pimpl_->max_threads) {
            pimpl_->SpawnWorker();
        }
    }
    pimpl_->cv.notify_one();
    return true;
}

void ThreadPool::Shutdown() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (pimpl_->stopping) {
            return;
        }
        pimpl_->stopping = true;
        pimpl_->shutdown_flag.store(true, std::memory_order_release);
        workers.swap(pimpl_->workers);
    }
    pimpl_->cv.notify_all();

    const auto self = std::this_thread::get_id();
    for (auto& worker : workers) {
        if (worker.get_id() == self) {
            worker.detach();
        } else if (worker.joinable()) {
            worker.join();
        }
    }
}

bool ThreadPool::IsShutdown() const noexcept {
    return pimpl_->shutdown_flag.load(std::memory_order_acquire);
}

size_t ThreadPool::MaxThreads() const noexcept {
    return pimpl_->max_threads;
}

ThreadPool::Stats ThreadPool::GetStats() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return Stats{
        .threads = pimpl_->workers.size(),
        .idle_threads = pimpl_->idle,
        .queued_jobs = pimpl_->queue.size(),
        .jobs_completed = pimpl_->jobs_completed.load(std::memory_order_relaxed),
        .jobs_failed = pimpl_->jobs_failed.load(std::memory_order_relaxed)
    };
}

} // namespace agentbox
