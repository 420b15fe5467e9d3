#include "agentbox/detail/worker_task.hpp"
#include "agentbox/detail/config.hpp"

namespace agentbox::detail {

namespace {

std::atomic<uint64_t> g_next_task_id{1};

} // namespace

WorkerTask::WorkerTask()
    : id_(g_next_task_id.fetch_add(1, std::memory_order_relaxed))
{
}

void WorkerTask::BindToCurrentThread() noexcept {
    thread_.store(std::this_thread::get_id(), std::memory_order_release);
}

bool WorkerTask::IsCurrentThread() const noexcept {
    return thread_.load(std::memory_order_acquire) == std::this_thread::get_id();
}

bool WorkerTask::Complete(std::exception_ptr failure) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (done_.load(std::memory_order_relaxed)) {
            return false;
        }
        failure_ = std::move(failure);
        done_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
    return true;
}

void WorkerTask::Wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return done_.load(std::memory_order_relaxed); });
}

bool WorkerTask::WaitFor(std::chrono::milliseconds timeout) const {
    const auto deadline = DeadlineAfter(timeout);
    if (!deadline.has_value()) {
        Wait();
        return true;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_until(lock, *deadline, [this]() { return done_.load(std::memory_order_relaxed); });
}

bool WorkerTask::IsDone() const noexcept {
    return done_.load(std::memory_order_acquire);
}

std::exception_ptr WorkerTask::Failure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_;
}

} // namespace agentbox::detail
