#include "roomsync/scheduler.hpp"

namespace roomsync {

// ============================================================================
// worker_scheduler
// ============================================================================

worker_scheduler::worker_scheduler()
    : worker_([this] { drain(); }) {}

worker_scheduler::~worker_scheduler() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        accepting_ = false;
    }
    wake_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void worker_scheduler::invoke(std::function<void()>&& fn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) return;
        queue_.push_back(std::move(fn));
    }
    wake_.notify_one();
}

bool worker_scheduler::is_on_thread() const noexcept {
    return std::this_thread::get_id() == worker_.get_id();
}

void worker_scheduler::drain() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        wake_.wait(lock, [this] { return !queue_.empty() || !accepting_; });
        if (queue_.empty()) return;  // stopped and drained

        auto fn = std::move(queue_.front());
        queue_.pop_front();

        lock.unlock();
        if (fn) fn();
        lock.lock();
    }
}

// ============================================================================
// run_loop_scheduler
// ============================================================================

void run_loop_scheduler::invoke(std::function<void()>&& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(fn));
}

size_t run_loop_scheduler::process_pending() {
    std::deque<std::function<void()>> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(queue_);
    }
    for (auto& fn : batch) {
        if (fn) fn();
    }
    return batch.size();
}

} // namespace roomsync
