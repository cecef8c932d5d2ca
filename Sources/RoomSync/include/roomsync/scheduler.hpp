#pragma once

#ifdef __cplusplus

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace roomsync {

// ============================================================================
// scheduler - where sync completions run
// ============================================================================
//
// The embedder picks the context: a UI run loop (run_loop_scheduler), a
// background worker (worker_scheduler) or the calling thread
// (immediate_scheduler, the default).

struct scheduler {
    virtual ~scheduler() = default;

    // Queue fn on this scheduler's context. Callable from any thread.
    virtual void invoke(std::function<void()>&& fn) = 0;

    [[nodiscard]] virtual bool is_on_thread() const noexcept = 0;

    // False once the scheduler stopped accepting work.
    [[nodiscard]] virtual bool can_invoke() const noexcept = 0;
};

using SharedScheduler = std::shared_ptr<scheduler>;

class immediate_scheduler : public scheduler {
public:
    void invoke(std::function<void()>&& fn) override {
        if (fn) fn();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override { return true; }
    [[nodiscard]] bool can_invoke() const noexcept override { return true; }
};

// ============================================================================
// worker_scheduler - one background thread draining a FIFO queue
// ============================================================================

class worker_scheduler : public scheduler {
public:
    worker_scheduler();

    /// Runs whatever is still queued, then joins the worker.
    ~worker_scheduler() override;

    worker_scheduler(const worker_scheduler&) = delete;
    worker_scheduler& operator=(const worker_scheduler&) = delete;

    void invoke(std::function<void()>&& fn) override;

    [[nodiscard]] bool is_on_thread() const noexcept override;
    [[nodiscard]] bool can_invoke() const noexcept override { return accepting_; }

private:
    std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<std::function<void()>> queue_;
    std::atomic<bool> accepting_{true};
    std::thread worker_;

    void drain();
};

// ============================================================================
// run_loop_scheduler - work waits for the owning thread's run loop
// ============================================================================

class run_loop_scheduler : public scheduler {
public:
    // The constructing thread owns the loop
    run_loop_scheduler() : owner_(std::this_thread::get_id()) {}

    void invoke(std::function<void()>&& fn) override;

    /// Run everything queued so far. Returns the number of callbacks run.
    size_t process_pending();

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == owner_;
    }
    [[nodiscard]] bool can_invoke() const noexcept override { return true; }

private:
    std::thread::id owner_;
    std::mutex mutex_;
    std::deque<std::function<void()>> queue_;
};

} // namespace roomsync

#endif // __cplusplus
