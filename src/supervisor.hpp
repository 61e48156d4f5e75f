#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string_view>

// Deadline and cancellation state of one attempt of a supervised task.
// Blocking operations poll it and give up early.
class TaskContext {
public:
    using Clock = std::chrono::steady_clock;

    TaskContext(Clock::time_point deadline, const std::atomic<bool>& cancelled);

    // No deadline, never cancelled
    static const TaskContext& unbounded();

    bool cancelled() const;
    bool expired() const;
    std::chrono::milliseconds remaining() const;

    // Throws TaskCancelled or TaskTimeout.
    void check() const;

private:
    Clock::time_point deadline_;
    const std::atomic<bool>& cancelled_;
};

struct BackoffPolicy {
    std::chrono::milliseconds base{250};
    double factor = 2.0;
    int max_retries = 3;

    // Delay before retry number `retry` (1-based)
    std::chrono::milliseconds delay(int retry) const;
};

// Runs `work` until it succeeds. Every attempt gets a fresh deadline of
// `timeout`. Failures are retried with backoff; the last one is rethrown once
// the retries are used up. TaskCancelled is rethrown immediately.
void run_supervised(std::string_view name,
                    std::chrono::milliseconds timeout,
                    const BackoffPolicy& policy,
                    const std::atomic<bool>& cancelled,
                    const std::function<void(const TaskContext&)>& work);

// Runs task(0) .. task(count - 1) on at most `workers` threads. The first
// exception sets `cancelled`, stops the remaining tasks from starting and is
// rethrown once every thread has finished.
void run_bounded(size_t workers,
                 size_t count,
                 const std::function<void(size_t)>& task,
                 std::atomic<bool>& cancelled);
