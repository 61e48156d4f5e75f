#include "supervisor.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr std::chrono::milliseconds SLEEP_SLICE{50};

// Sleeps for `duration` but wakes up early when the run is cancelled.
void interruptible_sleep(std::chrono::milliseconds duration, const std::atomic<bool>& cancelled) {
    const auto until = std::chrono::steady_clock::now() + duration;
    while (!cancelled) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= until) return;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(SLEEP_SLICE, until - now));
    }
}

} // anonymous namespace

TaskContext::TaskContext(Clock::time_point deadline, const std::atomic<bool>& cancelled)
    : deadline_(deadline), cancelled_(cancelled) {}

const TaskContext& TaskContext::unbounded() {
    static const std::atomic<bool> never{false};
    static const TaskContext ctx(Clock::time_point::max(), never);
    return ctx;
}

bool TaskContext::cancelled() const {
    return cancelled_.load();
}

bool TaskContext::expired() const {
    return Clock::now() >= deadline_;
}

std::chrono::milliseconds TaskContext::remaining() const {
    if (deadline_ == Clock::time_point::max()) return std::chrono::milliseconds::max();
    const auto now = Clock::now();
    if (now >= deadline_) return std::chrono::milliseconds(0);
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - now);
}

void TaskContext::check() const {
    if (cancelled()) throw TaskCancelled(get_string("error.task_cancelled"));
    if (expired()) throw TaskTimeout(get_string("error.task_timeout"));
}

std::chrono::milliseconds BackoffPolicy::delay(int retry) const {
    const double scaled = static_cast<double>(base.count()) * std::pow(factor, std::max(0, retry - 1));
    return std::chrono::milliseconds(static_cast<long long>(scaled));
}

void run_supervised(std::string_view name,
                    std::chrono::milliseconds timeout,
                    const BackoffPolicy& policy,
                    const std::atomic<bool>& cancelled,
                    const std::function<void(const TaskContext&)>& work) {
    for (int attempt = 0;; ++attempt) {
        if (cancelled) throw TaskCancelled(get_string("error.task_cancelled"));

        const TaskContext ctx(TaskContext::Clock::now() + timeout, cancelled);
        try {
            work(ctx);
            return;
        } catch (const TaskCancelled&) {
            throw;
        } catch (const std::exception& e) {
            if (attempt >= policy.max_retries) {
                log_error(string_format("error.task_failed", std::string(name), e.what()));
                throw;
            }
            const auto delay = policy.delay(attempt + 1);
            log_warning(string_format("warning.task_retry", std::string(name), e.what(), attempt + 1, policy.max_retries, delay.count()));
            interruptible_sleep(delay, cancelled);
        }
    }
}

void run_bounded(size_t workers,
                 size_t count,
                 const std::function<void(size_t)>& task,
                 std::atomic<bool>& cancelled) {
    std::atomic<size_t> next{0};
    std::exception_ptr first_error;
    std::mutex error_mutex;

    auto worker = [&]() {
        while (!cancelled) {
            const size_t index = next++;
            if (index >= count) return;
            try {
                task(index);
            } catch (const std::exception&) {
                std::lock_guard<std::mutex> lock(error_mutex);
                // Tasks aborted by the cancellation itself are only echoes of the first error.
                if (!first_error) first_error = std::current_exception();
                cancelled = true;
                return;
            }
        }
    };

    const size_t thread_count = std::min(std::max<size_t>(workers, 1), count);
    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }

    if (first_error) std::rethrow_exception(first_error);
}
