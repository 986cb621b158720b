#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <learnvault/core/status.h>

namespace learnvault::resilience {

// Runs blocking store calls on a fixed worker pool and bounds how long the caller waits.
//
// A call that misses its deadline is abandoned, not interrupted: it keeps its worker (or its
// queue slot) until the underlying operation returns, and its result is dropped. At most
// `max_outstanding` calls may be running or queued; further calls fail fast with unavailable
// instead of piling up behind a hung dependency.
class CallExecutor {
public:
    // Throws std::invalid_argument if `threads` is 0. `max_outstanding` 0 means 4 * threads.
    explicit CallExecutor(std::size_t threads, std::size_t max_outstanding = 0);
    ~CallExecutor();

    CallExecutor(const CallExecutor&) = delete;
    CallExecutor& operator=(const CallExecutor&) = delete;

    // Thread-safe. `fn` returns Status or Result<T>. Returns a timeout status once `deadline`
    // passes, internal_error if `fn` throws, unavailable when saturated or after Stop().
    template <class Fn>
    std::invoke_result_t<Fn&> Run(Fn fn, std::chrono::milliseconds deadline);

    // Stops accepting work, drops queued calls, and joins workers once in-flight calls return.
    void Stop();

    std::size_t threads() const { return threads_; }
    std::size_t max_outstanding() const { return max_outstanding_; }

    // Calls posted and not yet finished, abandoned ones included.
    std::size_t outstanding() const { return outstanding_.load(std::memory_order_acquire); }

private:
    std::size_t threads_{0};
    std::size_t max_outstanding_{0};
    std::atomic<std::size_t> outstanding_{0};
    boost::asio::thread_pool pool_;
    std::atomic<bool> stopped_{false};
};

template <class Fn>
std::invoke_result_t<Fn&> CallExecutor::Run(Fn fn, std::chrono::milliseconds deadline) {
    using R = std::invoke_result_t<Fn&>;

    if (stopped_.load(std::memory_order_acquire)) {
        return R(learnvault::Status(learnvault::StatusCode::unavailable, "executor stopped"));
    }

    if (outstanding_.fetch_add(1, std::memory_order_acq_rel) >= max_outstanding_) {
        outstanding_.fetch_sub(1, std::memory_order_acq_rel);
        return R(learnvault::Status(learnvault::StatusCode::unavailable,
                                    std::to_string(max_outstanding_) + " calls already outstanding"));
    }

    auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    auto fut = task->get_future();
    boost::asio::post(pool_, [this, task] {
        (*task)();
        outstanding_.fetch_sub(1, std::memory_order_acq_rel);
    });

    if (fut.wait_for(deadline) != std::future_status::ready) {
        return R(learnvault::Status(learnvault::StatusCode::timeout,
                                    "deadline of " + std::to_string(deadline.count()) + "ms exceeded"));
    }

    try {
        return fut.get();
    } catch (const std::future_error& e) {
        // the pool dropped the task without running it (Stop() raced with this call)
        return R(learnvault::Status(learnvault::StatusCode::unavailable, e.what()));
    } catch (const std::exception& e) {
        return R(learnvault::Status(learnvault::StatusCode::internal_error, e.what()));
    } catch (...) {
        return R(learnvault::Status(learnvault::StatusCode::internal_error, "non-standard exception"));
    }
}

} // namespace learnvault::resilience
