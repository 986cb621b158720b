#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <learnvault/core/clock.h>

namespace learnvault::resilience {

enum class CircuitState {
    closed = 0,
    open,
    half_open,
};

std::string_view ToString(CircuitState state);

struct CircuitBreakerOptions {
    std::string name = "primary";

    // Consecutive failures in closed state that trip the circuit.
    std::uint32_t failure_threshold = 5;

    // How long an open circuit waits after the last failure before admitting probes.
    std::chrono::milliseconds reset_timeout{60000};

    // Probes admitted in half-open state; the same number of successes closes the circuit.
    std::uint32_t half_open_probes = 3;

    // Null means SystemClock(). Must outlive the breaker.
    const Clock* clock = nullptr;
};

struct CircuitSnapshot {
    CircuitState state = CircuitState::closed;
    std::uint32_t consecutive_failures = 0;
    std::uint32_t half_open_admitted = 0;
    std::uint32_t half_open_successes = 0;
    std::optional<std::chrono::system_clock::time_point> last_failure;
};

// Closed -> Open -> HalfOpen state machine guarding calls to one dependency.
// Decisions compare the clock against stored timestamps; nothing here blocks or throws.
class CircuitBreaker {
public:
    explicit CircuitBreaker(CircuitBreakerOptions opts);

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    // Thread-safe. A true answer in half-open state consumes one probe slot.
    bool AllowRequest();

    // Thread-safe
    void OnSuccess();

    // Thread-safe
    void OnFailure();

    // Thread-safe. Forces closed and zeroes every counter.
    void Reset();

    CircuitState state() const { return state_.load(std::memory_order_acquire); }

    // Thread-safe
    CircuitSnapshot Snapshot() const;

    const CircuitBreakerOptions& options() const { return opts_; }

private:
    void TransitionLocked(CircuitState to);

    const CircuitBreakerOptions opts_;
    const Clock& clock_;

    mutable std::mutex mu_;
    std::atomic<CircuitState> state_{CircuitState::closed};

    std::uint32_t consecutive_failures_ = 0;
    std::uint32_t half_open_admitted_ = 0;
    std::uint32_t half_open_successes_ = 0;

    std::chrono::steady_clock::time_point last_failure_{};
    std::optional<std::chrono::system_clock::time_point> last_failure_wall_;
};

} // namespace learnvault::resilience
