#include <learnvault/resilience/circuit_breaker.h>

#include <learnvault/core/log.h>

#include <utility>

namespace learnvault::resilience {
namespace {

CircuitBreakerOptions Normalize(CircuitBreakerOptions opts) {
    // 0 would mean "never open" / "never close"
    if (opts.failure_threshold == 0) {
        opts.failure_threshold = 1;
    }
    if (opts.half_open_probes == 0) {
        opts.half_open_probes = 1;
    }
    if (opts.reset_timeout.count() < 0) {
        opts.reset_timeout = std::chrono::milliseconds(0);
    }
    return opts;
}

} // namespace

std::string_view ToString(CircuitState state) {
    switch (state) {
        case CircuitState::closed: return "closed";
        case CircuitState::open: return "open";
        case CircuitState::half_open: return "half_open";
    }
    return "unknown";
}

CircuitBreaker::CircuitBreaker(CircuitBreakerOptions opts)
    : opts_(Normalize(std::move(opts))),
      clock_(opts_.clock != nullptr ? *opts_.clock : SystemClock()) {}

void CircuitBreaker::TransitionLocked(CircuitState to) {
    auto from = state_.load(std::memory_order_relaxed);
    if (from == to) {
        return;
    }
    state_.store(to, std::memory_order_release);

    switch (to) {
        case CircuitState::open:
            learnvault::log::warn("circuit '{}' {} -> open ({} consecutive failures)",
                                  opts_.name, ToString(from), consecutive_failures_);
            break;
        case CircuitState::half_open:
            learnvault::log::info("circuit '{}' open -> half_open, admitting up to {} probes",
                                  opts_.name, opts_.half_open_probes);
            break;
        case CircuitState::closed:
            learnvault::log::info("circuit '{}' {} -> closed", opts_.name, ToString(from));
            break;
    }
}

bool CircuitBreaker::AllowRequest() {
    if (state_.load(std::memory_order_acquire) == CircuitState::closed) {
        return true;
    }

    auto now = clock_.Now();
    std::lock_guard<std::mutex> lk(mu_);

    auto st = state_.load(std::memory_order_relaxed);
    if (st == CircuitState::closed) {
        // closed by a concurrent success between the fast path and the lock
        return true;
    }

    if (st == CircuitState::open) {
        if (now - last_failure_ <= opts_.reset_timeout) {
            return false;
        }
        half_open_admitted_ = 0;
        half_open_successes_ = 0;
        TransitionLocked(CircuitState::half_open);
    }

    if (half_open_admitted_ >= opts_.half_open_probes) {
        return false;
    }
    ++half_open_admitted_;
    return true;
}

void CircuitBreaker::OnSuccess() {
    std::lock_guard<std::mutex> lk(mu_);

    auto st = state_.load(std::memory_order_relaxed);
    if (st == CircuitState::closed) {
        consecutive_failures_ = 0;
        return;
    }

    if (st == CircuitState::half_open) {
        ++half_open_successes_;
        if (half_open_successes_ >= opts_.half_open_probes) {
            consecutive_failures_ = 0;
            half_open_admitted_ = 0;
            half_open_successes_ = 0;
            TransitionLocked(CircuitState::closed);
        }
        return;
    }

    // open: a late success from a call admitted before the trip changes nothing
}

void CircuitBreaker::OnFailure() {
    auto now = clock_.Now();
    auto wall = clock_.WallNow();
    std::lock_guard<std::mutex> lk(mu_);

    ++consecutive_failures_;
    last_failure_ = now;
    last_failure_wall_ = wall;

    auto st = state_.load(std::memory_order_relaxed);
    if (st == CircuitState::closed) {
        if (consecutive_failures_ >= opts_.failure_threshold) {
            TransitionLocked(CircuitState::open);
        }
        return;
    }

    if (st == CircuitState::half_open) {
        // any probe failure reopens, whatever succeeded before it
        half_open_admitted_ = 0;
        half_open_successes_ = 0;
        TransitionLocked(CircuitState::open);
        return;
    }

    // open: the refreshed last_failure_ restarts the cool-down
}

void CircuitBreaker::Reset() {
    std::lock_guard<std::mutex> lk(mu_);
    consecutive_failures_ = 0;
    half_open_admitted_ = 0;
    half_open_successes_ = 0;
    last_failure_ = {};
    last_failure_wall_.reset();
    TransitionLocked(CircuitState::closed);
}

CircuitSnapshot CircuitBreaker::Snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    CircuitSnapshot s;
    s.state = state_.load(std::memory_order_relaxed);
    s.consecutive_failures = consecutive_failures_;
    s.half_open_admitted = half_open_admitted_;
    s.half_open_successes = half_open_successes_;
    s.last_failure = last_failure_wall_;
    return s;
}

} // namespace learnvault::resilience
