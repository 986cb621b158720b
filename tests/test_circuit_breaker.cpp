#include <chtest.hpp>

#include <learnvault/core/clock.h>
#include <learnvault/resilience/circuit_breaker.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using learnvault::ManualClock;
using learnvault::resilience::CircuitBreaker;
using learnvault::resilience::CircuitBreakerOptions;
using learnvault::resilience::CircuitState;

namespace {

CircuitBreakerOptions Options(ManualClock& clock, std::uint32_t threshold, std::uint32_t probes) {
    CircuitBreakerOptions opt;
    opt.failure_threshold = threshold;
    opt.reset_timeout = std::chrono::seconds(60);
    opt.half_open_probes = probes;
    opt.clock = &clock;
    return opt;
}

void Trip(CircuitBreaker& cb) {
    while (cb.state() != CircuitState::open) {
        REQUIRE(cb.AllowRequest());
        cb.OnFailure();
    }
}

} // namespace

TEST_CASE("CircuitBreaker opens after consecutive failures") {
    ManualClock clock;
    CircuitBreaker cb(Options(clock, 3, 1));

    REQUIRE(cb.state() == CircuitState::closed);
    REQUIRE(cb.AllowRequest());
    cb.OnFailure();
    REQUIRE(cb.AllowRequest());
    cb.OnFailure();
    REQUIRE(cb.state() == CircuitState::closed);
    REQUIRE(cb.AllowRequest());
    cb.OnFailure();

    REQUIRE(cb.state() == CircuitState::open);
    REQUIRE(!cb.AllowRequest());
    REQUIRE(cb.Snapshot().last_failure.has_value());
}

TEST_CASE("CircuitBreaker success in closed state clears the failure streak") {
    ManualClock clock;
    CircuitBreaker cb(Options(clock, 3, 1));

    cb.OnFailure();
    cb.OnFailure();
    cb.OnSuccess();
    REQUIRE(cb.Snapshot().consecutive_failures == 0);

    cb.OnFailure();
    cb.OnFailure();
    REQUIRE(cb.state() == CircuitState::closed);
}

TEST_CASE("CircuitBreaker stays open until the reset timeout has passed") {
    ManualClock clock;
    CircuitBreaker cb(Options(clock, 1, 1));
    Trip(cb);

    clock.Advance(std::chrono::seconds(59));
    REQUIRE(!cb.AllowRequest());
    clock.Advance(std::chrono::seconds(1));
    // exactly reset_timeout is not enough
    REQUIRE(!cb.AllowRequest());
    REQUIRE(cb.state() == CircuitState::open);

    clock.Advance(std::chrono::milliseconds(1));
    REQUIRE(cb.AllowRequest());
    REQUIRE(cb.state() == CircuitState::half_open);
}

TEST_CASE("CircuitBreaker late failures restart the cool-down") {
    ManualClock clock;
    CircuitBreaker cb(Options(clock, 1, 1));
    Trip(cb);

    clock.Advance(std::chrono::seconds(40));
    cb.OnFailure(); // a call admitted before the trip reports late
    clock.Advance(std::chrono::seconds(30));
    REQUIRE(!cb.AllowRequest());
    clock.Advance(std::chrono::seconds(31));
    REQUIRE(cb.AllowRequest());
}

TEST_CASE("CircuitBreaker half-open admits a bounded number of probes and closes on their success") {
    ManualClock clock;
    CircuitBreaker cb(Options(clock, 2, 3));
    Trip(cb);
    clock.Advance(std::chrono::seconds(61));

    REQUIRE(cb.AllowRequest());
    REQUIRE(cb.AllowRequest());
    REQUIRE(cb.AllowRequest());
    REQUIRE(!cb.AllowRequest());
    REQUIRE(cb.state() == CircuitState::half_open);
    REQUIRE(cb.Snapshot().half_open_admitted == 3);

    cb.OnSuccess();
    cb.OnSuccess();
    REQUIRE(cb.state() == CircuitState::half_open);
    cb.OnSuccess();

    REQUIRE(cb.state() == CircuitState::closed);
    auto snap = cb.Snapshot();
    REQUIRE(snap.consecutive_failures == 0);
    REQUIRE(snap.half_open_admitted == 0);
    REQUIRE(snap.half_open_successes == 0);

    // a fresh streak is needed to trip again
    cb.OnFailure();
    REQUIRE(cb.state() == CircuitState::closed);
}

TEST_CASE("CircuitBreaker half-open failure reopens regardless of earlier successes") {
    ManualClock clock;
    CircuitBreaker cb(Options(clock, 1, 3));
    Trip(cb);
    clock.Advance(std::chrono::seconds(61));

    REQUIRE(cb.AllowRequest());
    cb.OnSuccess();
    REQUIRE(cb.AllowRequest());
    cb.OnSuccess();
    REQUIRE(cb.AllowRequest());
    cb.OnFailure();

    REQUIRE(cb.state() == CircuitState::open);
    REQUIRE(!cb.AllowRequest());

    // the cool-down restarts from the probe failure
    clock.Advance(std::chrono::seconds(61));
    REQUIRE(cb.AllowRequest());
    REQUIRE(cb.state() == CircuitState::half_open);
    REQUIRE(cb.Snapshot().half_open_successes == 0);
}

TEST_CASE("CircuitBreaker success while open is ignored") {
    ManualClock clock;
    CircuitBreaker cb(Options(clock, 1, 1));
    Trip(cb);

    cb.OnSuccess();
    REQUIRE(cb.state() == CircuitState::open);
    REQUIRE(!cb.AllowRequest());
}

TEST_CASE("CircuitBreaker reset forces closed and zeroes counters") {
    ManualClock clock;
    CircuitBreaker cb(Options(clock, 2, 1));
    Trip(cb);

    cb.Reset();
    REQUIRE(cb.state() == CircuitState::closed);
    REQUIRE(cb.AllowRequest());
    auto snap = cb.Snapshot();
    REQUIRE(snap.consecutive_failures == 0);
    REQUIRE(!snap.last_failure.has_value());
}

TEST_CASE("CircuitBreaker clamps zero thresholds to one") {
    ManualClock clock;
    CircuitBreaker cb(Options(clock, 0, 0));
    REQUIRE(cb.options().failure_threshold == 1);
    REQUIRE(cb.options().half_open_probes == 1);

    cb.OnFailure();
    REQUIRE(cb.state() == CircuitState::open);
}

TEST_CASE("CircuitBreaker admits exactly the probe budget under contention") {
    ManualClock clock;
    CircuitBreaker cb(Options(clock, 1, 4));
    Trip(cb);
    clock.Advance(std::chrono::seconds(61));

    std::atomic<int> admitted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                if (cb.AllowRequest()) {
                    admitted.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(admitted.load() == 4);
    REQUIRE(cb.state() == CircuitState::half_open);
}
