#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <learnvault/core/clock.h>
#include <learnvault/core/metrics.h>
#include <learnvault/core/status.h>
#include <learnvault/resilience/call_executor.h>
#include <learnvault/resilience/circuit_breaker.h>
#include <learnvault/storage/cache_store.h>
#include <learnvault/storage/learner_profile.h>
#include <learnvault/storage/primary_store.h>
#include <learnvault/storage/storage_options.h>

namespace learnvault::storage {

struct StorageMetrics {
    std::int64_t fallback_activations = 0;
    std::int64_t primary_failures = 0;
    std::int64_t cache_hits = 0;
    std::int64_t cache_misses = 0;
    std::int64_t cache_errors = 0;
    std::optional<std::chrono::system_clock::time_point> last_failure;
    resilience::CircuitState circuit_state = resilience::CircuitState::closed;
};

// Serves learner profiles from the primary store, falling back to the cache store whenever the
// breaker is open or a primary call fails or overruns its deadline.
//
// Reads refresh the cache on primary success. Writes always land in the cache first, so a save
// survives a primary outage for as long as the cache TTL. Storage failures never reach the
// caller: they surface through GetMetrics(), the metrics registry and the log.
//
// Counters are registered in `registry` under the label entity=<entity_type>; two instances
// sharing a registry and an entity type share counters.
class FallbackStorage {
public:
    // Throws std::invalid_argument if a store or the breaker is null, or a thread count is 0.
    FallbackStorage(std::shared_ptr<IPrimaryStore> primary,
                    std::shared_ptr<ICacheStore> cache,
                    std::shared_ptr<resilience::CircuitBreaker> breaker,
                    FallbackStorageOptions opts = {},
                    MetricsRegistry* registry = nullptr);

    FallbackStorage(const FallbackStorage&) = delete;
    FallbackStorage& operator=(const FallbackStorage&) = delete;

    // Thread-safe. Empty when neither store has the record, or neither could be reached.
    std::optional<LearnerProfile> GetProfile(std::string_view tenant, std::string_view subject);

    // Thread-safe. Fails only with invalid_argument for a profile without tenant_id/lti_user_id.
    learnvault::Status SaveProfile(const LearnerProfile& profile);

    // Thread-safe
    StorageMetrics GetMetrics() const;

    // Administrative: forces the breaker closed and zeroes its counters.
    void ResetCircuit();

    // Administrative: zeroes the counters and forgets the last failure time.
    void ResetMetrics();

    std::string CacheKey(std::string_view tenant, std::string_view subject) const;

    const FallbackStorageOptions& options() const { return opts_; }

private:
    std::optional<LearnerProfile> ReadFallback(const std::string& key, std::string_view reason);
    void WriteCache(const std::string& key, std::string payload);
    void RecordPrimaryFailure(std::string_view op, const std::string& key, const learnvault::Status& status);
    void PublishCircuitState();

    std::shared_ptr<IPrimaryStore> primary_;
    std::shared_ptr<ICacheStore> cache_;
    std::shared_ptr<resilience::CircuitBreaker> breaker_;
    const FallbackStorageOptions opts_;
    const Clock& clock_;

    std::unique_ptr<MetricsRegistry> owned_registry_;
    MetricsRegistry& registry_;
    Counter& fallback_activations_;
    Counter& primary_failures_;
    Counter& cache_hits_;
    Counter& cache_misses_;
    Counter& cache_errors_;
    Gauge& circuit_state_;
    Gauge& last_failure_seconds_;

    // milliseconds since the Unix epoch; 0 = no failure recorded
    std::atomic<std::int64_t> last_failure_ms_{0};

    // Last members: destroyed first, so in-flight calls finish before the rest is torn down.
    // Separate pools: abandoned primary calls never hold a worker the cache path needs.
    resilience::CallExecutor cache_calls_;
    resilience::CallExecutor primary_calls_;
};

} // namespace learnvault::storage
