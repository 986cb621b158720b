#include <learnvault/storage/fallback_storage.h>

#include <learnvault/core/log.h>
#include <learnvault/storage/profile_codec.h>

#include <stdexcept>
#include <utility>

namespace learnvault::storage {
namespace {

template <class T>
std::shared_ptr<T> Required(std::shared_ptr<T> p, const char* what) {
    if (!p) {
        throw std::invalid_argument(std::string("FallbackStorage requires a ") + what);
    }
    return p;
}

const Clock& ClockOf(const std::shared_ptr<resilience::CircuitBreaker>& breaker) {
    const auto* clock = breaker ? breaker->options().clock : nullptr;
    return clock != nullptr ? *clock : SystemClock();
}

MetricLabels EntityLabels(const std::string& entity_type) {
    MetricLabels labels;
    labels.kv["entity"] = entity_type;
    return labels;
}

} // namespace

FallbackStorage::FallbackStorage(std::shared_ptr<IPrimaryStore> primary,
                                 std::shared_ptr<ICacheStore> cache,
                                 std::shared_ptr<resilience::CircuitBreaker> breaker,
                                 FallbackStorageOptions opts,
                                 MetricsRegistry* registry)
    : primary_(Required(std::move(primary), "primary store")),
      cache_(Required(std::move(cache), "cache store")),
      breaker_(Required(std::move(breaker), "circuit breaker")),
      opts_(std::move(opts)),
      clock_(ClockOf(breaker_)),
      owned_registry_(registry == nullptr ? std::make_unique<MetricsRegistry>() : nullptr),
      registry_(registry == nullptr ? *owned_registry_ : *registry),
      fallback_activations_(registry_.CounterMetric("learnvault_fallback_activations_total",
                                                    "Reads served from the cache because the primary was skipped or failed",
                                                    EntityLabels(opts_.entity_type))),
      primary_failures_(registry_.CounterMetric("learnvault_primary_failures_total",
                                                "Primary store calls that failed or exceeded their deadline",
                                                EntityLabels(opts_.entity_type))),
      cache_hits_(registry_.CounterMetric("learnvault_cache_hits_total",
                                          "Fallback reads that found a live cache entry",
                                          EntityLabels(opts_.entity_type))),
      cache_misses_(registry_.CounterMetric("learnvault_cache_misses_total",
                                            "Fallback reads that found no live cache entry",
                                            EntityLabels(opts_.entity_type))),
      cache_errors_(registry_.CounterMetric("learnvault_cache_errors_total",
                                            "Cache reads or writes that failed, timed out or held undecodable data",
                                            EntityLabels(opts_.entity_type))),
      circuit_state_(registry_.GaugeMetric("learnvault_circuit_state",
                                           "Primary circuit state (0 closed, 1 open, 2 half_open)",
                                           EntityLabels(opts_.entity_type))),
      last_failure_seconds_(registry_.GaugeMetric("learnvault_last_failure_timestamp_seconds",
                                                  "Unix time of the last primary failure, 0 if none",
                                                  EntityLabels(opts_.entity_type))),
      cache_calls_(opts_.cache_threads, opts_.max_pending_calls),
      primary_calls_(opts_.call_threads, opts_.max_pending_calls) {
    PublishCircuitState();
}

std::string FallbackStorage::CacheKey(std::string_view tenant, std::string_view subject) const {
    return MakeCacheKey(opts_.entity_type, tenant, subject);
}

std::optional<LearnerProfile> FallbackStorage::GetProfile(std::string_view tenant, std::string_view subject) {
    auto key = CacheKey(tenant, subject);

    if (!breaker_->AllowRequest()) {
        return ReadFallback(key, "circuit open");
    }

    auto r = primary_calls_.Run(
        [primary = primary_, t = std::string(tenant), s = std::string(subject)] {
            return primary->Read(t, s);
        },
        opts_.primary_timeout);

    // not_found is an answer from a healthy store, not a failure
    if (r.ok() || r.status().code() == learnvault::StatusCode::not_found) {
        breaker_->OnSuccess();
        PublishCircuitState();
        if (!r.ok() || !r.value()) {
            return std::nullopt;
        }
        WriteCache(key, EncodeProfile(*r.value()));
        return std::move(r).value();
    }

    RecordPrimaryFailure("read", key, r.status());
    return ReadFallback(key, "primary read failed");
}

learnvault::Status FallbackStorage::SaveProfile(const LearnerProfile& profile) {
    if (profile.tenant_id.empty() || profile.lti_user_id.empty()) {
        return learnvault::Status(learnvault::StatusCode::invalid_argument,
                                  "profile requires tenant_id and lti_user_id");
    }

    auto key = CacheKey(profile.tenant_id, profile.lti_user_id);
    WriteCache(key, EncodeProfile(profile));

    if (!breaker_->AllowRequest()) {
        learnvault::log::debug("circuit open, {} saved to cache only", key);
        return learnvault::Status::Ok();
    }

    auto st = primary_calls_.Run(
        [primary = primary_, profile] { return primary->Write(profile); },
        opts_.primary_timeout);
    if (st.ok()) {
        breaker_->OnSuccess();
        PublishCircuitState();
    } else {
        RecordPrimaryFailure("write", key, st);
    }
    // the cache copy already exists, so the save stands either way
    return learnvault::Status::Ok();
}

std::optional<LearnerProfile> FallbackStorage::ReadFallback(const std::string& key, std::string_view reason) {
    fallback_activations_.Inc();
    learnvault::log::debug("reading {} from cache: {}", key, reason);

    auto r = cache_calls_.Run([cache = cache_, key] { return cache->Get(key); }, opts_.cache_timeout);
    if (!r.ok()) {
        cache_errors_.Inc();
        learnvault::log::error("cache read {} failed: {}", key, r.status().ToString());
        return std::nullopt;
    }
    if (!r.value()) {
        cache_misses_.Inc();
        return std::nullopt;
    }

    auto decoded = DecodeProfile(*r.value());
    if (!decoded.ok()) {
        cache_errors_.Inc();
        learnvault::log::error("cache entry {} unreadable: {}", key, decoded.status().ToString());
        return std::nullopt;
    }
    cache_hits_.Inc();
    return std::move(decoded).value();
}

void FallbackStorage::WriteCache(const std::string& key, std::string payload) {
    auto st = cache_calls_.Run(
        [cache = cache_, key, payload = std::move(payload), ttl = opts_.cache_ttl]() mutable {
            return cache->Put(key, std::move(payload), ttl);
        },
        opts_.cache_timeout);
    if (!st.ok()) {
        cache_errors_.Inc();
        learnvault::log::error("cache write {} failed: {}", key, st.ToString());
    }
}

void FallbackStorage::RecordPrimaryFailure(std::string_view op, const std::string& key, const learnvault::Status& status) {
    breaker_->OnFailure();
    primary_failures_.Inc();

    auto wall = clock_.WallNow();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(wall.time_since_epoch()).count();
    last_failure_ms_.store(static_cast<std::int64_t>(ms), std::memory_order_relaxed);
    last_failure_seconds_.Set(static_cast<double>(ms) / 1000.0);
    PublishCircuitState();

    learnvault::log::warn("primary {} {} failed ({}), circuit {}",
                          op, key, status.ToString(), resilience::ToString(breaker_->state()));
}

void FallbackStorage::PublishCircuitState() {
    circuit_state_.Set(static_cast<double>(static_cast<int>(breaker_->state())));
}

StorageMetrics FallbackStorage::GetMetrics() const {
    StorageMetrics m;
    m.fallback_activations = fallback_activations_.Value();
    m.primary_failures = primary_failures_.Value();
    m.cache_hits = cache_hits_.Value();
    m.cache_misses = cache_misses_.Value();
    m.cache_errors = cache_errors_.Value();
    auto ms = last_failure_ms_.load(std::memory_order_relaxed);
    if (ms != 0) {
        m.last_failure = std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
    }
    m.circuit_state = breaker_->state();
    return m;
}

void FallbackStorage::ResetCircuit() {
    breaker_->Reset();
    PublishCircuitState();
}

void FallbackStorage::ResetMetrics() {
    fallback_activations_.Reset();
    primary_failures_.Reset();
    cache_hits_.Reset();
    cache_misses_.Reset();
    cache_errors_.Reset();
    last_failure_ms_.store(0, std::memory_order_relaxed);
    last_failure_seconds_.Set(0.0);
}

} // namespace learnvault::storage
