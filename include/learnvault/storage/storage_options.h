#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include <learnvault/config/config.h>
#include <learnvault/core/status.h>
#include <learnvault/resilience/circuit_breaker.h>

namespace learnvault::storage {

struct FallbackStorageOptions {
    // Middle segment of the cache key: fallback:{entity_type}:{tenant}:{subject}
    std::string entity_type = "learner";

    std::chrono::milliseconds primary_timeout{100};
    std::chrono::milliseconds cache_timeout{100};
    std::chrono::seconds cache_ttl{86400};

    // Workers for primary store calls.
    std::size_t call_threads = 4;

    // Workers for cache store calls, kept apart so a hung primary cannot stall the fallback path.
    std::size_t cache_threads = 2;

    // Per pool: calls running or queued, abandoned ones included. Beyond it calls fail fast.
    std::size_t max_pending_calls = 16;
};

struct StorageConfig {
    std::string log_level = "info";
    resilience::CircuitBreakerOptions breaker;
    FallbackStorageOptions storage;
};

// Absent keys keep their defaults; a present key with the wrong type or a non-positive value
// fails with invalid_argument naming the key.
learnvault::Result<StorageConfig> LoadStorageConfig(const config::Config& cfg);

} // namespace learnvault::storage
