#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <learnvault/core/clock.h>
#include <learnvault/core/status.h>

namespace learnvault::storage {

// Best-effort, TTL-bounded key/value mirror used for fallback reads.
class ICacheStore {
public:
    virtual ~ICacheStore() = default;

    // Thread-safe. An empty optional means absent or expired.
    virtual learnvault::Result<std::optional<std::string>> Get(std::string_view key) = 0;

    // Thread-safe. Overwrites any previous value; the store may evict it once `ttl` has passed.
    virtual learnvault::Status Put(std::string_view key, std::string value, std::chrono::seconds ttl) = 0;
};

class InMemoryCacheStore final : public ICacheStore {
public:
    // `clock` null means SystemClock(); it must outlive the store.
    explicit InMemoryCacheStore(std::size_t shards = 16, const Clock* clock = nullptr);

    learnvault::Result<std::optional<std::string>> Get(std::string_view key) override;
    learnvault::Status Put(std::string_view key, std::string value, std::chrono::seconds ttl) override;

    // Thread-safe. While set, every call fails with this status.
    void FailWith(learnvault::Status status);
    void Heal();

    // Thread-safe. Counts entries still stored, expired ones included until they are read.
    std::size_t Size() const;

private:
    struct Entry {
        std::string value;
        std::chrono::steady_clock::time_point expires_at;
    };

    struct Shard {
        mutable std::shared_mutex mu;
        std::unordered_map<std::string, Entry> kv;
    };

    std::size_t ShardIndex(std::string_view key) const {
        return std::hash<std::string_view>{}(key) % shards_;
    }

    std::optional<learnvault::Status> InjectedFailure() const;

    std::size_t shards_ = 1;
    std::vector<std::unique_ptr<Shard>> table_;
    const Clock& clock_;

    mutable std::mutex fault_mu_;
    std::optional<learnvault::Status> failure_;
};

} // namespace learnvault::storage
