#include <learnvault/storage/cache_store.h>

#include <utility>

namespace learnvault::storage {

InMemoryCacheStore::InMemoryCacheStore(std::size_t shards, const Clock* clock)
    : shards_(shards == 0 ? 1 : shards), clock_(clock != nullptr ? *clock : SystemClock()) {
    table_.reserve(shards_);
    for (std::size_t i = 0; i < shards_; ++i) {
        table_.push_back(std::make_unique<Shard>());
    }
}

std::optional<learnvault::Status> InMemoryCacheStore::InjectedFailure() const {
    std::lock_guard<std::mutex> lk(fault_mu_);
    return failure_;
}

learnvault::Result<std::optional<std::string>> InMemoryCacheStore::Get(std::string_view key) {
    if (auto failure = InjectedFailure()) {
        return std::move(*failure);
    }

    auto now = clock_.Now();
    auto& shard = *table_[ShardIndex(key)];
    {
        std::shared_lock<std::shared_mutex> lk(shard.mu);
        auto it = shard.kv.find(std::string(key));
        if (it == shard.kv.end()) {
            return std::optional<std::string>{};
        }
        if (now < it->second.expires_at) {
            return std::optional<std::string>(it->second.value);
        }
    }

    // Expired: drop it, unless a concurrent Put already replaced it with a live entry.
    std::unique_lock<std::shared_mutex> lk(shard.mu);
    auto it = shard.kv.find(std::string(key));
    if (it != shard.kv.end() && now >= it->second.expires_at) {
        shard.kv.erase(it);
    }
    return std::optional<std::string>{};
}

learnvault::Status InMemoryCacheStore::Put(std::string_view key, std::string value, std::chrono::seconds ttl) {
    if (auto failure = InjectedFailure()) {
        return std::move(*failure);
    }
    if (ttl.count() <= 0) {
        return learnvault::Status(learnvault::StatusCode::invalid_argument, "cache ttl must be positive");
    }

    auto expires_at = clock_.Now() + ttl;
    auto& shard = *table_[ShardIndex(key)];
    std::unique_lock<std::shared_mutex> lk(shard.mu);
    shard.kv.insert_or_assign(std::string(key), Entry{std::move(value), expires_at});
    return learnvault::Status::Ok();
}

void InMemoryCacheStore::FailWith(learnvault::Status status) {
    std::lock_guard<std::mutex> lk(fault_mu_);
    failure_ = std::move(status);
}

void InMemoryCacheStore::Heal() {
    std::lock_guard<std::mutex> lk(fault_mu_);
    failure_.reset();
}

std::size_t InMemoryCacheStore::Size() const {
    std::size_t total = 0;
    for (const auto& shardp : table_) {
        const auto& shard = *shardp;
        std::shared_lock<std::shared_mutex> lk(shard.mu);
        total += shard.kv.size();
    }
    return total;
}

} // namespace learnvault::storage
