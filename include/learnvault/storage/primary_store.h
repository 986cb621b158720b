#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <learnvault/core/status.h>
#include <learnvault/storage/learner_profile.h>

namespace learnvault::storage {

// The authoritative, durable store for learner profiles.
class IPrimaryStore {
public:
    virtual ~IPrimaryStore() = default;

    // Thread-safe. An empty optional (or a not_found status) means no such record; any other
    // non-OK status is a transport, timeout or server failure.
    virtual learnvault::Result<std::optional<LearnerProfile>> Read(std::string_view tenant, std::string_view subject) = 0;

    // Thread-safe. Inserts or replaces the whole record.
    virtual learnvault::Status Write(const LearnerProfile& profile) = 0;
};

// A single-process primary store with fault injection. Useful for tests / outage drills.
class InMemoryPrimaryStore final : public IPrimaryStore {
public:
    learnvault::Result<std::optional<LearnerProfile>> Read(std::string_view tenant, std::string_view subject) override;
    learnvault::Status Write(const LearnerProfile& profile) override;

    // Thread-safe. While set, every call fails with this status after the injected latency.
    void FailWith(learnvault::Status status);
    void Heal();

    // Thread-safe. Every call sleeps this long before touching the data.
    void SetLatency(std::chrono::milliseconds latency);

    std::uint64_t reads() const { return reads_.load(std::memory_order_relaxed); }
    std::uint64_t writes() const { return writes_.load(std::memory_order_relaxed); }
    std::size_t Size() const;

private:
    // Returns the injected failure, if any, after sleeping the injected latency.
    std::optional<learnvault::Status> Simulate();

    mutable std::mutex mu_;
    std::map<std::pair<std::string, std::string>, LearnerProfile> rows_;
    std::optional<learnvault::Status> failure_;
    std::chrono::milliseconds latency_{0};

    std::atomic<std::uint64_t> reads_{0};
    std::atomic<std::uint64_t> writes_{0};
};

} // namespace learnvault::storage
