#include <learnvault/storage/primary_store.h>

#include <thread>

namespace learnvault::storage {

std::optional<learnvault::Status> InMemoryPrimaryStore::Simulate() {
    std::chrono::milliseconds latency;
    std::optional<learnvault::Status> failure;
    {
        std::lock_guard<std::mutex> lk(mu_);
        latency = latency_;
        failure = failure_;
    }
    if (latency.count() > 0) {
        std::this_thread::sleep_for(latency);
    }
    return failure;
}

learnvault::Result<std::optional<LearnerProfile>> InMemoryPrimaryStore::Read(std::string_view tenant, std::string_view subject) {
    reads_.fetch_add(1, std::memory_order_relaxed);
    if (auto failure = Simulate()) {
        return std::move(*failure);
    }

    std::lock_guard<std::mutex> lk(mu_);
    auto it = rows_.find({std::string(tenant), std::string(subject)});
    if (it == rows_.end()) {
        return std::optional<LearnerProfile>{};
    }
    return std::optional<LearnerProfile>(it->second);
}

learnvault::Status InMemoryPrimaryStore::Write(const LearnerProfile& profile) {
    writes_.fetch_add(1, std::memory_order_relaxed);
    if (auto failure = Simulate()) {
        return std::move(*failure);
    }

    std::lock_guard<std::mutex> lk(mu_);
    rows_[{profile.tenant_id, profile.lti_user_id}] = profile;
    return learnvault::Status::Ok();
}

void InMemoryPrimaryStore::FailWith(learnvault::Status status) {
    std::lock_guard<std::mutex> lk(mu_);
    failure_ = std::move(status);
}

void InMemoryPrimaryStore::Heal() {
    std::lock_guard<std::mutex> lk(mu_);
    failure_.reset();
}

void InMemoryPrimaryStore::SetLatency(std::chrono::milliseconds latency) {
    std::lock_guard<std::mutex> lk(mu_);
    latency_ = latency;
}

std::size_t InMemoryPrimaryStore::Size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return rows_.size();
}

} // namespace learnvault::storage
