#include <learnvault/storage/storage_options.h>

#include <learnvault/core/log.h>

#include <string_view>
#include <utility>

namespace learnvault::storage {
namespace {

// Leaves `out` untouched when the key is absent.
learnvault::Status ReadString(const config::Config& cfg, std::string_view key, std::string& out) {
    if (!cfg.Has(key)) {
        return learnvault::Status::Ok();
    }
    auto r = cfg.GetString(key);
    if (!r.ok()) {
        return r.status();
    }
    out = std::move(r).value();
    return learnvault::Status::Ok();
}

learnvault::Status ReadPositive(const config::Config& cfg, std::string_view key, int& out) {
    if (!cfg.Has(key)) {
        return learnvault::Status::Ok();
    }
    auto r = cfg.GetInt(key);
    if (!r.ok()) {
        return r.status();
    }
    if (r.value() <= 0) {
        return learnvault::Status(learnvault::StatusCode::invalid_argument, std::string(key) + " must be > 0");
    }
    out = r.value();
    return learnvault::Status::Ok();
}

} // namespace

learnvault::Result<StorageConfig> LoadStorageConfig(const config::Config& cfg) {
    StorageConfig out;
    auto& br = out.breaker;
    auto& st = out.storage;

    int primary_timeout_ms = static_cast<int>(st.primary_timeout.count());
    int cache_timeout_ms = static_cast<int>(st.cache_timeout.count());
    int cache_ttl_seconds = static_cast<int>(st.cache_ttl.count());
    int call_threads = static_cast<int>(st.call_threads);
    int cache_threads = static_cast<int>(st.cache_threads);
    int max_pending_calls = static_cast<int>(st.max_pending_calls);
    int failure_threshold = static_cast<int>(br.failure_threshold);
    int reset_timeout_ms = static_cast<int>(br.reset_timeout.count());
    int half_open_probes = static_cast<int>(br.half_open_probes);

    learnvault::Status status;
    if (!(status = ReadString(cfg, "log_level", out.log_level)).ok() ||
        !(status = ReadString(cfg, "entity_type", st.entity_type)).ok() ||
        !(status = ReadPositive(cfg, "primary_timeout_ms", primary_timeout_ms)).ok() ||
        !(status = ReadPositive(cfg, "cache_timeout_ms", cache_timeout_ms)).ok() ||
        !(status = ReadPositive(cfg, "cache_ttl_seconds", cache_ttl_seconds)).ok() ||
        !(status = ReadPositive(cfg, "call_threads", call_threads)).ok() ||
        !(status = ReadPositive(cfg, "cache_threads", cache_threads)).ok() ||
        !(status = ReadPositive(cfg, "max_pending_calls", max_pending_calls)).ok() ||
        !(status = ReadString(cfg, "breaker.name", br.name)).ok() ||
        !(status = ReadPositive(cfg, "breaker.failure_threshold", failure_threshold)).ok() ||
        !(status = ReadPositive(cfg, "breaker.reset_timeout_ms", reset_timeout_ms)).ok() ||
        !(status = ReadPositive(cfg, "breaker.half_open_probes", half_open_probes)).ok()) {
        return status;
    }

    if (!learnvault::log::ParseLevel(out.log_level)) {
        return learnvault::Status(learnvault::StatusCode::invalid_argument, "unknown log_level: " + out.log_level);
    }
    if (st.entity_type.empty()) {
        return learnvault::Status(learnvault::StatusCode::invalid_argument, "entity_type must not be empty");
    }

    st.primary_timeout = std::chrono::milliseconds(primary_timeout_ms);
    st.cache_timeout = std::chrono::milliseconds(cache_timeout_ms);
    st.cache_ttl = std::chrono::seconds(cache_ttl_seconds);
    st.call_threads = static_cast<std::size_t>(call_threads);
    st.cache_threads = static_cast<std::size_t>(cache_threads);
    st.max_pending_calls = static_cast<std::size_t>(max_pending_calls);
    br.failure_threshold = static_cast<std::uint32_t>(failure_threshold);
    br.reset_timeout = std::chrono::milliseconds(reset_timeout_ms);
    br.half_open_probes = static_cast<std::uint32_t>(half_open_probes);
    return out;
}

} // namespace learnvault::storage
