#include <learnvault/config/config.h>
#include <learnvault/core/clock.h>
#include <learnvault/core/log.h>
#include <learnvault/core/metrics.h>
#include <learnvault/resilience/circuit_breaker.h>
#include <learnvault/storage/cache_store.h>
#include <learnvault/storage/fallback_storage.h>
#include <learnvault/storage/primary_store.h>
#include <learnvault/storage/storage_options.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace {

using learnvault::storage::FallbackStorage;
using learnvault::storage::LearnerProfile;

LearnerProfile SampleProfile(std::string tenant, std::string subject) {
    LearnerProfile p;
    p.id = "profile-" + subject;
    p.tenant_id = std::move(tenant);
    p.lti_user_id = std::move(subject);
    p.lti_deployment_id = "deployment-1";
    p.email = "learner@example.edu";
    p.name = "Drill Learner";
    p.cognitive_profile.preferred_modality = "visual";
    p.privacy_settings.ai_interaction_consent = true;
    p.created_at = "2025-01-21T00:00:00Z";
    p.updated_at = p.created_at;
    return p;
}

void Report(std::string_view phase, const FallbackStorage& storage, const std::optional<LearnerProfile>& got) {
    auto m = storage.GetMetrics();
    learnvault::log::info("[{}] circuit={} result={} fallbacks={} primary_failures={} hits={} misses={}",
                          phase, learnvault::resilience::ToString(m.circuit_state),
                          got ? got->updated_at : std::string("<none>"),
                          m.fallback_activations, m.primary_failures, m.cache_hits, m.cache_misses);
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string log_level;

    for (int i = 1; i < argc; ++i) {
        std::string_view a(argv[i]);
        if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (a == "--log" && i + 1 < argc) {
            log_level = argv[++i];
        } else {
            std::cerr << "usage: outage_drill [--config file.json] [--log level]\n";
            return 2;
        }
    }

    learnvault::storage::StorageConfig cfg;
    if (!config_path.empty()) {
        auto loaded = learnvault::config::Config::LoadFile(config_path);
        if (!loaded.ok()) {
            std::cerr << "config: " << loaded.status().ToString() << "\n";
            return 2;
        }
        auto parsed = learnvault::storage::LoadStorageConfig(loaded.value());
        if (!parsed.ok()) {
            std::cerr << "config: " << parsed.status().ToString() << "\n";
            return 2;
        }
        cfg = std::move(parsed).value();
    }
    learnvault::log::Init(log_level.empty() ? cfg.log_level : log_level);

    // The drill runs on a manual clock so the cool-down passes instantly.
    learnvault::ManualClock clock;
    cfg.breaker.clock = &clock;

    auto primary = std::make_shared<learnvault::storage::InMemoryPrimaryStore>();
    auto cache = std::make_shared<learnvault::storage::InMemoryCacheStore>(16, &clock);
    auto breaker = std::make_shared<learnvault::resilience::CircuitBreaker>(cfg.breaker);
    auto& registry = learnvault::DefaultMetrics();
    FallbackStorage storage(primary, cache, breaker, cfg.storage, &registry);

    const std::string tenant = "tenant-drill";
    const std::string subject = "user-1";

    auto profile = SampleProfile(tenant, subject);
    if (auto st = storage.SaveProfile(profile); !st.ok()) {
        learnvault::log::error("seed save rejected: {}", st.ToString());
        return 1;
    }
    Report("healthy", storage, storage.GetProfile(tenant, subject));

    // Outage, first as a hung primary (deadline expiry), then as hard errors.
    primary->SetLatency(cfg.storage.primary_timeout * 2);
    Report("hung primary", storage, storage.GetProfile(tenant, subject));
    primary->SetLatency(std::chrono::milliseconds(0));
    primary->FailWith(learnvault::Status(learnvault::StatusCode::unavailable, "primary offline (drill)"));
    while (breaker->state() == learnvault::resilience::CircuitState::closed) {
        Report("failing primary", storage, storage.GetProfile(tenant, subject));
    }

    auto updated = profile;
    updated.updated_at = "2025-01-22T00:00:00Z";
    updated.cognitive_profile.optimal_difficulty = 0.8;
    if (auto st = storage.SaveProfile(updated); !st.ok()) {
        learnvault::log::error("outage save rejected: {}", st.ToString());
        return 1;
    }
    Report("circuit open", storage, storage.GetProfile(tenant, subject));

    clock.Advance(cfg.breaker.reset_timeout + std::chrono::seconds(1));
    primary->Heal();
    for (std::uint32_t i = 0; i < cfg.breaker.half_open_probes; ++i) {
        Report("recovering", storage, storage.GetProfile(tenant, subject));
    }
    // The outage-time save reached only the cache; the healed primary still serves the seed copy.
    Report("recovered", storage, storage.GetProfile(tenant, subject));

    std::cout << registry.ToPrometheusText();
    return breaker->state() == learnvault::resilience::CircuitState::closed ? 0 : 1;
}
