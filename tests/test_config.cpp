#include <chtest.hpp>

#include <learnvault/config/config.h>
#include <learnvault/storage/storage_options.h>

#include <chrono>

using learnvault::StatusCode;
using learnvault::config::Config;
using learnvault::storage::LoadStorageConfig;

TEST_CASE("Config reads dotted paths") {
    auto c = Config::Parse(R"({"log_level":"debug","breaker":{"failure_threshold":7}})");
    REQUIRE(c.ok());

    REQUIRE(c.value().Has("breaker.failure_threshold"));
    REQUIRE(!c.value().Has("breaker.nope"));
    REQUIRE(!c.value().Has("log_level.deeper"));
    REQUIRE(c.value().GetInt("breaker.failure_threshold").value() == 7);
    REQUIRE(c.value().GetString("log_level").value() == "debug");

    REQUIRE(c.value().GetInt("missing").status().code() == StatusCode::not_found);
    REQUIRE(c.value().GetInt("log_level").status().code() == StatusCode::invalid_argument);
    REQUIRE(c.value().GetString("breaker").status().code() == StatusCode::invalid_argument);
}

TEST_CASE("Config rejects invalid documents") {
    REQUIRE(Config::Parse("{").status().code() == StatusCode::invalid_argument);
    REQUIRE(Config::Parse("[]").status().code() == StatusCode::invalid_argument);
    REQUIRE(Config::LoadFile("/nonexistent/learnvault.json").status().code() == StatusCode::not_found);
}

TEST_CASE("LoadStorageConfig keeps defaults for absent keys") {
    auto c = Config::Parse("{}");
    REQUIRE(c.ok());
    auto r = LoadStorageConfig(c.value());
    REQUIRE(r.ok());

    const auto& cfg = r.value();
    REQUIRE(cfg.log_level == "info");
    REQUIRE(cfg.storage.entity_type == "learner");
    REQUIRE(cfg.storage.primary_timeout == std::chrono::milliseconds(100));
    REQUIRE(cfg.storage.cache_ttl == std::chrono::seconds(86400));
    REQUIRE(cfg.breaker.failure_threshold == 5);
    REQUIRE(cfg.breaker.reset_timeout == std::chrono::milliseconds(60000));
    REQUIRE(cfg.breaker.half_open_probes == 3);
}

TEST_CASE("LoadStorageConfig applies overrides") {
    auto c = Config::Parse(R"({
        "entity_type": "instructor",
        "primary_timeout_ms": 250,
        "cache_ttl_seconds": 600,
        "call_threads": 2,
        "cache_threads": 3,
        "max_pending_calls": 8,
        "breaker": {"name": "pg", "failure_threshold": 2, "reset_timeout_ms": 5000, "half_open_probes": 1}
    })");
    REQUIRE(c.ok());
    auto r = LoadStorageConfig(c.value());
    REQUIRE(r.ok());

    const auto& cfg = r.value();
    REQUIRE(cfg.storage.entity_type == "instructor");
    REQUIRE(cfg.storage.primary_timeout == std::chrono::milliseconds(250));
    REQUIRE(cfg.storage.cache_timeout == std::chrono::milliseconds(100));
    REQUIRE(cfg.storage.cache_ttl == std::chrono::seconds(600));
    REQUIRE(cfg.storage.call_threads == 2);
    REQUIRE(cfg.storage.cache_threads == 3);
    REQUIRE(cfg.storage.max_pending_calls == 8);
    REQUIRE(cfg.breaker.name == "pg");
    REQUIRE(cfg.breaker.failure_threshold == 2);
    REQUIRE(cfg.breaker.reset_timeout == std::chrono::milliseconds(5000));
    REQUIRE(cfg.breaker.half_open_probes == 1);
}

TEST_CASE("LoadStorageConfig rejects bad values") {
    auto zero = Config::Parse(R"({"breaker":{"failure_threshold":0}})");
    auto st = LoadStorageConfig(zero.value()).status();
    REQUIRE(st.code() == StatusCode::invalid_argument);
    REQUIRE(st.message() == "breaker.failure_threshold must be > 0");

    auto wrong_type = Config::Parse(R"({"primary_timeout_ms":"fast"})");
    REQUIRE(LoadStorageConfig(wrong_type.value()).status().code() == StatusCode::invalid_argument);

    auto bad_level = Config::Parse(R"({"log_level":"loud"})");
    REQUIRE(LoadStorageConfig(bad_level.value()).status().message() == "unknown log_level: loud");

    auto empty_entity = Config::Parse(R"({"entity_type":""})");
    REQUIRE(LoadStorageConfig(empty_entity.value()).status().code() == StatusCode::invalid_argument);
}
