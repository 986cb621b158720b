#include <chtest.hpp>

#include <learnvault/core/clock.h>
#include <learnvault/storage/cache_store.h>

#include <chrono>

using learnvault::ManualClock;
using learnvault::Status;
using learnvault::StatusCode;
using learnvault::storage::InMemoryCacheStore;

TEST_CASE("InMemoryCacheStore returns stored values until they expire") {
    ManualClock clock;
    InMemoryCacheStore cache(4, &clock);

    REQUIRE(cache.Put("k", "v1", std::chrono::seconds(10)).ok());
    auto r = cache.Get("k");
    REQUIRE(r.ok());
    REQUIRE(r.value().has_value());
    REQUIRE(*r.value() == "v1");

    clock.Advance(std::chrono::milliseconds(9999));
    REQUIRE(cache.Get("k").value().has_value());

    clock.Advance(std::chrono::milliseconds(1));
    auto expired = cache.Get("k");
    REQUIRE(expired.ok());
    REQUIRE(!expired.value().has_value());
    REQUIRE(cache.Size() == 0);
}

TEST_CASE("InMemoryCacheStore overwrite replaces the value and the expiry") {
    ManualClock clock;
    InMemoryCacheStore cache(4, &clock);

    REQUIRE(cache.Put("k", "old", std::chrono::seconds(10)).ok());
    clock.Advance(std::chrono::seconds(8));
    REQUIRE(cache.Put("k", "new", std::chrono::seconds(10)).ok());
    clock.Advance(std::chrono::seconds(8));

    auto r = cache.Get("k");
    REQUIRE(r.value().has_value());
    REQUIRE(*r.value() == "new");
    REQUIRE(cache.Size() == 1);
}

TEST_CASE("InMemoryCacheStore reports absent keys as empty") {
    InMemoryCacheStore cache;
    auto r = cache.Get("missing");
    REQUIRE(r.ok());
    REQUIRE(!r.value().has_value());
}

TEST_CASE("InMemoryCacheStore rejects a non-positive ttl") {
    InMemoryCacheStore cache;
    auto st = cache.Put("k", "v", std::chrono::seconds(0));
    REQUIRE(st.code() == StatusCode::invalid_argument);
    REQUIRE(cache.Size() == 0);
}

TEST_CASE("InMemoryCacheStore injected failures and healing") {
    InMemoryCacheStore cache;
    REQUIRE(cache.Put("k", "v", std::chrono::seconds(10)).ok());

    cache.FailWith(Status(StatusCode::unavailable, "cache down"));
    REQUIRE(cache.Get("k").status().code() == StatusCode::unavailable);
    REQUIRE(cache.Put("k", "v2", std::chrono::seconds(10)).code() == StatusCode::unavailable);

    cache.Heal();
    auto r = cache.Get("k");
    REQUIRE(r.ok());
    REQUIRE(*r.value() == "v");
}
