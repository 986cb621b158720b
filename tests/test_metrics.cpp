#include <chtest.hpp>

#include <learnvault/core/metrics.h>

#include <string>

using learnvault::MetricLabels;
using learnvault::MetricsRegistry;

TEST_CASE("MetricsRegistry returns one instance per name and labels") {
    MetricsRegistry reg;
    MetricLabels a;
    a.kv["entity"] = "learner";
    MetricLabels b;
    b.kv["entity"] = "instructor";

    auto& c1 = reg.CounterMetric("hits_total", "hits", a);
    auto& c2 = reg.CounterMetric("hits_total", "hits", a);
    auto& c3 = reg.CounterMetric("hits_total", "hits", b);
    REQUIRE(&c1 == &c2);
    REQUIRE(&c1 != &c3);

    c1.Inc();
    c2.Inc(2);
    REQUIRE(c1.Value() == 3);
    REQUIRE(c3.Value() == 0);

    c1.Reset();
    REQUIRE(c2.Value() == 0);
}

TEST_CASE("MetricsRegistry renders Prometheus text") {
    MetricsRegistry reg;
    MetricLabels a;
    a.kv["entity"] = "learner";
    MetricLabels b;
    b.kv["entity"] = "say \"hi\"";

    reg.CounterMetric("hits_total", "Cache hits", a).Inc(4);
    reg.CounterMetric("hits_total", "Cache hits", b).Inc();
    reg.GaugeMetric("last_failure_seconds", "Last failure", a).Set(1737417600.5);

    auto text = reg.ToPrometheusText();
    REQUIRE(text.find("# TYPE hits_total counter\n") != std::string::npos);
    REQUIRE(text.find("# TYPE hits_total counter", text.find("# TYPE hits_total counter") + 1) == std::string::npos);
    REQUIRE(text.find("hits_total{entity=\"learner\"} 4\n") != std::string::npos);
    REQUIRE(text.find("hits_total{entity=\"say \\\"hi\\\"\"} 1\n") != std::string::npos);
    REQUIRE(text.find("# TYPE last_failure_seconds gauge\n") != std::string::npos);
    REQUIRE(text.find("last_failure_seconds{entity=\"learner\"} 1737417600.5\n") != std::string::npos);
}
