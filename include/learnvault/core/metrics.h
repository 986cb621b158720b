#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace learnvault {

struct MetricLabels {
    // Sorted so that exposition order and registry keys are stable.
    std::map<std::string, std::string> kv;

    std::string ToPrometheusLabelText() const;

    bool operator<(const MetricLabels& other) const { return kv < other.kv; }
};

class Counter {
public:
    // Thread-safe
    void Inc(std::int64_t v = 1) { value_.fetch_add(v, std::memory_order_relaxed); }
    std::int64_t Value() const { return value_.load(std::memory_order_relaxed); }

    // Administrative reset; concurrent increments may land on either side of it.
    void Reset() { value_.store(0, std::memory_order_relaxed); }

private:
    std::atomic<std::int64_t> value_{0};
};

class Gauge {
public:
    // Thread-safe
    void Set(double v);
    double Value() const;

private:
    mutable std::mutex mu_;
    double value_{0.0};
};

class MetricsRegistry {
public:
    // Thread-safe. Returns the same instance for the same (name, labels); references stay valid
    // for the registry's lifetime.
    Counter& CounterMetric(std::string name, std::string help, MetricLabels labels = {});
    Gauge& GaugeMetric(std::string name, std::string help, MetricLabels labels = {});

    // Thread-safe. Prometheus text exposition format 0.0.4, grouped by metric name.
    std::string ToPrometheusText() const;

private:
    using Key = std::pair<std::string, MetricLabels>;

    struct CounterEntry {
        std::string help;
        Counter counter;

        explicit CounterEntry(std::string help_) : help(std::move(help_)) {}
    };

    struct GaugeEntry {
        std::string help;
        Gauge gauge;

        explicit GaugeEntry(std::string help_) : help(std::move(help_)) {}
    };

    mutable std::mutex mu_;
    std::map<Key, CounterEntry> counters_;
    std::map<Key, GaugeEntry> gauges_;
};

// Global default registry (Thread-safe)
MetricsRegistry& DefaultMetrics();

} // namespace learnvault
