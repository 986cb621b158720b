#include <learnvault/core/metrics.h>

#include <iomanip>
#include <sstream>

namespace learnvault {
namespace {

void AppendEscaped(std::ostringstream& oss, const std::string& s) {
    for (char c : s) {
        if (c == '\\' || c == '"') {
            oss << '\\' << c;
        } else if (c == '\n') {
            oss << "\\n";
        } else {
            oss << c;
        }
    }
}

// Emits HELP/TYPE once per metric name; entries arrive sorted by (name, labels).
template <class Map, class ValueFn>
void WriteFamily(std::ostringstream& oss, const Map& entries, const char* type, ValueFn value_of) {
    const std::string* last_name = nullptr;
    for (const auto& [key, entry] : entries) {
        const auto& name = key.first;
        if (last_name == nullptr || *last_name != name) {
            oss << "# HELP " << name << " " << entry.help << "\n";
            oss << "# TYPE " << name << " " << type << "\n";
            last_name = &name;
        }
        oss << name << key.second.ToPrometheusLabelText() << " " << value_of(entry) << "\n";
    }
}

} // namespace

std::string MetricLabels::ToPrometheusLabelText() const {
    if (kv.empty()) {
        return {};
    }
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& it : kv) {
        if (!first) {
            oss << ",";
        }
        first = false;
        oss << it.first << "=\"";
        AppendEscaped(oss, it.second);
        oss << "\"";
    }
    oss << "}";
    return oss.str();
}

void Gauge::Set(double v) {
    std::lock_guard<std::mutex> lk(mu_);
    value_ = v;
}

double Gauge::Value() const {
    std::lock_guard<std::mutex> lk(mu_);
    return value_;
}

Counter& MetricsRegistry::CounterMetric(std::string name, std::string help, MetricLabels labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = counters_.try_emplace(Key(std::move(name), std::move(labels)), std::move(help)).first;
    return it->second.counter;
}

Gauge& MetricsRegistry::GaugeMetric(std::string name, std::string help, MetricLabels labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = gauges_.try_emplace(Key(std::move(name), std::move(labels)), std::move(help)).first;
    return it->second.gauge;
}

std::string MetricsRegistry::ToPrometheusText() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::ostringstream oss;
    // Unix timestamps need more than the default six significant digits.
    oss << std::setprecision(15);
    WriteFamily(oss, counters_, "counter", [](const CounterEntry& e) { return e.counter.Value(); });
    WriteFamily(oss, gauges_, "gauge", [](const GaugeEntry& e) { return e.gauge.Value(); });
    return oss.str();
}

MetricsRegistry& DefaultMetrics() {
    static MetricsRegistry registry;
    return registry;
}

} // namespace learnvault
