#include <chmesh/core/metrics.h>

#include <algorithm>
#include <sstream>

namespace chmesh {
namespace {

void EmitHeader(std::ostringstream& oss, const std::string& name, const std::string& help, const char* type) {
    oss << "# HELP " << name << " " << help << "\n";
    oss << "# TYPE " << name << " " << type << "\n";
}

} // namespace

std::string MetricLabels::ToPrometheusLabelText() const {
    if (kv.empty()) {
        return {};
    }
    std::string out = "{";
    bool first = true;
    for (const auto& [k, v] : kv) {
        if (!first) {
            out.push_back(',');
        }
        first = false;
        out.append(k);
        out.append("=\"");
        for (char c : v) {
            if (c == '\\' || c == '"') {
                out.push_back('\\');
                out.push_back(c);
            } else if (c == '\n') {
                out.append("\\n");
            } else {
                out.push_back(c);
            }
        }
        out.push_back('"');
    }
    out.push_back('}');
    return out;
}

Histogram::Histogram(std::vector<double> bounds) : bounds_(std::move(bounds)) {
    std::sort(bounds_.begin(), bounds_.end());
    counts_.assign(bounds_.size(), 0);
}

void Histogram::Observe(double v) {
    std::lock_guard<std::mutex> lk(mu_);
    sum_ += v;
    ++count_;

    auto it = std::lower_bound(bounds_.begin(), bounds_.end(), v);
    if (it != bounds_.end()) {
        ++counts_[static_cast<std::size_t>(it - bounds_.begin())];
    }
}

Histogram::Snapshot Histogram::Take() const {
    std::lock_guard<std::mutex> lk(mu_);
    return Snapshot{bounds_, counts_, sum_, count_};
}

std::string MetricsRegistry::Key(std::string_view name, const MetricLabels& labels) {
    std::string key(name);
    key.push_back('\n');
    for (const auto& [k, v] : labels.kv) {
        key.append(k);
        key.push_back('=');
        key.append(v);
        key.push_back('\n');
    }
    return key;
}

Counter& MetricsRegistry::CounterMetric(std::string name, std::string help, MetricLabels labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto key = Key(name, labels);
    auto it = counters_.find(key);
    if (it == counters_.end()) {
        it = counters_.try_emplace(std::move(key), std::move(name), std::move(help), std::move(labels)).first;
    }
    return it->second.metric;
}

Gauge& MetricsRegistry::GaugeMetric(std::string name, std::string help, MetricLabels labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto key = Key(name, labels);
    auto it = gauges_.find(key);
    if (it == gauges_.end()) {
        it = gauges_.try_emplace(std::move(key), std::move(name), std::move(help), std::move(labels)).first;
    }
    return it->second.metric;
}

Histogram& MetricsRegistry::HistogramMetric(std::string name, std::string help, std::vector<double> bounds, MetricLabels labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto key = Key(name, labels);
    auto it = histograms_.find(key);
    if (it == histograms_.end()) {
        it = histograms_.try_emplace(std::move(key), std::move(name), std::move(help), std::move(labels), std::move(bounds)).first;
    }
    return it->second.metric;
}

std::string MetricsRegistry::ToPrometheusText() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::ostringstream oss;

    for (const auto& [key, e] : counters_) {
        EmitHeader(oss, e.name, e.help, "counter");
        oss << e.name << e.labels.ToPrometheusLabelText() << " " << e.metric.Value() << "\n";
    }

    for (const auto& [key, e] : gauges_) {
        EmitHeader(oss, e.name, e.help, "gauge");
        oss << e.name << e.labels.ToPrometheusLabelText() << " " << e.metric.Value() << "\n";
    }

    for (const auto& [key, e] : histograms_) {
        auto snap = e.metric.Take();
        EmitHeader(oss, e.name, e.help, "histogram");

        std::uint64_t cumulative = 0;
        for (std::size_t i = 0; i < snap.bounds.size(); ++i) {
            cumulative += snap.counts[i];
            MetricLabels labels = e.labels;
            labels.kv["le"] = std::to_string(snap.bounds[i]);
            oss << e.name << "_bucket" << labels.ToPrometheusLabelText() << " " << cumulative << "\n";
        }
        MetricLabels inf = e.labels;
        inf.kv["le"] = "+Inf";
        oss << e.name << "_bucket" << inf.ToPrometheusLabelText() << " " << snap.count << "\n";
        oss << e.name << "_sum" << e.labels.ToPrometheusLabelText() << " " << snap.sum << "\n";
        oss << e.name << "_count" << e.labels.ToPrometheusLabelText() << " " << snap.count << "\n";
    }

    return oss.str();
}

MetricsRegistry& DefaultMetrics() {
    static MetricsRegistry registry;
    return registry;
}

} // namespace chmesh
