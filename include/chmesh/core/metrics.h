#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace chmesh {

struct MetricLabels {
    // Sorted so that exposition order is stable.
    std::map<std::string, std::string> kv;

    std::string ToPrometheusLabelText() const;
};

class Counter {
public:
    // Thread-safe
    void Inc(std::int64_t v = 1) { value_.fetch_add(v, std::memory_order_relaxed); }
    std::int64_t Value() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<std::int64_t> value_{0};
};

class Gauge {
public:
    // Thread-safe
    void Set(double v) { value_.store(v, std::memory_order_relaxed); }
    double Value() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<double> value_{0.0};
};

class Histogram {
public:
    struct Snapshot {
        std::vector<double> bounds;
        std::vector<std::uint64_t> counts; // per bound, not cumulative
        double sum = 0.0;
        std::uint64_t count = 0;
    };

    // Thread-safe
    explicit Histogram(std::vector<double> bounds);

    void Observe(double v);
    Snapshot Take() const;

private:
    std::vector<double> bounds_;
    mutable std::mutex mu_;
    std::vector<std::uint64_t> counts_;
    double sum_{0.0};
    std::uint64_t count_{0};
};

class MetricsRegistry {
public:
    // Thread-safe. Returned references stay valid for the registry's lifetime.
    Counter& CounterMetric(std::string name, std::string help, MetricLabels labels = {});
    Gauge& GaugeMetric(std::string name, std::string help, MetricLabels labels = {});
    Histogram& HistogramMetric(std::string name, std::string help, std::vector<double> bounds, MetricLabels labels = {});

    // Thread-safe
    std::string ToPrometheusText() const;

private:
    template <class M>
    struct Entry {
        std::string name;
        std::string help;
        MetricLabels labels;
        M metric;

        template <class... Args>
        Entry(std::string name_, std::string help_, MetricLabels labels_, Args&&... args)
            : name(std::move(name_)), help(std::move(help_)), labels(std::move(labels_)),
              metric(std::forward<Args>(args)...) {}
    };

    static std::string Key(std::string_view name, const MetricLabels& labels);

    mutable std::mutex mu_;
    std::unordered_map<std::string, Entry<Counter>> counters_;
    std::unordered_map<std::string, Entry<Gauge>> gauges_;
    std::unordered_map<std::string, Entry<Histogram>> histograms_;
};

// Process-wide registry (Thread-safe)
MetricsRegistry& DefaultMetrics();

} // namespace chmesh
