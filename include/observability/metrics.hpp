#ifndef LEDGER_OBSERVABILITY_METRICS_HPP_
#define LEDGER_OBSERVABILITY_METRICS_HPP_

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ledger {
namespace observability {

using Labels = std::map<std::string, std::string>;

/**
 * Metrics registry for counters, gauges and histograms with Prometheus text
 * exposition. Each series is identified by its name and label set.
 */
class MetricsCollector {
 public:
  MetricsCollector();
  ~MetricsCollector() = default;

  // Non-copyable
  MetricsCollector(const MetricsCollector&) = delete;
  MetricsCollector& operator=(const MetricsCollector&) = delete;

  /**
   * Attach a HELP line to a metric family.
   */
  void describe(const std::string& name, const std::string& help);

  // Counter: monotonically increasing value
  void incrementCounter(const std::string& name, const Labels& labels = {}, double value = 1.0);
  double counterValue(const std::string& name, const Labels& labels = {}) const;

  // Gauge: value that can go up and down
  void setGauge(const std::string& name, double value);
  void incrementGauge(const std::string& name, double value = 1.0);
  void decrementGauge(const std::string& name, double value = 1.0);
  double gaugeValue(const std::string& name) const;

  // Histogram: distribution of values
  void observeHistogram(const std::string& name, double value);

  /**
   * Records the elapsed wall time in seconds into a histogram on destruction.
   */
  class Timer {
   public:
    Timer(MetricsCollector& collector, const std::string& name);
    ~Timer();

   private:
    MetricsCollector& collector_;
    std::string name_;
    std::chrono::steady_clock::time_point start_;
  };

  // Export metrics in Prometheus format
  std::string exportMetrics() const;

  void reset();

 private:
  struct Histogram {
    std::vector<double> bounds;
    std::vector<size_t> counts;  // per bucket, last one is +Inf
    size_t count{0};
    double sum{0.0};
  };

  static std::string formatLabels(const Labels& labels);
  std::string helpFor(const std::string& name, const std::string& fallback) const;

  mutable std::mutex mutex_;
  std::map<std::string, std::string> help_;
  std::map<std::string, std::map<Labels, double>> counters_;
  std::map<std::string, double> gauges_;
  std::map<std::string, Histogram> histograms_;

  // Default histogram buckets (in seconds)
  static std::vector<double> defaultBuckets();
};

// Global metrics instance
MetricsCollector& getGlobalMetrics();

}  // namespace observability
}  // namespace ledger

#endif  // LEDGER_OBSERVABILITY_METRICS_HPP_
