#include "observability/metrics.hpp"

#include <sstream>

namespace ledger {
namespace observability {

MetricsCollector::MetricsCollector() = default;

void MetricsCollector::describe(const std::string& name, const std::string& help) {
  std::lock_guard<std::mutex> lock(mutex_);
  help_[name] = help;
}

void MetricsCollector::incrementCounter(const std::string& name, const Labels& labels,
                                        double value) {
  std::lock_guard<std::mutex> lock(mutex_);
  counters_[name][labels] += value;
}

double MetricsCollector::counterValue(const std::string& name, const Labels& labels) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto family = counters_.find(name);
  if (family == counters_.end()) return 0.0;
  auto series = family->second.find(labels);
  return series == family->second.end() ? 0.0 : series->second;
}

void MetricsCollector::setGauge(const std::string& name, double value) {
  std::lock_guard<std::mutex> lock(mutex_);
  gauges_[name] = value;
}

void MetricsCollector::incrementGauge(const std::string& name, double value) {
  std::lock_guard<std::mutex> lock(mutex_);
  gauges_[name] += value;
}

void MetricsCollector::decrementGauge(const std::string& name, double value) {
  incrementGauge(name, -value);
}

double MetricsCollector::gaugeValue(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = gauges_.find(name);
  return it == gauges_.end() ? 0.0 : it->second;
}

void MetricsCollector::observeHistogram(const std::string& name, double value) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& hist = histograms_[name];

  if (hist.bounds.empty()) {
    hist.bounds = defaultBuckets();
    hist.counts.assign(hist.bounds.size() + 1, 0);
  }

  hist.count += 1;
  hist.sum += value;

  // Only the first matching bucket; export accumulates.
  size_t bucket = 0;
  while (bucket < hist.bounds.size() && value > hist.bounds[bucket]) {
    ++bucket;
  }
  hist.counts[bucket] += 1;
}

MetricsCollector::Timer::Timer(MetricsCollector& collector, const std::string& name)
    : collector_(collector), name_(name), start_(std::chrono::steady_clock::now()) {
}

MetricsCollector::Timer::~Timer() {
  auto end = std::chrono::steady_clock::now();
  auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start_);
  double seconds = duration.count() / 1000000.0;
  collector_.observeHistogram(name_, seconds);
}

std::string MetricsCollector::formatLabels(const Labels& labels) {
  if (labels.empty()) return "";

  std::stringstream ss;
  ss << "{";
  bool first = true;
  for (const auto& [key, value] : labels) {
    if (!first) ss << ",";
    ss << key << "=\"";
    for (char c : value) {
      if (c == '"' || c == '\\') ss << '\\';
      if (c == '\n') {
        ss << "\\n";
        continue;
      }
      ss << c;
    }
    ss << "\"";
    first = false;
  }
  ss << "}";
  return ss.str();
}

std::string MetricsCollector::helpFor(const std::string& name, const std::string& fallback) const {
  auto it = help_.find(name);
  return it == help_.end() ? fallback : it->second;
}

std::string MetricsCollector::exportMetrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::stringstream ss;

  for (const auto& [name, series] : counters_) {
    ss << "# HELP " << name << " " << helpFor(name, "Counter metric") << "\n";
    ss << "# TYPE " << name << " counter\n";
    for (const auto& [labels, value] : series) {
      ss << name << formatLabels(labels) << " " << value << "\n";
    }
  }

  for (const auto& [name, value] : gauges_) {
    ss << "# HELP " << name << " " << helpFor(name, "Gauge metric") << "\n";
    ss << "# TYPE " << name << " gauge\n";
    ss << name << " " << value << "\n";
  }

  for (const auto& [name, hist] : histograms_) {
    ss << "# HELP " << name << " " << helpFor(name, "Histogram metric") << "\n";
    ss << "# TYPE " << name << " histogram\n";

    size_t cumulative_count = 0;
    for (size_t i = 0; i < hist.counts.size(); ++i) {
      cumulative_count += hist.counts[i];
      if (i == hist.bounds.size()) {
        ss << name << "_bucket{le=\"+Inf\"} " << cumulative_count << "\n";
      } else {
        ss << name << "_bucket{le=\"" << hist.bounds[i] << "\"} " << cumulative_count << "\n";
      }
    }

    ss << name << "_count " << hist.count << "\n";
    ss << name << "_sum " << hist.sum << "\n";
  }

  return ss.str();
}

void MetricsCollector::reset() {
  std::lock_guard<std::mutex> lock(mutex_);

  counters_.clear();
  gauges_.clear();
  histograms_.clear();
}

std::vector<double> MetricsCollector::defaultBuckets() {
  return {0.005, 0.01, 0.025, 0.05, 0.075, 0.1, 0.25, 0.5, 0.75, 1.0, 2.5, 5.0, 7.5, 10.0};
}

MetricsCollector& getGlobalMetrics() {
  static MetricsCollector instance;
  return instance;
}

}  // namespace observability
}  // namespace ledger
