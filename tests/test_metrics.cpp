#include "observability/metrics.hpp"

#include <gtest/gtest.h>

#include <string>

using ledger::observability::MetricsCollector;

TEST(MetricsTest, CountersAreTrackedPerLabelSet) {
  MetricsCollector metrics;
  metrics.incrementCounter("ledger_transfers_total", {{"outcome", "OK"}});
  metrics.incrementCounter("ledger_transfers_total", {{"outcome", "OK"}});
  metrics.incrementCounter("ledger_transfers_total", {{"outcome", "INSUFFICIENT_FUNDS"}});

  EXPECT_EQ(metrics.counterValue("ledger_transfers_total", {{"outcome", "OK"}}), 2.0);
  EXPECT_EQ(metrics.counterValue("ledger_transfers_total",
                                 {{"outcome", "INSUFFICIENT_FUNDS"}}), 1.0);
  EXPECT_EQ(metrics.counterValue("ledger_transfers_total", {{"outcome", "SAME_ACCOUNT"}}), 0.0);
  EXPECT_EQ(metrics.counterValue("unknown_total"), 0.0);
}

TEST(MetricsTest, GaugesMoveBothWays) {
  MetricsCollector metrics;
  metrics.incrementGauge("ledger_http_active_connections");
  metrics.incrementGauge("ledger_http_active_connections");
  metrics.decrementGauge("ledger_http_active_connections");
  EXPECT_EQ(metrics.gaugeValue("ledger_http_active_connections"), 1.0);

  metrics.setGauge("ledger_http_active_connections", 7.0);
  EXPECT_EQ(metrics.gaugeValue("ledger_http_active_connections"), 7.0);
}

TEST(MetricsTest, ExportUsesPrometheusTextFormat) {
  MetricsCollector metrics;
  metrics.describe("ledger_transfers_total", "Transfers attempted, by outcome");
  metrics.incrementCounter("ledger_transfers_total", {{"outcome", "OK"}});

  std::string text = metrics.exportMetrics();
  EXPECT_NE(text.find("# HELP ledger_transfers_total Transfers attempted, by outcome\n"),
            std::string::npos);
  EXPECT_NE(text.find("# TYPE ledger_transfers_total counter\n"), std::string::npos);
  EXPECT_NE(text.find("ledger_transfers_total{outcome=\"OK\"} 1\n"), std::string::npos);
}

TEST(MetricsTest, HistogramBucketsAreCumulative) {
  MetricsCollector metrics;
  metrics.observeHistogram("ledger_transfer_duration_seconds", 0.003);
  metrics.observeHistogram("ledger_transfer_duration_seconds", 0.02);
  metrics.observeHistogram("ledger_transfer_duration_seconds", 20.0);

  std::string text = metrics.exportMetrics();
  EXPECT_NE(text.find("ledger_transfer_duration_seconds_bucket{le=\"0.005\"} 1\n"),
            std::string::npos);
  EXPECT_NE(text.find("ledger_transfer_duration_seconds_bucket{le=\"0.025\"} 2\n"),
            std::string::npos);
  EXPECT_NE(text.find("ledger_transfer_duration_seconds_bucket{le=\"10\"} 2\n"),
            std::string::npos);
  EXPECT_NE(text.find("ledger_transfer_duration_seconds_bucket{le=\"+Inf\"} 3\n"),
            std::string::npos);
  EXPECT_NE(text.find("ledger_transfer_duration_seconds_count 3\n"), std::string::npos);
}

TEST(MetricsTest, LabelValuesAreEscaped) {
  MetricsCollector metrics;
  metrics.incrementCounter("odd_total", {{"path", "a\"b\\c"}});
  EXPECT_NE(metrics.exportMetrics().find("odd_total{path=\"a\\\"b\\\\c\"} 1"),
            std::string::npos);
}

TEST(MetricsTest, ResetClearsEverySeries) {
  MetricsCollector metrics;
  metrics.incrementCounter("ledger_fundings_total", {{"outcome", "OK"}});
  metrics.setGauge("ledger_http_active_connections", 3.0);
  metrics.reset();

  EXPECT_EQ(metrics.counterValue("ledger_fundings_total", {{"outcome", "OK"}}), 0.0);
  EXPECT_EQ(metrics.gaugeValue("ledger_http_active_connections"), 0.0);
}

TEST(MetricsTest, TimerRecordsOneObservation) {
  MetricsCollector metrics;
  {
    MetricsCollector::Timer timer(metrics, "ledger_transfer_duration_seconds");
  }
  EXPECT_NE(metrics.exportMetrics().find("ledger_transfer_duration_seconds_count 1\n"),
            std::string::npos);
}
