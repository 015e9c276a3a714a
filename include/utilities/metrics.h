#pragma once
#ifndef MERKSEAL_METRICS_H
#define MERKSEAL_METRICS_H

#include <map>
#include <mutex>
#include <string>

namespace merkseal {

using MetricLabels = std::map<std::string, std::string>;

/**
 * @brief Process-wide metrics registry exported in Prometheus text format.
 */
class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  void setGauge(const std::string &name, double value,
                const MetricLabels &labels = {});
  void incrementCounter(const std::string &name, double value = 1.0,
                        const MetricLabels &labels = {});
  /** Record one observation; exported as <name>_sum and <name>_count. */
  void observe(const std::string &name, double value,
               const MetricLabels &labels = {});

  /// Current value of a counter or gauge, 0 if never recorded.
  double value(const std::string &name, const MetricLabels &labels = {}) const;

  std::string toPrometheus() const;

  /** Clear all series. Used by unit tests. */
  void reset();

  static std::string labelsToString(const MetricLabels &labels);

private:
  MetricsRegistry() = default;

  enum class Kind { Gauge, Counter, Histogram };
  struct Series {
    Kind kind{Kind::Gauge};
    double value{0};
    unsigned long count{0};
  };

  // Keyed by name + label string; std::map keeps the export order stable.
  mutable std::mutex mtx_;
  std::map<std::string, Series> series_;
};

} // namespace merkseal

#endif // MERKSEAL_METRICS_H
