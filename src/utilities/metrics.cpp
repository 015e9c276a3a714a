#include "utilities/metrics.h"

#include <sstream>

namespace merkseal {

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry inst;
  return inst;
}

std::string MetricsRegistry::labelsToString(const MetricLabels &labels) {
  if (labels.empty())
    return "";
  std::ostringstream oss;
  oss << '{';
  bool first = true;
  for (const auto &kv : labels) {
    if (!first)
      oss << ',';
    first = false;
    oss << kv.first << "=\"" << kv.second << "\"";
  }
  oss << '}';
  return oss.str();
}

void MetricsRegistry::setGauge(const std::string &name, double value,
                               const MetricLabels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  auto &s = series_[name + labelsToString(labels)];
  s.kind = Kind::Gauge;
  s.value = value;
}

void MetricsRegistry::incrementCounter(const std::string &name, double value,
                                       const MetricLabels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  auto &s = series_[name + labelsToString(labels)];
  s.kind = Kind::Counter;
  s.value += value;
}

void MetricsRegistry::observe(const std::string &name, double value,
                              const MetricLabels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  auto &s = series_[name + labelsToString(labels)];
  s.kind = Kind::Histogram;
  s.value += value;
  s.count += 1;
}

double MetricsRegistry::value(const std::string &name,
                              const MetricLabels &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = series_.find(name + labelsToString(labels));
  return it == series_.end() ? 0.0 : it->second.value;
}

std::string MetricsRegistry::toPrometheus() const {
  std::lock_guard<std::mutex> lg(mtx_);
  std::ostringstream oss;
  for (const auto &kv : series_) {
    auto nameEnd = kv.first.find('{');
    std::string name = kv.first.substr(0, nameEnd);
    std::string labels =
        nameEnd == std::string::npos ? "" : kv.first.substr(nameEnd);
    if (kv.second.kind == Kind::Histogram) {
      oss << name << "_sum" << labels << ' ' << kv.second.value << '\n';
      oss << name << "_count" << labels << ' ' << kv.second.count << '\n';
    } else {
      oss << name << labels << ' ' << kv.second.value << '\n';
    }
  }
  return oss.str();
}

void MetricsRegistry::reset() {
  std::lock_guard<std::mutex> lg(mtx_);
  series_.clear();
}

} // namespace merkseal
