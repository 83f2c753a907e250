#include "utilities/metrics.h"

#include <sstream>

namespace {
std::string makeKey(const std::string &name,
                    const MetricsRegistry::Labels &labels) {
  return name + MetricsRegistry::labelsToString(labels);
}

// Split "name{labels}" so suffixes can be inserted before the labels.
std::pair<std::string, std::string> splitKey(const std::string &key) {
  auto brace = key.find('{');
  if (brace == std::string::npos)
    return {key, ""};
  return {key.substr(0, brace), key.substr(brace)};
}
} // namespace

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry inst;
  return inst;
}

void MetricsRegistry::setGauge(const std::string &name, double value,
                               const Labels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_[makeKey(name, labels)] = value;
}

void MetricsRegistry::incrementCounter(const std::string &name, double value,
                                       const Labels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  counters_[makeKey(name, labels)] += value;
}

void MetricsRegistry::observe(const std::string &name, double value,
                              const Labels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  auto &h = histograms_[makeKey(name, labels)];
  h.sum += value;
  h.count += 1;
}

double MetricsRegistry::counterValue(const std::string &name,
                                     const Labels &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = counters_.find(makeKey(name, labels));
  return it == counters_.end() ? 0.0 : it->second;
}

std::string MetricsRegistry::labelsToString(const Labels &labels) {
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

std::string MetricsRegistry::toPrometheus() const {
  std::lock_guard<std::mutex> lg(mtx_);
  std::map<std::string, double> gauges(gauges_.begin(), gauges_.end());
  std::map<std::string, double> counters(counters_.begin(), counters_.end());
  std::map<std::string, Histogram> histograms(histograms_.begin(),
                                              histograms_.end());
  std::ostringstream oss;
  for (const auto &kv : gauges)
    oss << kv.first << ' ' << kv.second << '\n';
  for (const auto &kv : counters)
    oss << kv.first << ' ' << kv.second << '\n';
  for (const auto &kv : histograms) {
    auto [name, labels] = splitKey(kv.first);
    oss << name << "_sum" << labels << ' ' << kv.second.sum << '\n';
    oss << name << "_count" << labels << ' ' << kv.second.count << '\n';
  }
  return oss.str();
}

void MetricsRegistry::reset() {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_.clear();
  counters_.clear();
  histograms_.clear();
}
