#pragma once
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

/**
 * @brief Process-wide metrics registry that exports Prometheus text format.
 *
 * The chunk store and file manager publish their dedup counters here.
 */
class MetricsRegistry {
public:
  using Labels = std::map<std::string, std::string>;

  /** Get singleton instance. */
  static MetricsRegistry &instance();

  /** Set gauge value with optional labels. */
  void setGauge(const std::string &name, double value,
                const Labels &labels = {});

  /** Increment counter by value (default 1). */
  void incrementCounter(const std::string &name, double value = 1.0,
                        const Labels &labels = {});

  /** Record observation for a summary-style histogram (sum and count). */
  void observe(const std::string &name, double value,
               const Labels &labels = {});

  /** Current counter value, 0 if never incremented. */
  double counterValue(const std::string &name,
                      const Labels &labels = {}) const;

  /** Serialize all metrics in Prometheus text format, sorted by key. */
  std::string toPrometheus() const;

  /** Clear all stored metrics; used by tests for a clean state. */
  void reset();

  /** Convert labels map to Prometheus label string. */
  static std::string labelsToString(const Labels &labels);

private:
  MetricsRegistry() = default;
  struct Histogram {
    double sum{0};
    unsigned long count{0};
  };

  mutable std::mutex mtx_;
  std::unordered_map<std::string, double> gauges_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, Histogram> histograms_;
};
