#ifndef LEDGER_OBSERVABILITY_METRICS_HPP_
#define LEDGER_OBSERVABILITY_METRICS_HPP_

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ledger {
namespace observability {

// Metric names recorded by the ledger core.
extern const char* const kTransactionsApproved;
extern const char* const kTransactionsDeclined;
extern const char* const kTransfersApproved;
extern const char* const kTransfersDeclined;
extern const char* const kSystemicFailures;
extern const char* const kAuthorizeSeconds;
extern const char* const kTransferSeconds;
extern const char* const kStatementSeconds;
extern const char* const kUnitsOfWorkOpen;
extern const char* const kPoolConnectionsOpen;
extern const char* const kPoolConnectionsLeased;

/**
 * Metrics collection for ledger operations.
 * Supports counters, gauges, and histograms with Prometheus-compatible output.
 */
class MetricsCollector {
 public:
  MetricsCollector();
  ~MetricsCollector() = default;

  // Counter: monotonically increasing value
  void incrementCounter(const std::string& name, double value = 1.0);

  // Gauge: value that can go up and down
  void setGauge(const std::string& name, double value);
  void incrementGauge(const std::string& name, double value = 1.0);
  void decrementGauge(const std::string& name, double value = 1.0);

  // Histogram: distribution of values
  void observeHistogram(const std::string& name, double value);

  // Attach a HELP line to a metric
  void describe(const std::string& name, const std::string& help);

  double counterValue(const std::string& name) const;
  double gaugeValue(const std::string& name) const;
  size_t histogramCount(const std::string& name) const;

  // Observes elapsed seconds into a histogram on destruction
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

  // Reset all metrics
  void reset();

 private:
  struct HistogramBucket {
    double upper_bound;
    size_t count{0};
  };

  struct Histogram {
    std::vector<HistogramBucket> buckets;
    size_t count{0};
    double sum{0.0};
  };

  std::string helpFor(const std::string& name, const char* fallback) const;

  mutable std::mutex mutex_;
  // Ordered so the export is stable.
  std::map<std::string, double> counters_;
  std::map<std::string, double> gauges_;
  std::map<std::string, Histogram> histograms_;
  std::map<std::string, std::string> help_;

  // Default histogram buckets (in seconds)
  static std::vector<double> defaultBuckets();
};

// Global metrics instance
MetricsCollector& getGlobalMetrics();

}  // namespace observability
}  // namespace ledger

#endif  // LEDGER_OBSERVABILITY_METRICS_HPP_
