#include "observability/metrics.hpp"

#include <limits>
#include <sstream>

namespace ledger {
namespace observability {

const char* const kTransactionsApproved = "ledger_transactions_approved_total";
const char* const kTransactionsDeclined = "ledger_transactions_declined_total";
const char* const kTransfersApproved = "ledger_transfers_approved_total";
const char* const kTransfersDeclined = "ledger_transfers_declined_total";
const char* const kSystemicFailures = "ledger_systemic_failures_total";
const char* const kAuthorizeSeconds = "ledger_authorize_seconds";
const char* const kTransferSeconds = "ledger_transfer_seconds";
const char* const kStatementSeconds = "ledger_statement_seconds";
const char* const kUnitsOfWorkOpen = "ledger_units_of_work_open";
const char* const kPoolConnectionsOpen = "ledger_pool_connections_open";
const char* const kPoolConnectionsLeased = "ledger_pool_connections_leased";

MetricsCollector::MetricsCollector() = default;

void MetricsCollector::incrementCounter(const std::string& name, double value) {
  std::lock_guard<std::mutex> lock(mutex_);
  counters_[name] += value;
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

void MetricsCollector::observeHistogram(const std::string& name, double value) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& hist = histograms_[name];

  if (hist.buckets.empty()) {
    for (double bound : defaultBuckets()) {
      hist.buckets.push_back({bound, 0});
    }
    hist.buckets.push_back({std::numeric_limits<double>::infinity(), 0});
  }

  hist.count += 1;
  hist.sum += value;

  // Each observation lands in exactly one bucket; export accumulates.
  for (auto& bucket : hist.buckets) {
    if (value <= bucket.upper_bound) {
      bucket.count += 1;
      break;
    }
  }
}

void MetricsCollector::describe(const std::string& name, const std::string& help) {
  std::lock_guard<std::mutex> lock(mutex_);
  help_[name] = help;
}

double MetricsCollector::counterValue(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0.0 : it->second;
}

double MetricsCollector::gaugeValue(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = gauges_.find(name);
  return it == gauges_.end() ? 0.0 : it->second;
}

size_t MetricsCollector::histogramCount(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = histograms_.find(name);
  return it == histograms_.end() ? 0 : it->second.count;
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

std::string MetricsCollector::helpFor(const std::string& name, const char* fallback) const {
  auto it = help_.find(name);
  return it == help_.end() ? fallback : it->second;
}

std::string MetricsCollector::exportMetrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::stringstream ss;

  for (const auto& [name, value] : counters_) {
    ss << "# HELP " << name << " " << helpFor(name, "Counter metric") << "\n";
    ss << "# TYPE " << name << " counter\n";
    ss << name << " " << value << "\n";
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
    for (const auto& bucket : hist.buckets) {
      cumulative_count += bucket.count;

      if (bucket.upper_bound == std::numeric_limits<double>::infinity()) {
        ss << name << "_bucket{le=\"+Inf\"} " << cumulative_count << "\n";
      } else {
        ss << name << "_bucket{le=\"" << bucket.upper_bound << "\"} " << cumulative_count << "\n";
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
  return {0.0005, 0.001, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0};
}

MetricsCollector& getGlobalMetrics() {
  static MetricsCollector& instance = []() -> MetricsCollector& {
    static MetricsCollector collector;
    collector.describe(kTransactionsApproved, "Approved single-account authorizations");
    collector.describe(kTransactionsDeclined, "Authorizations declined for insufficient funds");
    collector.describe(kTransfersApproved, "Approved transfers");
    collector.describe(kTransfersDeclined, "Transfers declined for insufficient funds");
    collector.describe(kSystemicFailures, "Units of work rolled back on store failures");
    collector.describe(kAuthorizeSeconds, "Authorization latency in seconds");
    collector.describe(kTransferSeconds, "Transfer latency in seconds");
    collector.describe(kStatementSeconds, "Statement generation latency in seconds");
    collector.describe(kUnitsOfWorkOpen, "Units of work currently open");
    collector.describe(kPoolConnectionsOpen, "PostgreSQL connections opened by the pool");
    collector.describe(kPoolConnectionsLeased, "PostgreSQL connections currently leased");
    return collector;
  }();
  return instance;
}

}  // namespace observability
}  // namespace ledger
