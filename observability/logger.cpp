#include "observability/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace ledger {
namespace observability {

std::optional<LogLevel> parseLogLevel(const std::string& name) {
  if (name == "debug" || name == "DEBUG") return LogLevel::DEBUG;
  if (name == "info" || name == "INFO") return LogLevel::INFO;
  if (name == "warn" || name == "WARN") return LogLevel::WARN;
  if (name == "error" || name == "ERROR") return LogLevel::ERROR;
  if (name == "fatal" || name == "FATAL") return LogLevel::FATAL;
  return std::nullopt;
}

Logger& Logger::getInstance() {
  static Logger instance;
  return instance;
}

Logger::Logger() : min_level_(LogLevel::INFO), output_stream_(&std::clog) {}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  min_level_ = level;
}

LogLevel Logger::getLogLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return min_level_;
}

void Logger::setOutputStream(std::ostream& stream) {
  std::lock_guard<std::mutex> lock(mutex_);
  output_stream_ = &stream;
}

void Logger::debug(const std::string& message, const std::string& component,
                   const std::string& correlation_id) {
  log(LogLevel::DEBUG, message, component, correlation_id);
}

void Logger::info(const std::string& message, const std::string& component,
                  const std::string& correlation_id) {
  log(LogLevel::INFO, message, component, correlation_id);
}

void Logger::warn(const std::string& message, const std::string& component,
                  const std::string& correlation_id) {
  log(LogLevel::WARN, message, component, correlation_id);
}

void Logger::error(const std::string& message, const std::string& component,
                   const std::string& correlation_id) {
  log(LogLevel::ERROR, message, component, correlation_id);
}

void Logger::fatal(const std::string& message, const std::string& component,
                   const std::string& correlation_id) {
  log(LogLevel::FATAL, message, component, correlation_id);
}

Logger::LogBuilder::LogBuilder(LogLevel level, const std::string& message,
                               const std::string& component,
                               const std::string& correlation_id)
    : level_(level), message_(message), component_(component),
      correlation_id_(correlation_id), fields_(nlohmann::json::object()) {}

Logger::LogBuilder::~LogBuilder() {
  Logger::getInstance().log(level_, message_, component_, correlation_id_, fields_);
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, const std::string& value) {
  fields_[key] = value;
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, const char* value) {
  fields_[key] = std::string(value);
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, std::int64_t value) {
  fields_[key] = value;
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, int value) {
  fields_[key] = value;
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, double value) {
  fields_[key] = value;
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, bool value) {
  fields_[key] = value;
  return *this;
}

void Logger::log(LogLevel level, const std::string& message,
                 const std::string& component, const std::string& correlation_id,
                 const nlohmann::json& fields) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (level < min_level_) return;

  nlohmann::json entry;
  entry["timestamp"] = getCurrentTimestamp();
  entry["level"] = levelToString(level);
  entry["thread"] = getThreadId();
  entry["message"] = message;

  if (!component.empty()) {
    entry["component"] = component;
  }

  if (!correlation_id.empty()) {
    entry["correlation_id"] = correlation_id;
  }

  for (auto it = fields.begin(); it != fields.end(); ++it) {
    entry[it.key()] = it.value();
  }

  // Bytes that are not valid UTF-8 are written as U+FFFD.
  *output_stream_ << entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
                  << "\n";
  output_stream_->flush();
}

std::string Logger::levelToString(LogLevel level) const {
  switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARN: return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::FATAL: return "FATAL";
    default: return "UNKNOWN";
  }
}

std::string Logger::getCurrentTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(
      now.time_since_epoch()) % 1000000;

  std::tm tm{};
  gmtime_r(&time_t, &tm);

  std::stringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
     << "." << std::setfill('0') << std::setw(6) << microseconds.count() << "Z";
  return ss.str();
}

std::string Logger::getThreadId() const {
  std::stringstream ss;
  ss << std::this_thread::get_id();
  return ss.str();
}

}  // namespace observability
}  // namespace ledger
