#pragma once

#include "type_definitions.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>
#include <string>

namespace scrub {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, FATAL = 4 };

enum class LogFormat { TEXT = 0, JSON = 1 };

struct LogConfig {
  LogLevel level = LogLevel::INFO;
  LogFormat format = LogFormat::TEXT;
  bool consoleOutput = true;
  bool fileOutput = false;
  std::string logFile = "logs/scrub.log";
  size_t maxFileSize = 10 * 1024 * 1024; // 10MB
  int maxBackupFiles = 5;
  bool enableRotation = true;
  StringSet componentFilter; // Empty = all components
  bool includeMetrics = false;
};

struct LogMetrics {
  std::atomic<uint64_t> totalMessages{0};
  std::atomic<uint64_t> errorCount{0};
  std::atomic<uint64_t> warningCount{0};
  std::chrono::steady_clock::time_point startTime;

  LogMetrics() : startTime(std::chrono::steady_clock::now()) {}

  // Copy constructor - can't copy atomics directly, so copy their values
  LogMetrics(const LogMetrics &other)
      : totalMessages(other.totalMessages.load()),
        errorCount(other.errorCount.load()),
        warningCount(other.warningCount.load()), startTime(other.startTime) {}

  LogMetrics &operator=(const LogMetrics &other) {
    if (this != &other) {
      totalMessages.store(other.totalMessages.load());
      errorCount.store(other.errorCount.load());
      warningCount.store(other.warningCount.load());
      startTime = other.startTime;
    }
    return *this;
  }
};

class Logger {
public:
  static Logger &getInstance();

  // Configuration methods
  void configure(const LogConfig &config);
  LogConfig getConfig() const;
  void setLogLevel(LogLevel level);
  void setLogFormat(LogFormat format);
  void setLogFile(const std::string &filename);
  void enableConsoleOutput(bool enable);
  void enableFileOutput(bool enable);
  void setComponentFilter(const StringSet &components);
  void enableRotation(bool enable, size_t maxFileSize = 10 * 1024 * 1024,
                      int maxBackupFiles = 5);

  // Logging methods
  void log(LogLevel level, const std::string &component,
           const std::string &message, const StringMap &context = {});
  void debug(const std::string &component, const std::string &message,
             const StringMap &context = {});
  void info(const std::string &component, const std::string &message,
            const StringMap &context = {});
  void warn(const std::string &component, const std::string &message,
            const StringMap &context = {});
  void error(const std::string &component, const std::string &message,
             const StringMap &context = {});
  void fatal(const std::string &component, const std::string &message,
             const StringMap &context = {});

  // Metrics and performance logging
  void logMetric(const std::string &name, double value,
                 const std::string &unit = "");
  void logPerformance(const std::string &operation, double durationMs,
                      const StringMap &context = {});
  LogMetrics getMetrics() const;
  void resetMetrics();

  // Render a line without writing it; used by tests and the JSON sink
  std::string formatMessage(LogLevel level, const std::string &component,
                            const std::string &message,
                            const StringMap &context) const;

  void flush();
  void shutdown();

  static std::string levelToString(LogLevel level);
  static LogLevel parseLogLevel(const std::string &levelStr);
  static LogFormat parseLogFormat(const std::string &formatStr);

private:
  Logger() = default;
  ~Logger();

  LogConfig config_;
  mutable std::mutex configMutex_;

  std::ofstream fileStream_;
  std::string currentLogFile_;
  size_t currentFileSize_ = 0;
  mutable std::mutex fileMutex_;

  LogMetrics metrics_;

  std::string formatTimestamp() const;
  std::string formatTextMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const StringMap &context) const;
  std::string formatJsonMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const StringMap &context) const;
  void openLogFile(const std::string &filename);
  void writeLog(const std::string &formattedMessage, bool console, bool file);
  void rotateLogFile();
  bool shouldLog(LogLevel level, const std::string &component) const;
};

} // namespace scrub

// Standard logging macros
#define LOG_DEBUG(component, message, ...)                                     \
  scrub::Logger::getInstance().debug(component, message, ##__VA_ARGS__)
#define LOG_INFO(component, message, ...)                                      \
  scrub::Logger::getInstance().info(component, message, ##__VA_ARGS__)
#define LOG_WARN(component, message, ...)                                      \
  scrub::Logger::getInstance().warn(component, message, ##__VA_ARGS__)
#define LOG_ERROR(component, message, ...)                                     \
  scrub::Logger::getInstance().error(component, message, ##__VA_ARGS__)
#define LOG_FATAL(component, message, ...)                                     \
  scrub::Logger::getInstance().fatal(component, message, ##__VA_ARGS__)

#include "component_logger.hpp"
