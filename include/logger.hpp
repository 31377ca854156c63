#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, FATAL = 4 };

enum class LogFormat { TEXT = 0, JSON = 1 };

using LogContext = std::unordered_map<std::string, std::string>;

struct LogConfig {
  LogLevel level = LogLevel::INFO;
  LogFormat format = LogFormat::TEXT;
  bool consoleOutput = true;
  bool fileOutput = false;
  bool asyncLogging = false;
  std::string logFile = "logs/mdjobs.log";
  size_t maxFileSize = 10 * 1024 * 1024; // 10MB
  int maxBackupFiles = 5;
  bool enableRotation = true;
  std::unordered_set<std::string> componentFilter; // Empty = all components
  size_t maxQueueSize = 10000;
};

struct LogMetrics {
  std::atomic<uint64_t> totalMessages{0};
  std::atomic<uint64_t> errorCount{0};
  std::atomic<uint64_t> warningCount{0};
  std::atomic<uint64_t> droppedMessages{0};
  std::chrono::steady_clock::time_point startTime;

  LogMetrics() : startTime(std::chrono::steady_clock::now()) {}

  // Atomics are not copyable, copy their values
  LogMetrics(const LogMetrics &other)
      : totalMessages(other.totalMessages.load()),
        errorCount(other.errorCount.load()),
        warningCount(other.warningCount.load()),
        droppedMessages(other.droppedMessages.load()),
        startTime(other.startTime) {}

  LogMetrics &operator=(const LogMetrics &other) {
    if (this != &other) {
      totalMessages.store(other.totalMessages.load());
      errorCount.store(other.errorCount.load());
      warningCount.store(other.warningCount.load());
      droppedMessages.store(other.droppedMessages.load());
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
  void setLogLevel(LogLevel level);
  void setLogFormat(LogFormat format);
  void enableConsoleOutput(bool enable);
  void enableAsyncLogging(bool enable);
  void setComponentFilter(const std::unordered_set<std::string> &components);
  LogLevel getLogLevel() const;

  // Logging methods
  void log(LogLevel level, const std::string &component,
           const std::string &message, const LogContext &context = {});
  void debug(const std::string &component, const std::string &message,
             const LogContext &context = {});
  void info(const std::string &component, const std::string &message,
            const LogContext &context = {});
  void warn(const std::string &component, const std::string &message,
            const LogContext &context = {});
  void error(const std::string &component, const std::string &message,
             const LogContext &context = {});
  void fatal(const std::string &component, const std::string &message,
             const LogContext &context = {});

  // Timing of an operation, logged at INFO with duration_ms in the context
  void logPerformance(const std::string &operation, double durationMs,
                      const LogContext &context = {});
  LogMetrics getMetrics() const;

  // Control methods
  void flush();
  void shutdown();

private:
  Logger() = default;
  ~Logger();

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  // Configuration
  LogConfig config_;
  mutable std::mutex configMutex_;

  // File handling
  std::ofstream fileStream_;
  size_t currentFileSize_ = 0;
  mutable std::mutex fileMutex_;

  // Async logging
  std::queue<std::string> messageQueue_;
  std::thread asyncThread_;
  std::condition_variable asyncCondition_;
  std::mutex asyncMutex_;
  std::atomic<bool> stopAsync_{false};
  std::atomic<bool> asyncStarted_{false};

  // Metrics
  LogMetrics metrics_;

  std::string formatTimestamp() const;
  static const char *levelToString(LogLevel level);
  std::string formatMessage(LogLevel level, const std::string &component,
                            const std::string &message,
                            const LogContext &context, LogFormat format) const;
  std::string formatTextMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const LogContext &context) const;
  std::string formatJsonMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const LogContext &context) const;
  void openLogFile(const std::string &path);
  void writeLog(const std::string &formattedMessage);
  void writeLogSync(const std::string &formattedMessage);
  void writeLogAsync(const std::string &formattedMessage);
  void asyncWorker();
  void startAsyncWorker();
  void stopAsyncWorker();
  void rotateLogFile(const std::string &current, int maxBackups);
  bool shouldLog(LogLevel level, const std::string &component) const;
  static std::string escapeJson(const std::string &str);
};

// Standard logging macros
#define LOG_DEBUG(component, message, ...)                                     \
  Logger::getInstance().debug(component, message, ##__VA_ARGS__)
#define LOG_INFO(component, message, ...)                                      \
  Logger::getInstance().info(component, message, ##__VA_ARGS__)
#define LOG_WARN(component, message, ...)                                      \
  Logger::getInstance().warn(component, message, ##__VA_ARGS__)
#define LOG_ERROR(component, message, ...)                                     \
  Logger::getInstance().error(component, message, ##__VA_ARGS__)
#define LOG_FATAL(component, message, ...)                                     \
  Logger::getInstance().fatal(component, message, ##__VA_ARGS__)

// Component loggers and their macros
#include "component_logger.hpp"
