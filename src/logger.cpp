#include "logger.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>

Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

Logger::~Logger() { shutdown(); }

void Logger::configure(const LogConfig &config) {
  bool wantAsync = false;
  {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_ = config;
    wantAsync = config_.asyncLogging;

    if (config_.fileOutput) {
      std::lock_guard<std::mutex> fileLock(fileMutex_);
      openLogFile(config_.logFile);
      if (!fileStream_.is_open()) {
        config_.fileOutput = false;
      }
    }
  }

  if (wantAsync) {
    startAsyncWorker();
  } else {
    stopAsyncWorker();
  }
}

void Logger::openLogFile(const std::string &path) {
  if (fileStream_.is_open()) {
    fileStream_.close();
  }

  std::filesystem::path logPath(path);
  if (logPath.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(logPath.parent_path(), ec);
  }

  fileStream_.open(path, std::ios::app);
  if (!fileStream_.is_open()) {
    std::cerr << "Failed to open log file: " << path << std::endl;
    return;
  }

  std::error_code ec;
  currentFileSize_ = std::filesystem::exists(path, ec)
                         ? static_cast<size_t>(std::filesystem::file_size(path, ec))
                         : 0;
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.level = level;
}

void Logger::setLogFormat(LogFormat format) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.format = format;
}

void Logger::enableConsoleOutput(bool enable) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.consoleOutput = enable;
}

void Logger::enableAsyncLogging(bool enable) {
  {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.asyncLogging = enable;
  }
  if (enable) {
    startAsyncWorker();
  } else {
    stopAsyncWorker();
  }
}

void Logger::setComponentFilter(
    const std::unordered_set<std::string> &components) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.componentFilter = components;
}

LogLevel Logger::getLogLevel() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  return config_.level;
}

void Logger::log(LogLevel level, const std::string &component,
                 const std::string &message, const LogContext &context) {
  if (!shouldLog(level, component)) {
    return;
  }

  metrics_.totalMessages++;
  if (level == LogLevel::ERROR || level == LogLevel::FATAL) {
    metrics_.errorCount++;
  } else if (level == LogLevel::WARN) {
    metrics_.warningCount++;
  }

  LogFormat format;
  {
    std::lock_guard<std::mutex> lock(configMutex_);
    format = config_.format;
  }
  writeLog(formatMessage(level, component, message, context, format));
}

void Logger::debug(const std::string &component, const std::string &message,
                   const LogContext &context) {
  log(LogLevel::DEBUG, component, message, context);
}

void Logger::info(const std::string &component, const std::string &message,
                  const LogContext &context) {
  log(LogLevel::INFO, component, message, context);
}

void Logger::warn(const std::string &component, const std::string &message,
                  const LogContext &context) {
  log(LogLevel::WARN, component, message, context);
}

void Logger::error(const std::string &component, const std::string &message,
                   const LogContext &context) {
  log(LogLevel::ERROR, component, message, context);
}

void Logger::fatal(const std::string &component, const std::string &message,
                   const LogContext &context) {
  log(LogLevel::FATAL, component, message, context);
}

void Logger::logPerformance(const std::string &operation, double durationMs,
                            const LogContext &context) {
  auto perfContext = context;
  perfContext["operation"] = operation;
  perfContext["duration_ms"] = std::to_string(durationMs);

  log(LogLevel::INFO, "Performance", "Operation completed: " + operation,
      perfContext);
}

LogMetrics Logger::getMetrics() const { return metrics_; }

void Logger::flush() {
  {
    std::lock_guard<std::mutex> lock(asyncMutex_);
    asyncCondition_.notify_all();
  }

  std::lock_guard<std::mutex> lock(fileMutex_);
  if (fileStream_.is_open()) {
    fileStream_.flush();
  }
}

void Logger::shutdown() {
  stopAsyncWorker();

  std::lock_guard<std::mutex> lock(fileMutex_);
  if (fileStream_.is_open()) {
    fileStream_.close();
  }
}

std::string Logger::formatTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tm{};
  localtime_r(&time, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  oss << "." << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

const char *Logger::levelToString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO ";
  case LogLevel::WARN:
    return "WARN ";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::FATAL:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

std::string Logger::formatMessage(LogLevel level, const std::string &component,
                                  const std::string &message,
                                  const LogContext &context,
                                  LogFormat format) const {
  return format == LogFormat::JSON
             ? formatJsonMessage(level, component, message, context)
             : formatTextMessage(level, component, message, context);
}

std::string Logger::formatTextMessage(LogLevel level,
                                      const std::string &component,
                                      const std::string &message,
                                      const LogContext &context) const {
  std::ostringstream oss;
  oss << "[" << formatTimestamp() << "] "
      << "[" << levelToString(level) << "] "
      << "[" << component << "] " << message;

  if (!context.empty()) {
    oss << " |";
    for (const auto &[key, value] : context) {
      oss << " " << key << "=" << value;
    }
  }

  return oss.str();
}

std::string Logger::formatJsonMessage(LogLevel level,
                                      const std::string &component,
                                      const std::string &message,
                                      const LogContext &context) const {
  std::string levelName = levelToString(level);
  levelName.erase(levelName.find_last_not_of(' ') + 1);

  std::ostringstream oss;
  oss << "{"
      << "\"timestamp\":\"" << formatTimestamp() << "\","
      << "\"level\":\"" << levelName << "\","
      << "\"component\":\"" << escapeJson(component) << "\","
      << "\"message\":\"" << escapeJson(message) << "\"";

  if (!context.empty()) {
    oss << ",\"context\":{";
    bool first = true;
    for (const auto &[key, value] : context) {
      if (!first)
        oss << ",";
      oss << "\"" << escapeJson(key) << "\":\"" << escapeJson(value) << "\"";
      first = false;
    }
    oss << "}";
  }

  oss << "}";
  return oss.str();
}

std::string Logger::escapeJson(const std::string &str) {
  std::string result;
  result.reserve(str.length() + 16);

  for (char c : str) {
    switch (c) {
    case '"':
      result += "\\\"";
      break;
    case '\\':
      result += "\\\\";
      break;
    case '\b':
      result += "\\b";
      break;
    case '\f':
      result += "\\f";
      break;
    case '\n':
      result += "\\n";
      break;
    case '\r':
      result += "\\r";
      break;
    case '\t':
      result += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        std::ostringstream oss;
        oss << "\\u" << std::setfill('0') << std::setw(4) << std::hex
            << static_cast<int>(c);
        result += oss.str();
      } else {
        result += c;
      }
      break;
    }
  }

  return result;
}

void Logger::writeLog(const std::string &formattedMessage) {
  if (asyncStarted_) {
    writeLogAsync(formattedMessage);
  } else {
    writeLogSync(formattedMessage);
  }
}

void Logger::writeLogSync(const std::string &formattedMessage) {
  bool console;
  bool file;
  bool rotate;
  size_t maxFileSize;
  std::string logFile;
  int maxBackups;
  {
    std::lock_guard<std::mutex> lock(configMutex_);
    console = config_.consoleOutput;
    file = config_.fileOutput;
    rotate = config_.enableRotation;
    maxFileSize = config_.maxFileSize;
    logFile = config_.logFile;
    maxBackups = config_.maxBackupFiles;
  }

  if (console) {
    std::lock_guard<std::mutex> lock(fileMutex_);
    std::cout << formattedMessage << std::endl;
  }

  if (file) {
    std::lock_guard<std::mutex> lock(fileMutex_);
    if (fileStream_.is_open()) {
      if (rotate &&
          currentFileSize_ + formattedMessage.length() > maxFileSize) {
        rotateLogFile(logFile, maxBackups);
      }

      fileStream_ << formattedMessage << std::endl;
      currentFileSize_ += formattedMessage.length() + 1;
    }
  }
}

void Logger::writeLogAsync(const std::string &formattedMessage) {
  size_t maxQueueSize;
  {
    std::lock_guard<std::mutex> lock(configMutex_);
    maxQueueSize = config_.maxQueueSize;
  }

  std::lock_guard<std::mutex> lock(asyncMutex_);
  if (messageQueue_.size() >= maxQueueSize) {
    metrics_.droppedMessages++;
    return;
  }

  messageQueue_.push(formattedMessage);
  asyncCondition_.notify_one();
}

void Logger::startAsyncWorker() {
  if (asyncStarted_.exchange(true)) {
    return;
  }
  stopAsync_ = false;
  asyncThread_ = std::thread(&Logger::asyncWorker, this);
}

void Logger::stopAsyncWorker() {
  if (!asyncStarted_) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(asyncMutex_);
    stopAsync_ = true;
  }
  asyncCondition_.notify_all();
  if (asyncThread_.joinable()) {
    asyncThread_.join();
  }
  asyncStarted_ = false;
}

void Logger::asyncWorker() {
  std::unique_lock<std::mutex> lock(asyncMutex_);
  while (true) {
    asyncCondition_.wait(lock,
                         [this] { return !messageQueue_.empty() || stopAsync_; });

    while (!messageQueue_.empty()) {
      std::string message = std::move(messageQueue_.front());
      messageQueue_.pop();
      lock.unlock();
      writeLogSync(message);
      lock.lock();
    }

    if (stopAsync_) {
      break;
    }
  }
}

void Logger::rotateLogFile(const std::string &current, int maxBackups) {
  // Called with fileMutex_ held
  fileStream_.close();

  std::error_code ec;
  for (int i = maxBackups - 1; i > 0; i--) {
    std::string oldFile = current + "." + std::to_string(i);
    std::string newFile = current + "." + std::to_string(i + 1);

    if (std::filesystem::exists(oldFile, ec)) {
      if (i == maxBackups - 1) {
        std::filesystem::remove(newFile, ec);
      }
      std::filesystem::rename(oldFile, newFile, ec);
    }
  }

  if (std::filesystem::exists(current, ec)) {
    std::filesystem::rename(current, current + ".1", ec);
  }

  fileStream_.open(current, std::ios::out);
  currentFileSize_ = 0;
}

bool Logger::shouldLog(LogLevel level, const std::string &component) const {
  std::lock_guard<std::mutex> lock(configMutex_);
  if (level < config_.level) {
    return false;
  }
  if (!config_.componentFilter.empty() &&
      config_.componentFilter.find(component) ==
          config_.componentFilter.end()) {
    return false;
  }
  return true;
}
