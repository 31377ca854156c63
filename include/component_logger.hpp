#pragma once

#include "logger.hpp"
#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace mdjobs {

template <typename Component> struct ComponentTrait;

template <> struct ComponentTrait<class ConfigManager> {
  static constexpr const char *name = "ConfigManager";
};

template <> struct ComponentTrait<class DatabaseManager> {
  static constexpr const char *name = "DatabaseManager";
};

template <> struct ComponentTrait<class JobRunner> {
  static constexpr const char *name = "JobRunner";
};

template <> struct ComponentTrait<class SchedulerService> {
  static constexpr const char *name = "SchedulerService";
};

template <> struct ComponentTrait<class EodScanEngine> {
  static constexpr const char *name = "EodScanEngine";
};

template <> struct ComponentTrait<class ChainManager> {
  static constexpr const char *name = "ChainManager";
};

template <> struct ComponentTrait<class ExecutionTracker> {
  static constexpr const char *name = "ExecutionTracker";
};

template <> struct ComponentTrait<class HttpClient> {
  static constexpr const char *name = "HttpClient";
};

template <> struct ComponentTrait<class JobControlService> {
  static constexpr const char *name = "JobControlService";
};

/**
 * ComponentLogger - compile-time bound component name in front of the
 * Logger singleton. "{}" placeholders in the message are replaced by the
 * trailing arguments in order.
 */
template <typename Component> class ComponentLogger {
private:
  static_assert(std::is_class_v<Component>, "Component must be a class type");

  static constexpr const char *component_name = ComponentTrait<Component>::name;

  static Logger &getLogger() { return Logger::getInstance(); }

public:
  template <typename... Args>
  static void debug(const std::string &message, Args &&...args) {
    if constexpr (sizeof...(args) > 0) {
      getLogger().debug(component_name,
                        format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().debug(component_name, message);
    }
  }

  template <typename... Args>
  static void info(const std::string &message, Args &&...args) {
    if constexpr (sizeof...(args) > 0) {
      getLogger().info(component_name,
                       format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().info(component_name, message);
    }
  }

  template <typename... Args>
  static void warn(const std::string &message, Args &&...args) {
    if constexpr (sizeof...(args) > 0) {
      getLogger().warn(component_name,
                       format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().warn(component_name, message);
    }
  }

  template <typename... Args>
  static void error(const std::string &message, Args &&...args) {
    if constexpr (sizeof...(args) > 0) {
      getLogger().error(component_name,
                        format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().error(component_name, message);
    }
  }

  template <typename... Args>
  static void fatal(const std::string &message, Args &&...args) {
    if constexpr (sizeof...(args) > 0) {
      getLogger().fatal(component_name,
                        format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().fatal(component_name, message);
    }
  }

  // Context-aware logging with metadata

  static void infoWithContext(const std::string &message,
                              const LogContext &context = {}) {
    getLogger().info(component_name, message, context);
  }

  static void warnWithContext(const std::string &message,
                              const LogContext &context = {}) {
    getLogger().warn(component_name, message, context);
  }

  static void errorWithContext(const std::string &message,
                               const LogContext &context = {}) {
    getLogger().error(component_name, message, context);
  }

  static void logPerformance(const std::string &operation, double durationMs,
                             const LogContext &context = {}) {
    getLogger().logPerformance(operation, durationMs, context);
  }

  static constexpr const char *getComponentName() { return component_name; }

private:
  template <typename T>
  static void stream_value(std::stringstream &ss, T &&value) {
    if constexpr (std::is_same_v<std::decay_t<T>, bool>) {
      ss << (value ? "true" : "false");
    } else if constexpr (std::is_same_v<std::decay_t<T>, LogContext>) {
      ss << "{";
      bool first = true;
      for (const auto &pair : value) {
        if (!first)
          ss << ", ";
        ss << pair.first << ": " << pair.second;
        first = false;
      }
      ss << "}";
    } else {
      ss << std::forward<T>(value);
    }
  }

  template <typename... Args>
  static std::string format_message(const std::string &format, Args &&...args) {
    std::stringstream ss;
    format_impl(ss, format, std::forward<Args>(args)...);
    return ss.str();
  }

  template <typename T, typename... Args>
  static void format_impl(std::stringstream &ss, const std::string &format,
                          T &&arg, Args &&...args) {
    size_t pos = format.find("{}");
    if (pos != std::string::npos) {
      ss << format.substr(0, pos);
      stream_value(ss, std::forward<T>(arg));
      if constexpr (sizeof...(args) > 0) {
        format_impl(ss, format.substr(pos + 2), std::forward<Args>(args)...);
      } else {
        ss << format.substr(pos + 2);
      }
    } else {
      ss << format;
    }
  }

  static void format_impl(std::stringstream &ss, const std::string &format) {
    ss << format;
  }
};

using ConfigLogger = ComponentLogger<class ConfigManager>;
using DatabaseLogger = ComponentLogger<class DatabaseManager>;
using JobRunnerLogger = ComponentLogger<class JobRunner>;
using SchedulerLogger = ComponentLogger<class SchedulerService>;
using ScanLogger = ComponentLogger<class EodScanEngine>;
using ChainLogger = ComponentLogger<class ChainManager>;
using TrackerLogger = ComponentLogger<class ExecutionTracker>;
using HttpLogger = ComponentLogger<class HttpClient>;
using ControlLogger = ComponentLogger<class JobControlService>;

} // namespace mdjobs

#define CONFIG_LOG_DEBUG(message, ...)                                         \
  mdjobs::ConfigLogger::debug(message, ##__VA_ARGS__)
#define CONFIG_LOG_INFO(message, ...)                                          \
  mdjobs::ConfigLogger::info(message, ##__VA_ARGS__)
#define CONFIG_LOG_WARN(message, ...)                                          \
  mdjobs::ConfigLogger::warn(message, ##__VA_ARGS__)
#define CONFIG_LOG_ERROR(message, ...)                                         \
  mdjobs::ConfigLogger::error(message, ##__VA_ARGS__)

#define DB_LOG_DEBUG(message, ...)                                             \
  mdjobs::DatabaseLogger::debug(message, ##__VA_ARGS__)
#define DB_LOG_INFO(message, ...)                                              \
  mdjobs::DatabaseLogger::info(message, ##__VA_ARGS__)
#define DB_LOG_WARN(message, ...)                                              \
  mdjobs::DatabaseLogger::warn(message, ##__VA_ARGS__)
#define DB_LOG_ERROR(message, ...)                                             \
  mdjobs::DatabaseLogger::error(message, ##__VA_ARGS__)

#define MDJOBS_LOG_DEBUG(message, ...)                                         \
  mdjobs::JobRunnerLogger::debug(message, ##__VA_ARGS__)
#define MDJOBS_LOG_INFO(message, ...)                                          \
  mdjobs::JobRunnerLogger::info(message, ##__VA_ARGS__)
#define MDJOBS_LOG_WARN(message, ...)                                          \
  mdjobs::JobRunnerLogger::warn(message, ##__VA_ARGS__)
#define MDJOBS_LOG_ERROR(message, ...)                                         \
  mdjobs::JobRunnerLogger::error(message, ##__VA_ARGS__)

#define SCHED_LOG_DEBUG(message, ...)                                          \
  mdjobs::SchedulerLogger::debug(message, ##__VA_ARGS__)
#define SCHED_LOG_INFO(message, ...)                                           \
  mdjobs::SchedulerLogger::info(message, ##__VA_ARGS__)
#define SCHED_LOG_WARN(message, ...)                                           \
  mdjobs::SchedulerLogger::warn(message, ##__VA_ARGS__)
#define SCHED_LOG_ERROR(message, ...)                                          \
  mdjobs::SchedulerLogger::error(message, ##__VA_ARGS__)

#define SCAN_LOG_DEBUG(message, ...)                                           \
  mdjobs::ScanLogger::debug(message, ##__VA_ARGS__)
#define SCAN_LOG_INFO(message, ...)                                            \
  mdjobs::ScanLogger::info(message, ##__VA_ARGS__)
#define SCAN_LOG_WARN(message, ...)                                            \
  mdjobs::ScanLogger::warn(message, ##__VA_ARGS__)
#define SCAN_LOG_ERROR(message, ...)                                           \
  mdjobs::ScanLogger::error(message, ##__VA_ARGS__)

#define CHAIN_LOG_DEBUG(message, ...)                                          \
  mdjobs::ChainLogger::debug(message, ##__VA_ARGS__)
#define CHAIN_LOG_INFO(message, ...)                                           \
  mdjobs::ChainLogger::info(message, ##__VA_ARGS__)
#define CHAIN_LOG_WARN(message, ...)                                           \
  mdjobs::ChainLogger::warn(message, ##__VA_ARGS__)
#define CHAIN_LOG_ERROR(message, ...)                                          \
  mdjobs::ChainLogger::error(message, ##__VA_ARGS__)

#define TRACKER_LOG_DEBUG(message, ...)                                        \
  mdjobs::TrackerLogger::debug(message, ##__VA_ARGS__)
#define TRACKER_LOG_INFO(message, ...)                                         \
  mdjobs::TrackerLogger::info(message, ##__VA_ARGS__)
#define TRACKER_LOG_WARN(message, ...)                                         \
  mdjobs::TrackerLogger::warn(message, ##__VA_ARGS__)
#define TRACKER_LOG_ERROR(message, ...)                                        \
  mdjobs::TrackerLogger::error(message, ##__VA_ARGS__)

#define HTTP_LOG_DEBUG(message, ...)                                           \
  mdjobs::HttpLogger::debug(message, ##__VA_ARGS__)
#define HTTP_LOG_INFO(message, ...)                                            \
  mdjobs::HttpLogger::info(message, ##__VA_ARGS__)
#define HTTP_LOG_WARN(message, ...)                                            \
  mdjobs::HttpLogger::warn(message, ##__VA_ARGS__)
#define HTTP_LOG_ERROR(message, ...)                                           \
  mdjobs::HttpLogger::error(message, ##__VA_ARGS__)

#define CONTROL_LOG_INFO(message, ...)                                         \
  mdjobs::ControlLogger::info(message, ##__VA_ARGS__)
#define CONTROL_LOG_WARN(message, ...)                                         \
  mdjobs::ControlLogger::warn(message, ##__VA_ARGS__)
#define CONTROL_LOG_ERROR(message, ...)                                        \
  mdjobs::ControlLogger::error(message, ##__VA_ARGS__)
