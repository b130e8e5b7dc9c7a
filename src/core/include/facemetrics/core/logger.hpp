#pragma once

#include <facemetrics/core/pch.hpp>

#include <facemetrics/core/core.hpp>

#include <ctti/type_id.hpp>

#include <QFile>
#include <QMutex>
#include <QTextStream>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <shared_mutex>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace facemetrics {

/**
 * @brief Log severity levels.
 */
enum class LogLevel : uint8_t {
  kTrace = 0,
  kDebug = 1,
  kInfo = 2,
  kWarn = 3,
  kError = 4,
  kCritical = 5,
};

/**
 * @brief Converts LogLevel to a human-readable string.
 * @param level The log level to convert.
 * @return A string view representing the log level.
 */
[[nodiscard]] constexpr std::string_view LogLevelToString(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::kTrace:
      return "TRACE";
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
    case LogLevel::kCritical:
      return "CRITICAL";
  }
  return "UNKNOWN";
}

/**
 * @brief Configuration for logger behavior and output.
 */
struct LoggerConfig {
  std::string log_directory = "logs";                        ///< Log output directory path.
  std::string file_name_pattern = "{name}_{timestamp}.log";  ///< Pattern for log file names.

  LogLevel min_level = LogLevel::kTrace;        ///< Messages below this level are dropped.
  LogLevel auto_flush_level = LogLevel::kWarn;  ///< Minimum log level to flush automatically.

  bool enable_console = true;  ///< Enable console output.
  bool enable_file = false;    ///< Enable file output.
  bool truncate_files = true;  ///< Truncate existing log files instead of appending.

  LogLevel source_location_level = LogLevel::kError;  ///< Minimum level to include source location.
  LogLevel stack_trace_level = LogLevel::kCritical;   ///< Minimum level to include stack trace.

  [[nodiscard]] static LoggerConfig Default() noexcept { return {}; }

  [[nodiscard]] static LoggerConfig ConsoleOnly() noexcept {
    LoggerConfig config;
    config.enable_console = true;
    config.enable_file = false;
    return config;
  }

  [[nodiscard]] static LoggerConfig FileOnly() noexcept {
    LoggerConfig config;
    config.enable_console = false;
    config.enable_file = true;
    return config;
  }

  /**
   * @brief Console and file output, everything from trace up.
   */
  [[nodiscard]] static LoggerConfig Debug() noexcept {
    LoggerConfig config;
    config.enable_console = true;
    config.enable_file = true;
    return config;
  }

  /**
   * @brief Console output from info up.
   */
  [[nodiscard]] static LoggerConfig Release() noexcept {
    LoggerConfig config;
    config.enable_console = true;
    config.enable_file = false;
    config.min_level = LogLevel::kInfo;
    return config;
  }
};

using LoggerId = size_t;

/**
 * @brief Trait to identify valid logger types.
 * @details A valid logger type is an empty struct with a static Name() function.
 */
template <typename T>
concept LoggerTrait = std::is_empty_v<std::remove_cvref_t<T>> && requires {
  { T::Name() } -> std::same_as<std::string_view>;
};

/**
 * @brief Trait to identify loggers that carry their own configuration.
 */
template <typename T>
concept LoggerWithConfigTrait = LoggerTrait<T> && requires {
  { T::Config() } -> std::same_as<LoggerConfig>;
};

template <LoggerTrait T>
constexpr LoggerId LoggerIdOf() noexcept {
  return ctti::type_index_of<T>().hash();
}

template <LoggerTrait T>
constexpr std::string_view LoggerNameOf() noexcept {
  return T::Name();
}

template <LoggerTrait T>
inline LoggerConfig LoggerConfigOf() noexcept {
  if constexpr (LoggerWithConfigTrait<T>) {
    return T::Config();
  } else {
    return LoggerConfig::Default();
  }
}

/**
 * @brief Default logger type.
 */
struct DefaultLogger {
  static constexpr std::string_view Name() noexcept { return "FACEMETRICS"; }

  static LoggerConfig Config() noexcept {
#if defined(FACEMETRICS_RELEASE_MODE)
    return LoggerConfig::Release();
#else
    return LoggerConfig::ConsoleOnly();
#endif
  }
};

inline constexpr DefaultLogger kDefaultLogger{};

namespace details {

/**
 * @brief Extracts the file name from a given path.
 */
[[nodiscard]] constexpr std::string_view GetFileName(std::string_view path) noexcept {
  const size_t last_slash = path.find_last_of("/\\");
  return (last_slash != std::string_view::npos) ? path.substr(last_slash + 1) : path;
}

}  // namespace details

/**
 * @brief Centralized logging with typed loggers.
 * @details Console output goes through Qt's message handler, file output through QFile.
 * @note Thread-safe.
 */
class Logger {
public:
  Logger(const Logger&) = delete;
  Logger(Logger&&) = delete;
  ~Logger() noexcept;

  Logger& operator=(const Logger&) = delete;
  Logger& operator=(Logger&&) = delete;

  /**
   * @brief Registers a typed logger. Does nothing if it is already registered.
   * @tparam T Logger type
   * @param logger Logger type instance
   * @param config Configuration for the logger
   */
  template <LoggerTrait T>
  void AddLogger(T /*logger*/ = {}, LoggerConfig config = LoggerConfigOf<T>()) noexcept {
    AddLoggerImpl(LoggerIdOf<T>(), LoggerNameOf<T>(), std::move(config));
  }

  /**
   * @brief Removes a typed logger.
   * @note The default logger cannot be removed.
   */
  template <LoggerTrait T>
  void RemoveLogger(T /*logger*/ = {}) noexcept {
    RemoveLoggerImpl(LoggerIdOf<T>());
  }

  void FlushAll() noexcept;

  template <LoggerTrait T>
  void Flush(T /*logger*/ = {}) noexcept {
    FlushImpl(LoggerIdOf<T>());
  }

  template <LoggerTrait T>
  void LogMessage(T /*logger*/, LogLevel level, const std::source_location& loc, std::string_view message) noexcept {
    LogMessageImpl(LoggerIdOf<T>(), level, loc, message);
  }

  template <LoggerTrait T, typename... Args>
    requires(sizeof...(Args) > 0)
  void LogMessage(T /*logger*/, LogLevel level, const std::source_location& loc, std::format_string<Args...> fmt,
                  Args&&... args) noexcept {
    LogFormatted(LoggerIdOf<T>(), level, loc, fmt, std::forward<Args>(args)...);
  }

  void LogMessage(LogLevel level, const std::source_location& loc, std::string_view message) noexcept {
    LogMessageImpl(LoggerIdOf<DefaultLogger>(), level, loc, message);
  }

  template <typename... Args>
    requires(sizeof...(Args) > 0)
  void LogMessage(LogLevel level, const std::source_location& loc, std::format_string<Args...> fmt,
                  Args&&... args) noexcept {
    LogFormatted(LoggerIdOf<DefaultLogger>(), level, loc, fmt, std::forward<Args>(args)...);
  }

  /**
   * @brief Logs an assertion failure at critical level through the default logger.
   * @param condition The failed condition as a string
   * @param loc Source location where the assertion failed
   * @param message Additional message describing the failure
   */
  void LogAssertionFailure(std::string_view condition, const std::source_location& loc,
                           std::string_view message) noexcept;

  template <LoggerTrait T>
  void SetLevel(T /*logger*/, LogLevel level) noexcept {
    SetLevelImpl(LoggerIdOf<T>(), level);
  }

  void SetLevel(LogLevel level) noexcept { SetLevelImpl(LoggerIdOf<DefaultLogger>(), level); }

  template <LoggerTrait T>
  [[nodiscard]] bool HasLogger(T /*logger*/ = {}) const noexcept {
    return HasLoggerImpl(LoggerIdOf<T>());
  }

  [[nodiscard]] bool ShouldLog(LogLevel level) const noexcept {
    return ShouldLogImpl(LoggerIdOf<DefaultLogger>(), level);
  }

  template <LoggerTrait T>
  [[nodiscard]] bool ShouldLog(T /*logger*/, LogLevel level) const noexcept {
    return ShouldLogImpl(LoggerIdOf<T>(), level);
  }

  /**
   * @brief Gets the current log level for a typed logger.
   * @return The current log level, or LogLevel::kTrace if the logger doesn't exist
   */
  template <LoggerTrait T>
  [[nodiscard]] LogLevel GetLevel(T /*logger*/ = {}) const noexcept {
    return GetLevelImpl(LoggerIdOf<T>());
  }

  [[nodiscard]] LogLevel GetLevel() const noexcept { return GetLevelImpl(LoggerIdOf<DefaultLogger>()); }

  [[nodiscard]] static Logger& GetInstance() noexcept {
    static Logger instance;
    return instance;
  }

private:
  /**
   * @brief State of a single registered logger.
   */
  struct LoggerData {
    std::string name;
    LoggerConfig config;
    LogLevel level = LogLevel::kTrace;
    std::unique_ptr<QFile> file;
    std::unique_ptr<QTextStream> file_stream;
    QMutex file_mutex;

    LoggerData(std::string n, LoggerConfig cfg) : name(std::move(n)), config(std::move(cfg)), level(config.min_level) {}
    LoggerData(const LoggerData&) = delete;
    LoggerData(LoggerData&&) = delete;
    ~LoggerData() = default;

    LoggerData& operator=(const LoggerData&) = delete;
    LoggerData& operator=(LoggerData&&) = delete;
  };

  Logger() noexcept;

  template <typename... Args>
  void LogFormatted(LoggerId logger_id, LogLevel level, const std::source_location& loc,
                    std::format_string<Args...> fmt, Args&&... args) noexcept {
    if (!ShouldLogImpl(logger_id, level)) {
      return;
    }
    try {
      const std::string message = std::format(fmt, std::forward<Args>(args)...);
      LogMessageImpl(logger_id, level, loc, message);
    } catch (...) {
      LogMessageImpl(logger_id, LogLevel::kError, loc, "Formatting error in log message");
    }
  }

  void AddLoggerImpl(LoggerId logger_id, std::string_view name, LoggerConfig config) noexcept;
  void RemoveLoggerImpl(LoggerId logger_id) noexcept;
  void FlushImpl(LoggerId logger_id) noexcept;
  void SetLevelImpl(LoggerId logger_id, LogLevel level) noexcept;
  [[nodiscard]] bool HasLoggerImpl(LoggerId logger_id) const noexcept;
  [[nodiscard]] bool ShouldLogImpl(LoggerId logger_id, LogLevel level) const noexcept;
  [[nodiscard]] LogLevel GetLevelImpl(LoggerId logger_id) const noexcept;

  void LogMessageImpl(LoggerId logger_id, LogLevel level, const std::source_location& loc,
                      std::string_view message) noexcept;

  [[nodiscard]] static std::unique_ptr<LoggerData> CreateLoggerData(std::string_view name, LoggerConfig config);
  [[nodiscard]] static std::string FormatLogFileName(std::string_view logger_name, std::string_view pattern);
  [[nodiscard]] static std::string FormatLogMessage(const LoggerData& data, LogLevel level,
                                                    const std::source_location& loc, std::string_view message);

  static void WriteToConsole(LogLevel level, std::string_view message) noexcept;
  static void WriteToFile(LoggerData& data, std::string_view message, bool flush) noexcept;

  std::unordered_map<LoggerId, std::unique_ptr<LoggerData>> loggers_;
  mutable std::shared_mutex loggers_mutex_;
};

}  // namespace facemetrics

// ============================================================================
// Logging Macros
// ============================================================================

#ifdef FACEMETRICS_DEBUG_MODE
#define FACEMETRICS_DEBUG(...)                                                                                    \
  ::facemetrics::Logger::GetInstance().LogMessage(::facemetrics::LogLevel::kDebug, std::source_location::current(), \
                                                  __VA_ARGS__)
#define FACEMETRICS_DEBUG_LOGGER(logger, ...)                                                               \
  ::facemetrics::Logger::GetInstance().LogMessage(logger, ::facemetrics::LogLevel::kDebug,                  \
                                                  std::source_location::current(), __VA_ARGS__)
#define FACEMETRICS_TRACE(...)                                                                                    \
  ::facemetrics::Logger::GetInstance().LogMessage(::facemetrics::LogLevel::kTrace, std::source_location::current(), \
                                                  __VA_ARGS__)
#define FACEMETRICS_TRACE_LOGGER(logger, ...)                                                               \
  ::facemetrics::Logger::GetInstance().LogMessage(logger, ::facemetrics::LogLevel::kTrace,                  \
                                                  std::source_location::current(), __VA_ARGS__)
#else
#define FACEMETRICS_DEBUG(...) static_cast<void>(0)
#define FACEMETRICS_DEBUG_LOGGER(logger, ...) static_cast<void>(0)
#define FACEMETRICS_TRACE(...) static_cast<void>(0)
#define FACEMETRICS_TRACE_LOGGER(logger, ...) static_cast<void>(0)
#endif

#define FACEMETRICS_INFO(...)                                                                                    \
  ::facemetrics::Logger::GetInstance().LogMessage(::facemetrics::LogLevel::kInfo, std::source_location::current(), \
                                                  __VA_ARGS__)
#define FACEMETRICS_WARN(...)                                                                                    \
  ::facemetrics::Logger::GetInstance().LogMessage(::facemetrics::LogLevel::kWarn, std::source_location::current(), \
                                                  __VA_ARGS__)
#define FACEMETRICS_ERROR(...)                                                                                    \
  ::facemetrics::Logger::GetInstance().LogMessage(::facemetrics::LogLevel::kError, std::source_location::current(), \
                                                  __VA_ARGS__)
#define FACEMETRICS_CRITICAL(...)                                                          \
  ::facemetrics::Logger::GetInstance().LogMessage(::facemetrics::LogLevel::kCritical,      \
                                                  std::source_location::current(), __VA_ARGS__)

#define FACEMETRICS_INFO_LOGGER(logger, ...)                                                                \
  ::facemetrics::Logger::GetInstance().LogMessage(logger, ::facemetrics::LogLevel::kInfo,                   \
                                                  std::source_location::current(), __VA_ARGS__)
#define FACEMETRICS_WARN_LOGGER(logger, ...)                                                                \
  ::facemetrics::Logger::GetInstance().LogMessage(logger, ::facemetrics::LogLevel::kWarn,                   \
                                                  std::source_location::current(), __VA_ARGS__)
#define FACEMETRICS_ERROR_LOGGER(logger, ...)                                                               \
  ::facemetrics::Logger::GetInstance().LogMessage(logger, ::facemetrics::LogLevel::kError,                  \
                                                  std::source_location::current(), __VA_ARGS__)
#define FACEMETRICS_CRITICAL_LOGGER(logger, ...)                                                            \
  ::facemetrics::Logger::GetInstance().LogMessage(logger, ::facemetrics::LogLevel::kCritical,               \
                                                  std::source_location::current(), __VA_ARGS__)
