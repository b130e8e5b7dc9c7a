#include <facemetrics/core/logger.hpp>

#include <facemetrics/core/assert.hpp>

#include <QDateTime>
#include <QDir>
#include <QMutexLocker>
#include <QString>
#include <QtLogging>

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace facemetrics {

namespace {

[[nodiscard]] QString ToQString(std::string_view text) {
  return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
}

}  // namespace

Logger::Logger() noexcept {
  AddLoggerImpl(LoggerIdOf<DefaultLogger>(), LoggerNameOf<DefaultLogger>(), LoggerConfigOf<DefaultLogger>());
}

Logger::~Logger() noexcept {
  FlushAll();
}

void Logger::AddLoggerImpl(LoggerId logger_id, std::string_view name, LoggerConfig config) noexcept {
  const std::scoped_lock lock(loggers_mutex_);
  if (loggers_.contains(logger_id)) {
    return;
  }

  try {
    loggers_.emplace(logger_id, CreateLoggerData(name, std::move(config)));
  } catch (...) {
    WriteToConsole(LogLevel::kError, "Failed to register logger");
  }
}

void Logger::RemoveLoggerImpl(LoggerId logger_id) noexcept {
  if (logger_id == LoggerIdOf<DefaultLogger>()) {
    return;
  }

  const std::scoped_lock lock(loggers_mutex_);
  if (const auto it = loggers_.find(logger_id); it != loggers_.end()) {
    if (it->second && it->second->file_stream) {
      const QMutexLocker file_lock(&it->second->file_mutex);
      it->second->file_stream->flush();
    }
    loggers_.erase(it);
  }
}

void Logger::FlushAll() noexcept {
  const std::shared_lock lock(loggers_mutex_);
  for (auto& [_, data] : loggers_) {
    if (data && data->file_stream) {
      const QMutexLocker file_lock(&data->file_mutex);
      data->file_stream->flush();
    }
  }
}

void Logger::FlushImpl(LoggerId logger_id) noexcept {
  const std::shared_lock lock(loggers_mutex_);
  if (const auto it = loggers_.find(logger_id); it != loggers_.end() && it->second && it->second->file_stream) {
    const QMutexLocker file_lock(&it->second->file_mutex);
    it->second->file_stream->flush();
  }
}

void Logger::LogMessageImpl(LoggerId logger_id, LogLevel level, const std::source_location& loc,
                            std::string_view message) noexcept {
  const std::shared_lock lock(loggers_mutex_);
  const auto it = loggers_.find(logger_id);
  if (it == loggers_.end() || !it->second) {
    return;
  }

  auto& data = *it->second;
  if (level < data.level) {
    return;
  }

  try {
    const std::string formatted = FormatLogMessage(data, level, loc, message);

    if (data.config.enable_console) {
      WriteToConsole(level, formatted);
    }

    if (data.config.enable_file && data.file_stream) {
      WriteToFile(data, formatted, level >= data.config.auto_flush_level);
    }
  } catch (...) {
    WriteToConsole(LogLevel::kError, "Failed to format log message");
  }
}

void Logger::LogAssertionFailure(std::string_view condition, const std::source_location& loc,
                                 std::string_view message) noexcept {
  try {
    const std::string assertion_msg = std::format("Assertion failed: {} | {}", condition, message);
    LogMessageImpl(LoggerIdOf<DefaultLogger>(), LogLevel::kCritical, loc, assertion_msg);
  } catch (...) {
    LogMessageImpl(LoggerIdOf<DefaultLogger>(), LogLevel::kCritical, loc, condition);
  }
}

void Logger::SetLevelImpl(LoggerId logger_id, LogLevel level) noexcept {
  const std::scoped_lock lock(loggers_mutex_);
  if (const auto it = loggers_.find(logger_id); it != loggers_.end() && it->second) {
    it->second->level = level;
  }
}

bool Logger::HasLoggerImpl(LoggerId logger_id) const noexcept {
  const std::shared_lock lock(loggers_mutex_);
  return loggers_.contains(logger_id);
}

bool Logger::ShouldLogImpl(LoggerId logger_id, LogLevel level) const noexcept {
  const std::shared_lock lock(loggers_mutex_);
  if (const auto it = loggers_.find(logger_id); it != loggers_.end() && it->second) {
    return level >= it->second->level;
  }
  return false;
}

LogLevel Logger::GetLevelImpl(LoggerId logger_id) const noexcept {
  const std::shared_lock lock(loggers_mutex_);
  if (const auto it = loggers_.find(logger_id); it != loggers_.end() && it->second) {
    return it->second->level;
  }
  return LogLevel::kTrace;
}

auto Logger::CreateLoggerData(std::string_view name, LoggerConfig config) -> std::unique_ptr<LoggerData> {
  auto data = std::make_unique<LoggerData>(std::string(name), std::move(config));
  if (!data->config.enable_file) {
    return data;
  }

  const QString directory = QString::fromStdString(data->config.log_directory);
  if (!QDir().mkpath(directory)) {
    WriteToConsole(LogLevel::kWarn, std::format("Cannot create log directory '{}'", data->config.log_directory));
    return data;
  }

  const std::string filename = FormatLogFileName(name, data->config.file_name_pattern);
  data->file = std::make_unique<QFile>(directory + "/" + QString::fromStdString(filename));

  QIODevice::OpenMode mode = QIODevice::WriteOnly | QIODevice::Text;
  if (!data->config.truncate_files) {
    mode |= QIODevice::Append;
  }
  if (data->file->open(mode)) {
    data->file_stream = std::make_unique<QTextStream>(data->file.get());
  } else {
    WriteToConsole(LogLevel::kWarn, std::format("Cannot open log file '{}'", filename));
  }
  return data;
}

std::string Logger::FormatLogFileName(std::string_view logger_name, std::string_view pattern) {
  std::string result(pattern);

  if (const size_t pos = result.find("{name}"); pos != std::string::npos) {
    result.replace(pos, 6, logger_name);
  }

  if (const size_t pos = result.find("{timestamp}"); pos != std::string::npos) {
    const QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd_HH-mm-ss");
    result.replace(pos, 11, timestamp.toStdString());
  }

  return result;
}

std::string Logger::FormatLogMessage(const LoggerData& data, LogLevel level, const std::source_location& loc,
                                     std::string_view message) {
  const QString timestamp = QDateTime::currentDateTime().toString("HH:mm:ss.zzz");

  std::string result = std::format("[{}] [{}] {}: {}", timestamp.toStdString(), LogLevelToString(level), data.name,
                                   message);

  if (level >= data.config.source_location_level) {
    result.append(std::format(" [{}:{}]", details::GetFileName(loc.file_name()), loc.line()));
  }

  if (level >= data.config.stack_trace_level) {
    result.append(details::CaptureStackTrace());
  }

  return result;
}

void Logger::WriteToConsole(LogLevel level, std::string_view message) noexcept {
  switch (level) {
    case LogLevel::kTrace:
    case LogLevel::kDebug:
      qDebug().noquote() << ToQString(message);
      break;
    case LogLevel::kInfo:
      qInfo().noquote() << ToQString(message);
      break;
    case LogLevel::kWarn:
      qWarning().noquote() << ToQString(message);
      break;
    case LogLevel::kError:
    case LogLevel::kCritical:
      qCritical().noquote() << ToQString(message);
      break;
  }
}

void Logger::WriteToFile(LoggerData& data, std::string_view message, bool flush) noexcept {
  if (!data.file_stream) {
    return;
  }

  try {
    const QMutexLocker lock(&data.file_mutex);
    *data.file_stream << ToQString(message) << "\n";
    if (flush) {
      data.file_stream->flush();
    }
  } catch (...) {
    WriteToConsole(LogLevel::kError, "Failed to write log file");
  }
}

}  // namespace facemetrics
