#include <doctest/doctest.h>

#include <facemetrics/core/logger.hpp>

#include <QDir>
#include <QTemporaryDir>

#include <source_location>
#include <string_view>

namespace {

struct TestLogger {
  static constexpr std::string_view Name() noexcept { return "test_logger"; }
};

struct TestLoggerWithConfig {
  static constexpr std::string_view Name() noexcept { return "test_logger_with_config"; }
  static facemetrics::LoggerConfig Config() noexcept { return facemetrics::LoggerConfig::ConsoleOnly(); }
};

struct FileLogger {
  static constexpr std::string_view Name() noexcept { return "file_logger"; }
};

struct NotALogger {
  int value = 0;
};

}  // namespace

TEST_SUITE("facemetrics::Logger") {
  TEST_CASE("Logger::GetInstance: Default logger basic usage") {
    [[maybe_unused]] auto& logger = facemetrics::Logger::GetInstance();

    CHECK_NOTHROW(FACEMETRICS_TRACE("Trace message"));
    CHECK_NOTHROW(FACEMETRICS_DEBUG("Debug message"));
    CHECK_NOTHROW(FACEMETRICS_INFO("Info message"));
    CHECK_NOTHROW(FACEMETRICS_WARN("Warn message"));
    CHECK_NOTHROW(FACEMETRICS_ERROR("Error message"));
    CHECK_NOTHROW(FACEMETRICS_CRITICAL("Critical message"));

    CHECK_NOTHROW(FACEMETRICS_INFO("Formatted {}: {:.2f}", "quality", 0.985F));
  }

  TEST_CASE("Logger::GetInstance: Default logger is always registered") {
    const auto& logger = facemetrics::Logger::GetInstance();
    CHECK(logger.HasLogger(facemetrics::kDefaultLogger));
  }

  TEST_CASE("Logger::AddLogger: Typed logger and level control") {
    auto& logger = facemetrics::Logger::GetInstance();
    constexpr TestLogger test_logger{};

    CHECK_NOTHROW(logger.AddLogger(test_logger, facemetrics::LoggerConfig::ConsoleOnly()));
    CHECK(logger.HasLogger(test_logger));

    logger.SetLevel(test_logger, facemetrics::LogLevel::kWarn);
    CHECK_EQ(logger.GetLevel(test_logger), facemetrics::LogLevel::kWarn);

    CHECK_NOTHROW(FACEMETRICS_TRACE_LOGGER(test_logger, "Trace message"));
    CHECK_NOTHROW(FACEMETRICS_DEBUG_LOGGER(test_logger, "Debug message"));
    CHECK_NOTHROW(FACEMETRICS_INFO_LOGGER(test_logger, "Info message"));
    CHECK_NOTHROW(FACEMETRICS_WARN_LOGGER(test_logger, "Warn message"));
    CHECK_NOTHROW(FACEMETRICS_ERROR_LOGGER(test_logger, "Error message"));
    CHECK_NOTHROW(FACEMETRICS_CRITICAL_LOGGER(test_logger, "Critical {}", 42));

    logger.RemoveLogger(test_logger);
  }

  TEST_CASE("Logger::AddLogger: Uses the logger's own configuration") {
    auto& logger = facemetrics::Logger::GetInstance();
    constexpr TestLoggerWithConfig configured{};

    logger.AddLogger(configured);
    CHECK(logger.HasLogger(configured));
    CHECK_EQ(logger.GetLevel(configured), facemetrics::LoggerConfig::ConsoleOnly().min_level);

    logger.RemoveLogger(configured);
  }

  TEST_CASE("Logger::AddLogger: Registering twice keeps the first registration") {
    auto& logger = facemetrics::Logger::GetInstance();
    constexpr TestLogger test_logger{};

    logger.AddLogger(test_logger, facemetrics::LoggerConfig::ConsoleOnly());
    logger.SetLevel(test_logger, facemetrics::LogLevel::kError);
    logger.AddLogger(test_logger, facemetrics::LoggerConfig::ConsoleOnly());

    CHECK_EQ(logger.GetLevel(test_logger), facemetrics::LogLevel::kError);

    logger.RemoveLogger(test_logger);
  }

  TEST_CASE("Logger::ShouldLog: Level checks") {
    auto& logger = facemetrics::Logger::GetInstance();
    const auto previous = logger.GetLevel();

    logger.SetLevel(facemetrics::LogLevel::kWarn);

    CHECK_FALSE(logger.ShouldLog(facemetrics::LogLevel::kTrace));
    CHECK_FALSE(logger.ShouldLog(facemetrics::LogLevel::kDebug));
    CHECK_FALSE(logger.ShouldLog(facemetrics::LogLevel::kInfo));
    CHECK(logger.ShouldLog(facemetrics::LogLevel::kWarn));
    CHECK(logger.ShouldLog(facemetrics::LogLevel::kError));
    CHECK(logger.ShouldLog(facemetrics::LogLevel::kCritical));

    logger.SetLevel(previous);
  }

  TEST_CASE("Logger::ShouldLog: Unknown logger never logs") {
    const auto& logger = facemetrics::Logger::GetInstance();
    constexpr TestLogger unregistered{};

    CHECK_FALSE(logger.HasLogger(unregistered));
    CHECK_FALSE(logger.ShouldLog(unregistered, facemetrics::LogLevel::kCritical));
    CHECK_NOTHROW(FACEMETRICS_ERROR_LOGGER(unregistered, "Dropped"));
  }

  TEST_CASE("Logger::RemoveLogger: Default logger cannot be removed") {
    auto& logger = facemetrics::Logger::GetInstance();
    constexpr TestLogger temp_logger{};

    logger.AddLogger(temp_logger, facemetrics::LoggerConfig::ConsoleOnly());
    CHECK(logger.HasLogger(temp_logger));
    logger.RemoveLogger(temp_logger);
    CHECK_FALSE(logger.HasLogger(temp_logger));

    logger.RemoveLogger(facemetrics::kDefaultLogger);
    CHECK(logger.HasLogger(facemetrics::kDefaultLogger));
  }

  TEST_CASE("Logger::AddLogger: File output is created in the log directory") {
    QTemporaryDir temp_dir;
    REQUIRE(temp_dir.isValid());

    auto& logger = facemetrics::Logger::GetInstance();
    constexpr FileLogger file_logger{};

    facemetrics::LoggerConfig config = facemetrics::LoggerConfig::FileOnly();
    config.log_directory = temp_dir.filePath("logs").toStdString();
    logger.AddLogger(file_logger, config);
    REQUIRE(logger.HasLogger(file_logger));

    FACEMETRICS_WARN_LOGGER(file_logger, "Written to file");
    logger.Flush(file_logger);

    const QDir log_dir(temp_dir.filePath("logs"));
    CHECK(log_dir.exists());
    CHECK_FALSE(log_dir.entryList(QDir::Files).isEmpty());

    logger.RemoveLogger(file_logger);
  }

  TEST_CASE("Logger::LogAssertionFailure: Does not throw") {
    auto& logger = facemetrics::Logger::GetInstance();
    CHECK_NOTHROW(logger.LogAssertionFailure("x > 0", std::source_location::current(), "x was not positive"));
    CHECK_NOTHROW(logger.LogAssertionFailure("ptr != nullptr", std::source_location::current(), {}));
  }

  TEST_CASE("Logger::FlushAll: Does not throw") {
    CHECK_NOTHROW(facemetrics::Logger::GetInstance().FlushAll());
  }
}  // TEST_SUITE

TEST_SUITE("facemetrics::LoggerConfig") {
  TEST_CASE("LoggerConfig::ConsoleOnly: Configuration options") {
    const auto config = facemetrics::LoggerConfig::ConsoleOnly();
    CHECK(config.enable_console);
    CHECK_FALSE(config.enable_file);
  }

  TEST_CASE("LoggerConfig::FileOnly: Configuration options") {
    const auto config = facemetrics::LoggerConfig::FileOnly();
    CHECK_FALSE(config.enable_console);
    CHECK(config.enable_file);
  }

  TEST_CASE("LoggerConfig::Debug: Configuration options") {
    const auto config = facemetrics::LoggerConfig::Debug();
    CHECK(config.enable_console);
    CHECK(config.enable_file);
    CHECK_EQ(config.min_level, facemetrics::LogLevel::kTrace);
  }

  TEST_CASE("LoggerConfig::Release: Configuration options") {
    const auto config = facemetrics::LoggerConfig::Release();
    CHECK(config.enable_console);
    CHECK_FALSE(config.enable_file);
    CHECK_EQ(config.min_level, facemetrics::LogLevel::kInfo);
  }

  TEST_CASE("LogLevelToString: All levels") {
    CHECK_EQ(facemetrics::LogLevelToString(facemetrics::LogLevel::kTrace), "TRACE");
    CHECK_EQ(facemetrics::LogLevelToString(facemetrics::LogLevel::kDebug), "DEBUG");
    CHECK_EQ(facemetrics::LogLevelToString(facemetrics::LogLevel::kInfo), "INFO");
    CHECK_EQ(facemetrics::LogLevelToString(facemetrics::LogLevel::kWarn), "WARN");
    CHECK_EQ(facemetrics::LogLevelToString(facemetrics::LogLevel::kError), "ERROR");
    CHECK_EQ(facemetrics::LogLevelToString(facemetrics::LogLevel::kCritical), "CRITICAL");
  }

  TEST_CASE("LoggerTrait: Concept") {
    CHECK(facemetrics::LoggerTrait<TestLogger>);
    CHECK(facemetrics::LoggerTrait<TestLoggerWithConfig>);
    CHECK(facemetrics::LoggerTrait<facemetrics::DefaultLogger>);
    CHECK_FALSE(facemetrics::LoggerTrait<NotALogger>);
  }

  TEST_CASE("LoggerWithConfigTrait: Concept") {
    CHECK_FALSE(facemetrics::LoggerWithConfigTrait<TestLogger>);
    CHECK(facemetrics::LoggerWithConfigTrait<TestLoggerWithConfig>);
    CHECK(facemetrics::LoggerWithConfigTrait<facemetrics::DefaultLogger>);
  }

  TEST_CASE("LoggerIdOf: Distinct per type") {
    CHECK_NE(facemetrics::LoggerIdOf<TestLogger>(), facemetrics::LoggerIdOf<TestLoggerWithConfig>());
    CHECK_EQ(facemetrics::LoggerIdOf<TestLogger>(), facemetrics::LoggerIdOf<TestLogger>());
  }
}  // TEST_SUITE
