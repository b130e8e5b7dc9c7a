#pragma once

#include <facemetrics/core/logger.hpp>

#include <string_view>

namespace facemetrics {

/**
 * @brief Logger used by the metrics pipeline.
 */
struct PipelineLogger {
  static constexpr std::string_view Name() noexcept { return "PIPELINE"; }

  static LoggerConfig Config() noexcept {
#if defined(FACEMETRICS_RELEASE_MODE)
    return LoggerConfig::Release();
#else
    return LoggerConfig::ConsoleOnly();
#endif
  }
};

inline constexpr PipelineLogger kPipelineLogger{};

/**
 * @brief Registers the pipeline logger once; safe to call repeatedly.
 */
inline void EnsurePipelineLogger() noexcept {
  auto& logger = Logger::GetInstance();
  if (!logger.HasLogger(kPipelineLogger)) {
    logger.AddLogger(kPipelineLogger);
  }
}

}  // namespace facemetrics
