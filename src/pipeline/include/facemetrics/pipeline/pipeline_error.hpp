#pragma once

#include <facemetrics/pch.hpp>

#include <cstdint>
#include <string_view>

namespace facemetrics {

/**
 * @brief Error codes for pipeline operations.
 */
enum class PipelineError : uint8_t {
  kInvalidImageSize,  ///< Image width or height is not positive.
  kInvalidRotation,   ///< Rotation is not a multiple of 90 degrees.
  kInvalidConfig,     ///< Configuration failed validation.
  kFrameDropped,      ///< Another frame is still being processed.
};

/**
 * @brief Converts PipelineError to a human-readable string.
 * @param error The error to convert.
 * @return A string view representing the error.
 */
[[nodiscard]] constexpr std::string_view PipelineErrorToString(PipelineError error) noexcept {
  switch (error) {
    case PipelineError::kInvalidImageSize:
      return "Image width and height must be positive";
    case PipelineError::kInvalidRotation:
      return "Rotation must be a multiple of 90 degrees";
    case PipelineError::kInvalidConfig:
      return "Invalid pipeline configuration";
    case PipelineError::kFrameDropped:
      return "Frame dropped while another frame is in flight";
  }
  return "Unknown error";
}

/**
 * @brief Checks if the error reports a caller bug rather than a runtime condition.
 * @details Contract violations indicate an upstream collaborator passed invalid input; retrying cannot succeed.
 */
[[nodiscard]] constexpr bool IsContractViolation(PipelineError error) noexcept {
  switch (error) {
    case PipelineError::kInvalidImageSize:
    case PipelineError::kInvalidRotation:
    case PipelineError::kInvalidConfig:
      return true;
    case PipelineError::kFrameDropped:
      return false;
  }
  return false;
}

}  // namespace facemetrics
