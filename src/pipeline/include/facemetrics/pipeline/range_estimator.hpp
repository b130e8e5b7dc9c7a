#pragma once

#include <facemetrics/pch.hpp>

#include <facemetrics/pipeline/pipeline_config.hpp>
#include <facemetrics/pipeline/raw_detection.hpp>

#include <optional>

namespace facemetrics {

/**
 * @brief Estimates a unitless distance from the camera out of the face box size.
 * @details range = scale * min(image_width, image_height) / max(box_width, box_height).
 * A face spanning the short image side reports `scale`; smaller faces report larger ranges.
 * With the default scale of 50 and thresholds of 50 and 150, a face is too close once it exceeds the short image
 * side and too far once it shrinks below a third of it.
 */
class RangeEstimator {
public:
  RangeEstimator() noexcept = default;
  explicit RangeEstimator(const RangeEstimatorConfig& config) noexcept : config_(config) {}

  /**
   * @brief Estimates the range of a detection.
   * @return The range, or nullopt for a degenerate box or image size.
   */
  [[nodiscard]] std::optional<float> Estimate(const RawDetection& detection) const noexcept;

  [[nodiscard]] const RangeEstimatorConfig& Config() const noexcept { return config_; }

private:
  RangeEstimatorConfig config_;
};

}  // namespace facemetrics
