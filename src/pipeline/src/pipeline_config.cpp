#include <facemetrics/pipeline/pipeline_config.hpp>

#include <facemetrics/pipeline/pipeline_logger.hpp>

#include <cmath>
#include <expected>
#include <initializer_list>

namespace facemetrics {

namespace {

[[nodiscard]] bool IsProbability(float value) noexcept {
  return std::isfinite(value) && value >= 0.0F && value <= 1.0F;
}

[[nodiscard]] bool AllNonNegative(std::initializer_list<float> values) noexcept {
  for (const float value : values) {
    if (!std::isfinite(value) || value < 0.0F) {
      return false;
    }
  }
  return true;
}

[[nodiscard]] bool SumsToOne(float sum) noexcept {
  return std::abs(sum - 1.0F) <= kWeightSumTolerance;
}

}  // namespace

auto PipelineConfig::Validate() const -> std::expected<void, PipelineError> {
  EnsurePipelineLogger();

  if (smoothing_window_size == 0) {
    FACEMETRICS_WARN_LOGGER(kPipelineLogger, "Smoothing window size must be at least 1");
    return std::unexpected(PipelineError::kInvalidConfig);
  }

  const auto& weights = quality.weights;
  if (!AllNonNegative({weights.orientation, weights.eye_openness, weights.smile_neutrality,
                       weights.landmark_coverage}) ||
      !SumsToOne(weights.Sum())) {
    FACEMETRICS_WARN_LOGGER(kPipelineLogger, "Quality weights must be non-negative and sum to 1 (sum = {:.4f})",
                            weights.Sum());
    return std::unexpected(PipelineError::kInvalidConfig);
  }

  const auto& angles = quality.orientation_weights;
  if (!AllNonNegative({angles.pitch, angles.roll, angles.yaw}) || !SumsToOne(angles.Sum())) {
    FACEMETRICS_WARN_LOGGER(kPipelineLogger, "Orientation weights must be non-negative and sum to 1 (sum = {:.4f})",
                            angles.Sum());
    return std::unexpected(PipelineError::kInvalidConfig);
  }

  if (!std::isfinite(quality.orientation_limit_deg) || quality.orientation_limit_deg <= 0.0F ||
      quality.full_landmark_count == 0) {
    FACEMETRICS_WARN_LOGGER(kPipelineLogger, "Orientation limit and full landmark count must be positive");
    return std::unexpected(PipelineError::kInvalidConfig);
  }

  if (!IsProbability(classification.smiling) || !IsProbability(classification.eyes_open) ||
      !IsProbability(classification.glasses_eye_open)) {
    FACEMETRICS_WARN_LOGGER(kPipelineLogger, "Classification thresholds must lie in [0, 1]");
    return std::unexpected(PipelineError::kInvalidConfig);
  }

  if (!AllNonNegative({status.too_far_range, status.too_close_range, status.misaligned_angle_deg}) ||
      status.too_close_range >= status.too_far_range) {
    FACEMETRICS_WARN_LOGGER(kPipelineLogger, "Status thresholds invalid: too_close {} must be below too_far {}",
                            status.too_close_range, status.too_far_range);
    return std::unexpected(PipelineError::kInvalidConfig);
  }

  if (!std::isfinite(range.scale) || range.scale <= 0.0F) {
    FACEMETRICS_WARN_LOGGER(kPipelineLogger, "Range scale must be positive");
    return std::unexpected(PipelineError::kInvalidConfig);
  }

  return {};
}

}  // namespace facemetrics
