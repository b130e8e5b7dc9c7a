#pragma once

#include <facemetrics/pch.hpp>

#include <facemetrics/pipeline/pipeline_error.hpp>

#include <cstddef>
#include <expected>

namespace facemetrics {

/**
 * @brief Top-level weights of the composite quality score. Must sum to 1.
 */
struct QualityWeights {
  float orientation = 0.4F;        ///< Head pose close to frontal.
  float eye_openness = 0.3F;       ///< Mean eye-open confidence.
  float smile_neutrality = 0.1F;   ///< Peaks at a neutral expression.
  float landmark_coverage = 0.2F;  ///< Fraction of expected landmarks present.

  [[nodiscard]] constexpr float Sum() const noexcept {
    return orientation + eye_openness + smile_neutrality + landmark_coverage;
  }

  [[nodiscard]] constexpr bool operator==(const QualityWeights& other) const noexcept = default;
};

/**
 * @brief Per-angle penalty weights of the orientation sub-score. Must sum to 1.
 */
struct OrientationWeights {
  float pitch = 0.4F;
  float roll = 0.3F;
  float yaw = 0.3F;

  [[nodiscard]] constexpr float Sum() const noexcept { return pitch + roll + yaw; }

  [[nodiscard]] constexpr bool operator==(const OrientationWeights& other) const noexcept = default;
};

/**
 * @brief Parameters of the quality scorer.
 */
struct QualityScorerConfig {
  QualityWeights weights;
  OrientationWeights orientation_weights;
  float orientation_limit_deg = 45.0F;  ///< Angle at which an axis contributes its full penalty.
  size_t full_landmark_count = 5;       ///< Landmark count that earns full coverage.

  [[nodiscard]] bool operator==(const QualityScorerConfig& other) const noexcept = default;
};

/**
 * @brief Thresholds turning probabilities into booleans.
 */
struct ClassificationThresholds {
  float smiling = 0.7F;           ///< is_smiling iff smile confidence is above this.
  float eyes_open = 0.5F;         ///< are_eyes_open iff mean eye-open confidence is above this.
  float glasses_eye_open = 0.5F;  ///< Both eyes must exceed this for the glasses heuristic.

  [[nodiscard]] constexpr bool operator==(const ClassificationThresholds& other) const noexcept = default;
};

/**
 * @brief Thresholds of the detection status classifier.
 * @details Range thresholds are calibrated against RangeEstimator's formula.
 */
struct StatusThresholds {
  float too_far_range = 150.0F;
  float too_close_range = 50.0F;
  float misaligned_angle_deg = 20.0F;

  [[nodiscard]] constexpr bool operator==(const StatusThresholds& other) const noexcept = default;
};

struct RangeEstimatorConfig {
  float scale = 50.0F;  ///< Range reported when the face spans the short image side.

  [[nodiscard]] constexpr bool operator==(const RangeEstimatorConfig& other) const noexcept = default;
};

/**
 * @brief Every calibration constant of the pipeline.
 */
struct PipelineConfig {
  size_t smoothing_window_size = 5;
  QualityScorerConfig quality;
  ClassificationThresholds classification;
  StatusThresholds status;
  RangeEstimatorConfig range;

  /**
   * @brief Checks the configuration for internal consistency.
   * @return Expected void on success, or PipelineError::kInvalidConfig.
   */
  [[nodiscard]] auto Validate() const -> std::expected<void, PipelineError>;

  [[nodiscard]] static PipelineConfig Default() noexcept { return {}; }

  [[nodiscard]] bool operator==(const PipelineConfig& other) const noexcept = default;
};

/// Tolerance used when checking that weight groups sum to one.
inline constexpr float kWeightSumTolerance = 1e-4F;

}  // namespace facemetrics
