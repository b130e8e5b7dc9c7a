#pragma once

#include <facemetrics/pch.hpp>

#include <facemetrics/pipeline/face_metrics.hpp>
#include <facemetrics/pipeline/pipeline_config.hpp>
#include <facemetrics/pipeline/pipeline_error.hpp>
#include <facemetrics/pipeline/quality_scorer.hpp>
#include <facemetrics/pipeline/raw_detection.hpp>

#include <expected>

namespace facemetrics {

/// detection_confidence reported for a face with a tracking id.
inline constexpr float kTrackedDetectionConfidence = 1.0F;

/// detection_confidence reported for a face without a tracking id.
inline constexpr float kUntrackedDetectionConfidence = 0.5F;

/**
 * @brief Builds one FaceMetrics record per frame from a raw detection.
 * @details Stateless. Missing probabilities and landmarks degrade to defaults; only an image size that would
 * divide by zero is rejected.
 */
class MetricsExtractor {
public:
  MetricsExtractor() noexcept;
  MetricsExtractor(const QualityScorerConfig& quality, const ClassificationThresholds& thresholds) noexcept;

  /**
   * @brief Extracts normalized metrics from a detection.
   * @param detection Detector output for one frame.
   * @return The metrics, or PipelineError::kInvalidImageSize if the image size is not positive.
   */
  [[nodiscard]] auto Extract(const RawDetection& detection) const -> std::expected<FaceMetrics, PipelineError>;

  [[nodiscard]] const QualityScorer& Scorer() const noexcept { return scorer_; }
  [[nodiscard]] const ClassificationThresholds& Thresholds() const noexcept { return thresholds_; }

private:
  QualityScorer scorer_;
  ClassificationThresholds thresholds_;
};

/**
 * @brief Glasses heuristic: an ear is visible and both eyes are confidently open.
 * @note A coarse proxy, not a trained classifier.
 */
[[nodiscard]] bool EstimateGlasses(const LandmarkSet& landmarks, float left_eye_open, float right_eye_open,
                                   const ClassificationThresholds& thresholds) noexcept;

}  // namespace facemetrics
