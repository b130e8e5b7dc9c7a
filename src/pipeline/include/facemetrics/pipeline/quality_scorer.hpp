#pragma once

#include <facemetrics/pch.hpp>

#include <facemetrics/pipeline/pipeline_config.hpp>
#include <facemetrics/pipeline/raw_detection.hpp>

#include <cstddef>

namespace facemetrics {

/**
 * @brief The four sub-scores behind a quality score, each in [0, 1].
 */
struct QualityBreakdown {
  float orientation = 0.0F;
  float eye_openness = 0.0F;
  float smile_neutrality = 0.0F;
  float landmark_coverage = 0.0F;
  float total = 0.0F;  ///< Weighted sum, clamped to [0, 1].
};

/**
 * @brief Computes the composite [0, 1] quality of a detection.
 * @details Weighted sum of orientation, eye openness, smile neutrality and landmark coverage. Smile neutrality
 * rewards a neutral expression (confidence near 0.5) because it keeps the other metrics stable.
 */
class QualityScorer {
public:
  QualityScorer() noexcept = default;
  explicit QualityScorer(const QualityScorerConfig& config) noexcept : config_(config) {}

  /**
   * @brief Scores a detection using its probabilities, angles and landmark count.
   * @details Absent eye and smile probabilities count as 0.
   */
  [[nodiscard]] float Score(const RawDetection& detection) const noexcept;

  /**
   * @brief Scores explicit inputs.
   * @param landmark_count Number of landmarks present in the detection.
   * @param left_eye_open Left eye-open confidence in [0, 1].
   * @param right_eye_open Right eye-open confidence in [0, 1].
   * @param smile Smile confidence in [0, 1].
   * @param pitch Pitch in degrees.
   * @param roll Roll in degrees.
   * @param yaw Yaw in degrees.
   * @return Score in [0, 1].
   */
  [[nodiscard]] float Score(size_t landmark_count, float left_eye_open, float right_eye_open, float smile, float pitch,
                            float roll, float yaw) const noexcept {
    return Evaluate(landmark_count, left_eye_open, right_eye_open, smile, pitch, roll, yaw).total;
  }

  /**
   * @brief Same as Score, but also returns every sub-score.
   */
  [[nodiscard]] QualityBreakdown Evaluate(size_t landmark_count, float left_eye_open, float right_eye_open,
                                          float smile, float pitch, float roll, float yaw) const noexcept;

  /**
   * @brief 1 minus the weighted, clamped angle penalties.
   * @details Each axis contributes min(|angle| / limit, 1) times its weight.
   */
  [[nodiscard]] float OrientationScore(float pitch, float roll, float yaw) const noexcept;

  [[nodiscard]] static float EyeOpennessScore(float left_eye_open, float right_eye_open) noexcept {
    return (left_eye_open + right_eye_open) / 2.0F;
  }

  /**
   * @brief 1 at confidence 0.5, falling linearly to 0 at confidence 0 or 1.
   */
  [[nodiscard]] static float SmileNeutralityScore(float smile) noexcept;

  [[nodiscard]] float LandmarkCoverageScore(size_t landmark_count) const noexcept;

  [[nodiscard]] const QualityScorerConfig& Config() const noexcept { return config_; }

private:
  QualityScorerConfig config_;
};

/**
 * @brief Reads an optional detector probability, treating absent or NaN as 0 and clamping to [0, 1].
 */
[[nodiscard]] float ProbabilityOrZero(const std::optional<float>& probability) noexcept;

}  // namespace facemetrics
