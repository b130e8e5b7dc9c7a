#include <facemetrics/pipeline/quality_scorer.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>

namespace facemetrics {

namespace {

[[nodiscard]] float AnglePenalty(float angle_deg, float limit_deg) noexcept {
  return std::min(std::abs(angle_deg) / limit_deg, 1.0F);
}

}  // namespace

float ProbabilityOrZero(const std::optional<float>& probability) noexcept {
  if (!probability.has_value() || std::isnan(*probability)) {
    return 0.0F;
  }
  return std::clamp(*probability, 0.0F, 1.0F);
}

float QualityScorer::Score(const RawDetection& detection) const noexcept {
  return Score(detection.landmarks.Count(), ProbabilityOrZero(detection.left_eye_open_prob),
               ProbabilityOrZero(detection.right_eye_open_prob), ProbabilityOrZero(detection.smile_prob),
               detection.pitch_deg, detection.roll_deg, detection.yaw_deg);
}

QualityBreakdown QualityScorer::Evaluate(size_t landmark_count, float left_eye_open, float right_eye_open, float smile,
                                         float pitch, float roll, float yaw) const noexcept {
  QualityBreakdown breakdown;
  breakdown.orientation = OrientationScore(pitch, roll, yaw);
  breakdown.eye_openness = EyeOpennessScore(left_eye_open, right_eye_open);
  breakdown.smile_neutrality = SmileNeutralityScore(smile);
  breakdown.landmark_coverage = LandmarkCoverageScore(landmark_count);

  const auto& weights = config_.weights;
  const float weighted = breakdown.orientation * weights.orientation + breakdown.eye_openness * weights.eye_openness +
                         breakdown.smile_neutrality * weights.smile_neutrality +
                         breakdown.landmark_coverage * weights.landmark_coverage;

  // NaN angles score 0
  breakdown.total = std::isnan(weighted) ? 0.0F : std::clamp(weighted, 0.0F, 1.0F);
  return breakdown;
}

float QualityScorer::OrientationScore(float pitch, float roll, float yaw) const noexcept {
  const auto& weights = config_.orientation_weights;
  const float limit = config_.orientation_limit_deg;
  const float penalty = AnglePenalty(pitch, limit) * weights.pitch + AnglePenalty(roll, limit) * weights.roll +
                        AnglePenalty(yaw, limit) * weights.yaw;
  return 1.0F - penalty;
}

float QualityScorer::SmileNeutralityScore(float smile) noexcept {
  return 1.0F - 2.0F * std::abs(smile - 0.5F);
}

float QualityScorer::LandmarkCoverageScore(size_t landmark_count) const noexcept {
  return std::min(1.0F, static_cast<float>(landmark_count) / static_cast<float>(config_.full_landmark_count));
}

}  // namespace facemetrics
