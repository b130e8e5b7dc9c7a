#include <facemetrics/pipeline/detection_status.hpp>

#include <cmath>
#include <optional>

namespace facemetrics {

DetectionStatus DetectionStatusClassifier::Classify(const FaceMetrics& metrics,
                                                    std::optional<float> range) const noexcept {
  if (!metrics.HasFace()) {
    return DetectionStatus::kNoFace;
  }

  if (range.has_value()) {
    if (*range > thresholds_.too_far_range) {
      return DetectionStatus::kTooFar;
    }
    if (*range < thresholds_.too_close_range) {
      return DetectionStatus::kTooClose;
    }
  }

  if (IsMisaligned(metrics.pitch, metrics.roll, metrics.yaw)) {
    return DetectionStatus::kMisaligned;
  }

  return DetectionStatus::kDetected;
}

bool DetectionStatusClassifier::IsMisaligned(float pitch, float roll, float yaw) const noexcept {
  const float limit = thresholds_.misaligned_angle_deg;
  return std::abs(pitch) > limit || std::abs(roll) > limit || std::abs(yaw) > limit;
}

}  // namespace facemetrics
