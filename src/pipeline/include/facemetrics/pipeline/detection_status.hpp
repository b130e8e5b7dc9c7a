#pragma once

#include <facemetrics/pch.hpp>

#include <facemetrics/pipeline/face_metrics.hpp>
#include <facemetrics/pipeline/pipeline_config.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace facemetrics {

/**
 * @brief Operational state derived from one metrics record.
 */
enum class DetectionStatus : uint8_t {
  kNoFace,
  kDetected,
  kTooFar,
  kTooClose,
  kMisaligned,
};

[[nodiscard]] constexpr std::string_view DetectionStatusToString(DetectionStatus status) noexcept {
  switch (status) {
    case DetectionStatus::kNoFace:
      return "NoFace";
    case DetectionStatus::kDetected:
      return "Detected";
    case DetectionStatus::kTooFar:
      return "TooFar";
    case DetectionStatus::kTooClose:
      return "TooClose";
    case DetectionStatus::kMisaligned:
      return "Misaligned";
  }
  return "Unknown";
}

/**
 * @brief Threshold rules mapping metrics to a DetectionStatus.
 * @details Rules are checked in order and the first match wins:
 * no face, too far, too close, misaligned, detected.
 * The range rules are skipped when no range estimate is available.
 */
class DetectionStatusClassifier {
public:
  DetectionStatusClassifier() noexcept = default;
  explicit DetectionStatusClassifier(const StatusThresholds& thresholds) noexcept : thresholds_(thresholds) {}

  /**
   * @brief Classifies a metrics record.
   * @param metrics Per-frame metrics.
   * @param range Range estimate for the same frame, if any.
   */
  [[nodiscard]] DetectionStatus Classify(const FaceMetrics& metrics,
                                         std::optional<float> range = std::nullopt) const noexcept;

  /**
   * @brief Checks if any head angle exceeds the misalignment threshold.
   */
  [[nodiscard]] bool IsMisaligned(float pitch, float roll, float yaw) const noexcept;

  [[nodiscard]] const StatusThresholds& Thresholds() const noexcept { return thresholds_; }

private:
  StatusThresholds thresholds_;
};

}  // namespace facemetrics
