#pragma once

#include <facemetrics/pch.hpp>

#include <facemetrics/pipeline/detection_status.hpp>
#include <facemetrics/pipeline/face_metrics.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace facemetrics {

/**
 * @brief User-facing prompt for a detection status.
 * @return The prompt, or an empty string when no prompt is needed.
 */
[[nodiscard]] constexpr std::string_view DetectionStatusMessage(DetectionStatus status) noexcept {
  switch (status) {
    case DetectionStatus::kNoFace:
      return "No face detected";
    case DetectionStatus::kTooFar:
      return "Face too far, please move closer";
    case DetectionStatus::kTooClose:
      return "Face too close, please move back";
    case DetectionStatus::kMisaligned:
      return "Please align your face with the camera";
    case DetectionStatus::kDetected:
      return "";
  }
  return "";
}

/**
 * @brief Renders metrics as the text lines of the position, quality and orientation panels.
 * @details Interpupillary distance is reported as a fraction of frame width: it is not calibrated to a physical
 * unit. The no-face sentinel renders as a single "No face detected" line.
 * @param metrics Metrics to render, usually the smoothed record.
 * @param canvas_width Canvas width in pixels, used for the face size.
 * @param canvas_height Canvas height in pixels, used for the face size.
 */
[[nodiscard]] std::vector<std::string> FormatMetricsPanel(const FaceMetrics& metrics, float canvas_width,
                                                          float canvas_height);

}  // namespace facemetrics
