#include <facemetrics/pipeline/metrics_formatter.hpp>

#include <cmath>
#include <format>
#include <string>
#include <string_view>
#include <vector>

namespace facemetrics {

namespace {

[[nodiscard]] constexpr std::string_view YesNo(bool value) noexcept {
  return value ? "Yes" : "No";
}

}  // namespace

std::vector<std::string> FormatMetricsPanel(const FaceMetrics& metrics, float canvas_width, float canvas_height) {
  if (!metrics.HasFace()) {
    return {std::string(DetectionStatusMessage(DetectionStatus::kNoFace))};
  }

  std::vector<std::string> lines;
  lines.reserve(11);

  lines.emplace_back("Position Metrics:");
  lines.push_back(std::format("Eye distance: {:.3f} of frame width", metrics.interpupillary_distance));
  lines.push_back(std::format("Face size: {}x{}px", std::lround(metrics.face_width * canvas_width),
                              std::lround(metrics.face_height * canvas_height)));
  lines.push_back(std::format("Center offset: X {:+.2f} Y {:+.2f}", metrics.face_position.x, metrics.face_position.y));

  lines.emplace_back("Quality Metrics:");
  lines.push_back(std::format("Quality: {:.2f}", metrics.quality_score));
  lines.push_back(std::format("Smiling: {} ({:.1f})", YesNo(metrics.is_smiling), metrics.smile_confidence));
  lines.push_back(std::format("Eyes: {}", metrics.are_eyes_open ? "Open" : "Closed"));
  lines.push_back(std::format("Glasses: {}", YesNo(metrics.has_glasses)));

  lines.emplace_back("Orientation Data:");
  lines.push_back(std::format("Pitch: {:.1f}° Roll: {:.1f}° Yaw: {:.1f}°", metrics.pitch, metrics.roll,
                              metrics.yaw));

  return lines;
}

}  // namespace facemetrics
