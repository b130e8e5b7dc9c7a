#include <facemetrics/pipeline/yunet_adapter.hpp>

#include <facemetrics/pipeline/pipeline_logger.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <expected>
#include <numbers>
#include <optional>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>

namespace facemetrics {

namespace {

[[nodiscard]] Point2D PointAt(const cv::Mat& faces, int row, int column) {
  return {.x = faces.at<float>(row, column), .y = faces.at<float>(row, column + 1)};
}

[[nodiscard]] std::optional<RawDetection> ConvertRow(const cv::Mat& faces, int row, float image_width,
                                                     float image_height, const YuNetAdapterConfig& config) {
  const float x = faces.at<float>(row, 0);
  const float y = faces.at<float>(row, 1);
  const float w = faces.at<float>(row, 2);
  const float h = faces.at<float>(row, 3);
  const float score = faces.at<float>(row, 14);

  if (score < config.score_threshold || w <= 0.0F || h <= 0.0F) {
    return std::nullopt;
  }

  const Rect box{.left = std::clamp(x, 0.0F, image_width),
                 .top = std::clamp(y, 0.0F, image_height),
                 .right = std::clamp(x + w, 0.0F, image_width),
                 .bottom = std::clamp(y + h, 0.0F, image_height)};
  if (!box.Valid()) {
    return std::nullopt;
  }

  RawDetection detection;
  detection.bounding_box_px = box;
  detection.image_width = static_cast<int>(image_width);
  detection.image_height = static_cast<int>(image_height);

  const Point2D right_eye = PointAt(faces, row, 4);
  const Point2D left_eye = PointAt(faces, row, 6);
  detection.landmarks.Set(LandmarkKind::kRightEye, right_eye);
  detection.landmarks.Set(LandmarkKind::kLeftEye, left_eye);
  detection.landmarks.Set(LandmarkKind::kNoseBase, PointAt(faces, row, 8));
  detection.landmarks.Set(LandmarkKind::kMouthRight, PointAt(faces, row, 10));
  detection.landmarks.Set(LandmarkKind::kMouthLeft, PointAt(faces, row, 12));

  detection.roll_deg = EstimateRollFromEyes(right_eye, left_eye);
  return detection;
}

}  // namespace

float EstimateRollFromEyes(Point2D right_eye, Point2D left_eye) noexcept {
  const float dx = left_eye.x - right_eye.x;
  const float dy = left_eye.y - right_eye.y;
  return std::atan2(dy, dx) * 180.0F / std::numbers::pi_v<float>;
}

auto ConvertYuNetDetections(const cv::Mat& faces, int image_width, int image_height, const YuNetAdapterConfig& config)
    -> std::expected<std::vector<RawDetection>, PipelineError> {
  EnsurePipelineLogger();

  if (image_width <= 0 || image_height <= 0) {
    FACEMETRICS_WARN_LOGGER(kPipelineLogger, "Rejected YuNet output for image size {}x{}", image_width,
                            image_height);
    return std::unexpected(PipelineError::kInvalidImageSize);
  }

  std::vector<RawDetection> detections;
  if (faces.empty()) {
    return detections;
  }

  if (faces.type() != CV_32F || faces.cols < kYuNetRowSize) {
    FACEMETRICS_WARN_LOGGER(kPipelineLogger, "Unexpected YuNet output: type={} rows={} cols={}", faces.type(),
                            faces.rows, faces.cols);
    return detections;
  }

  detections.reserve(static_cast<size_t>(faces.rows));
  for (int row = 0; row < faces.rows; ++row) {
    if (auto detection = ConvertRow(faces, row, static_cast<float>(image_width), static_cast<float>(image_height),
                                    config)) {
      detections.push_back(std::move(*detection));
    }
  }

  FACEMETRICS_TRACE_LOGGER(kPipelineLogger, "YuNet: {} of {} rows kept", detections.size(), faces.rows);
  return detections;
}

}  // namespace facemetrics
