#pragma once

#include <facemetrics/pch.hpp>

#include <facemetrics/pipeline/pipeline_error.hpp>
#include <facemetrics/pipeline/raw_detection.hpp>

#include <opencv2/core.hpp>

#include <expected>
#include <vector>

namespace facemetrics {

/// Values per row of cv::FaceDetectorYN output.
inline constexpr int kYuNetRowSize = 15;

/**
 * @brief Options for converting YuNet output.
 */
struct YuNetAdapterConfig {
  float score_threshold = 0.5F;  ///< Rows scoring below this are skipped.
};

/**
 * @brief Converts cv::FaceDetectorYN output into raw detections.
 * @details Each row is [x, y, w, h, x_re, y_re, x_le, y_le, x_nt, y_nt, x_rcm, y_rcm, x_lcm, y_lcm, score] in
 * pixels. Boxes are clamped to the frame, the five landmarks are mapped to eyes, nose base and mouth corners, and
 * roll is estimated from the eye line. YuNet estimates neither pitch, yaw nor any probability, so those stay at
 * zero or absent.
 * @param faces Detector output, CV_32F with kYuNetRowSize columns. An empty matrix yields no detections.
 * @param image_width Frame width in pixels.
 * @param image_height Frame height in pixels.
 * @param config Conversion options.
 * @return Detections in row order, or PipelineError::kInvalidImageSize.
 */
[[nodiscard]] auto ConvertYuNetDetections(const cv::Mat& faces, int image_width, int image_height,
                                          const YuNetAdapterConfig& config = {})
    -> std::expected<std::vector<RawDetection>, PipelineError>;

/**
 * @brief Roll angle in degrees of the line from the right eye to the left eye, in image coordinates.
 */
[[nodiscard]] float EstimateRollFromEyes(Point2D right_eye, Point2D left_eye) noexcept;

}  // namespace facemetrics
