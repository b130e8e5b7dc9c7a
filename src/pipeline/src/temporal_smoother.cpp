#include <facemetrics/pipeline/temporal_smoother.hpp>

#include <facemetrics/pipeline/pipeline_logger.hpp>

#include <algorithm>
#include <cstddef>

namespace facemetrics {

namespace {

// Sums in double so that the mean of identical floats is exact.
struct MetricsAccumulator {
  double interpupillary_distance = 0.0;
  double face_width = 0.0;
  double face_height = 0.0;
  double position_x = 0.0;
  double position_y = 0.0;
  double pitch = 0.0;
  double roll = 0.0;
  double yaw = 0.0;
  double quality_score = 0.0;
  double smile_confidence = 0.0;
  double left_eye_open_confidence = 0.0;
  double right_eye_open_confidence = 0.0;
  double box_left = 0.0;
  double box_top = 0.0;
  double box_right = 0.0;
  double box_bottom = 0.0;
  size_t count = 0;

  void Add(const FaceMetrics& metrics) noexcept {
    interpupillary_distance += metrics.interpupillary_distance;
    face_width += metrics.face_width;
    face_height += metrics.face_height;
    position_x += metrics.face_position.x;
    position_y += metrics.face_position.y;
    pitch += metrics.pitch;
    roll += metrics.roll;
    yaw += metrics.yaw;
    quality_score += metrics.quality_score;
    smile_confidence += metrics.smile_confidence;
    left_eye_open_confidence += metrics.left_eye_open_confidence;
    right_eye_open_confidence += metrics.right_eye_open_confidence;
    box_left += metrics.bounding_box.left;
    box_top += metrics.bounding_box.top;
    box_right += metrics.bounding_box.right;
    box_bottom += metrics.bounding_box.bottom;
    ++count;
  }

  [[nodiscard]] double MeanOf(double sum) const noexcept { return sum / static_cast<double>(count); }
  [[nodiscard]] float Mean(double sum) const noexcept { return static_cast<float>(MeanOf(sum)); }
};

// Mean edges equal the averaged center +- averaged size / 2, since width and height are the box extents.
[[nodiscard]] Rect BlendWithMean(const Rect& newest, const MetricsAccumulator& sum, double newest_weight) noexcept {
  const double averaged_weight = 1.0 - newest_weight;
  const auto blend = [&](float edge, double edge_sum) {
    return static_cast<float>(static_cast<double>(edge) * newest_weight + sum.MeanOf(edge_sum) * averaged_weight);
  };
  return {.left = blend(newest.left, sum.box_left),
          .top = blend(newest.top, sum.box_top),
          .right = blend(newest.right, sum.box_right),
          .bottom = blend(newest.bottom, sum.box_bottom)};
}

}  // namespace

TemporalSmoother::TemporalSmoother(size_t window_size, const ClassificationThresholds& thresholds) noexcept
    : capacity_(std::max<size_t>(window_size, 1)), thresholds_(thresholds) {
  EnsurePipelineLogger();
  FACEMETRICS_ASSERT(window_size > 0, "Smoothing window must hold at least one frame");
}

FaceMetrics TemporalSmoother::Push(const FaceMetrics& metrics) {
  history_.push_back(metrics);
  while (history_.size() > capacity_) {
    history_.pop_front();
  }

  if (!metrics.HasFace() || ValidCount() < 2) {
    return metrics;
  }
  return Smooth();
}

size_t TemporalSmoother::ValidCount() const noexcept {
  return static_cast<size_t>(
      std::ranges::count_if(history_, [](const FaceMetrics& metrics) { return metrics.HasFace(); }));
}

FaceMetrics TemporalSmoother::Smooth() const {
  MetricsAccumulator sum;
  for (const auto& frame : history_) {
    if (frame.HasFace()) {
      sum.Add(frame);
    }
  }

  FACEMETRICS_INVARIANT(sum.count >= 2);

  const FaceMetrics& newest = history_.back();

  FaceMetrics smoothed;
  smoothed.interpupillary_distance = sum.Mean(sum.interpupillary_distance);
  smoothed.face_width = sum.Mean(sum.face_width);
  smoothed.face_height = sum.Mean(sum.face_height);
  smoothed.face_position = {.x = sum.Mean(sum.position_x), .y = sum.Mean(sum.position_y)};
  smoothed.pitch = sum.Mean(sum.pitch);
  smoothed.roll = sum.Mean(sum.roll);
  smoothed.yaw = sum.Mean(sum.yaw);
  smoothed.quality_score = sum.Mean(sum.quality_score);
  smoothed.smile_confidence = sum.Mean(sum.smile_confidence);
  smoothed.left_eye_open_confidence = sum.Mean(sum.left_eye_open_confidence);
  smoothed.right_eye_open_confidence = sum.Mean(sum.right_eye_open_confidence);

  smoothed.bounding_box = BlendWithMean(newest.bounding_box, sum, kNewestBoxWeight).Clamped();

  smoothed.is_smiling = smoothed.smile_confidence > thresholds_.smiling;
  smoothed.are_eyes_open =
      (smoothed.left_eye_open_confidence + smoothed.right_eye_open_confidence) / 2.0F > thresholds_.eyes_open;

  smoothed.has_glasses = newest.has_glasses;
  smoothed.landmarks = newest.landmarks;
  smoothed.detection_confidence = newest.detection_confidence;

  FACEMETRICS_TRACE_LOGGER(kPipelineLogger, "Smoothed {} of {} frames", sum.count, history_.size());

  return smoothed;
}

}  // namespace facemetrics
