#include <facemetrics/pipeline/metrics_extractor.hpp>

#include <facemetrics/pipeline/geometry_normalizer.hpp>
#include <facemetrics/pipeline/pipeline_logger.hpp>

#include <expected>

namespace facemetrics {

bool EstimateGlasses(const LandmarkSet& landmarks, float left_eye_open, float right_eye_open,
                     const ClassificationThresholds& thresholds) noexcept {
  const bool ear_visible = landmarks.Has(LandmarkKind::kLeftEar) || landmarks.Has(LandmarkKind::kRightEar);
  return ear_visible && left_eye_open > thresholds.glasses_eye_open && right_eye_open > thresholds.glasses_eye_open;
}

MetricsExtractor::MetricsExtractor() noexcept {
  EnsurePipelineLogger();
}

MetricsExtractor::MetricsExtractor(const QualityScorerConfig& quality,
                                   const ClassificationThresholds& thresholds) noexcept
    : scorer_(quality), thresholds_(thresholds) {
  EnsurePipelineLogger();
}

auto MetricsExtractor::Extract(const RawDetection& detection) const -> std::expected<FaceMetrics, PipelineError> {
  const auto normalizer = GeometryNormalizer::Create(detection.image_width, detection.image_height);
  if (!normalizer) {
    return std::unexpected(normalizer.error());
  }

  const Rect& box_px = detection.bounding_box_px;

  FaceMetrics metrics;
  metrics.bounding_box = normalizer->NormalizeRect(box_px);
  metrics.face_width = metrics.bounding_box.Width();
  metrics.face_height = metrics.bounding_box.Height();
  metrics.face_position = normalizer->CenterOffset(box_px);

  const auto left_eye = detection.landmarks.Get(LandmarkKind::kLeftEye);
  const auto right_eye = detection.landmarks.Get(LandmarkKind::kRightEye);
  if (left_eye.has_value() && right_eye.has_value()) {
    metrics.interpupillary_distance = normalizer->WidthFraction(*left_eye, *right_eye);
  }

  metrics.pitch = detection.pitch_deg;
  metrics.roll = detection.roll_deg;
  metrics.yaw = detection.yaw_deg;

  metrics.smile_confidence = ProbabilityOrZero(detection.smile_prob);
  metrics.left_eye_open_confidence = ProbabilityOrZero(detection.left_eye_open_prob);
  metrics.right_eye_open_confidence = ProbabilityOrZero(detection.right_eye_open_prob);

  metrics.is_smiling = metrics.smile_confidence > thresholds_.smiling;
  metrics.are_eyes_open =
      (metrics.left_eye_open_confidence + metrics.right_eye_open_confidence) / 2.0F > thresholds_.eyes_open;
  metrics.has_glasses = EstimateGlasses(detection.landmarks, metrics.left_eye_open_confidence,
                                        metrics.right_eye_open_confidence, thresholds_);

  metrics.quality_score =
      scorer_.Score(detection.landmarks.Count(), metrics.left_eye_open_confidence, metrics.right_eye_open_confidence,
                    metrics.smile_confidence, metrics.pitch, metrics.roll, metrics.yaw);

  metrics.landmarks = normalizer->NormalizeLandmarks(detection.landmarks);

  metrics.detection_confidence =
      detection.tracking_id.has_value() ? kTrackedDetectionConfidence : kUntrackedDetectionConfidence;

  FACEMETRICS_TRACE_LOGGER(kPipelineLogger, "Extracted metrics: quality={:.3f} ipd={:.3f} landmarks={}",
                           metrics.quality_score, metrics.interpupillary_distance, metrics.landmarks.size());

  return metrics;
}

}  // namespace facemetrics
