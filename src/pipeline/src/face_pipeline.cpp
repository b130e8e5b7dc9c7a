#include <facemetrics/pipeline/face_pipeline.hpp>

#include <facemetrics/pipeline/pipeline_logger.hpp>

#include <expected>
#include <memory>
#include <optional>
#include <utility>

namespace facemetrics {

auto FacePipeline::Create(const PipelineConfig& config) -> std::expected<std::unique_ptr<FacePipeline>, PipelineError> {
  EnsurePipelineLogger();

  if (const auto valid = config.Validate(); !valid) {
    FACEMETRICS_ERROR_LOGGER(kPipelineLogger, "Cannot create pipeline: {}", PipelineErrorToString(valid.error()));
    return std::unexpected(valid.error());
  }

  FACEMETRICS_INFO_LOGGER(kPipelineLogger, "Face pipeline created (smoothing window {})",
                          config.smoothing_window_size);
  return std::make_unique<FacePipeline>(PrivateTag{}, config);
}

FacePipeline::FacePipeline(PrivateTag /*tag*/, const PipelineConfig& config)
    : config_(config),
      extractor_(config.quality, config.classification),
      classifier_(config.status),
      range_estimator_(config.range),
      smoother_(config.smoothing_window_size, config.classification) {}

auto FacePipeline::ProcessFrame(const std::optional<RawDetection>& detection)
    -> std::expected<FrameResult, PipelineError> {
  const auto ticket = gate_.TryEnter();
  if (!ticket) {
    CountDropped();
    return std::unexpected(PipelineError::kFrameDropped);
  }
  return Process(detection);
}

std::optional<FrameGate::Ticket> FacePipeline::TryBeginFrame() noexcept {
  auto ticket = gate_.TryEnter();
  if (!ticket) {
    CountDropped();
  }
  return ticket;
}

auto FacePipeline::ProcessFrame(const FrameGate::Ticket& ticket, const std::optional<RawDetection>& detection)
    -> std::expected<FrameResult, PipelineError> {
  if (!gate_.Holds(ticket)) {
    FACEMETRICS_WARN_LOGGER(kPipelineLogger, "Frame rejected: ticket was not issued by this pipeline");
    frames_dropped_.fetch_add(1, std::memory_order_relaxed);
    return std::unexpected(PipelineError::kFrameDropped);
  }
  return Process(detection);
}

void FacePipeline::CountDropped() noexcept {
  frames_dropped_.fetch_add(1, std::memory_order_relaxed);
  FACEMETRICS_DEBUG_LOGGER(kPipelineLogger, "Frame dropped, previous frame still in flight");
}

auto FacePipeline::Process(const std::optional<RawDetection>& detection)
    -> std::expected<FrameResult, PipelineError> {
  FrameResult result;

  if (detection.has_value()) {
    auto metrics = extractor_.Extract(*detection);
    if (!metrics) {
      FACEMETRICS_WARN_LOGGER(kPipelineLogger, "Frame {} rejected: {}",
                              frames_processed_.load(std::memory_order_relaxed),
                              PipelineErrorToString(metrics.error()));
      return std::unexpected(metrics.error());
    }
    result.metrics = std::move(*metrics);
    result.range = range_estimator_.Estimate(*detection);
  } else {
    result.metrics = FaceMetrics::NoFace();
  }

  result.status = classifier_.Classify(result.metrics, result.range);
  result.smoothed = smoother_.Push(result.metrics);
  frames_processed_.fetch_add(1, std::memory_order_relaxed);

  FACEMETRICS_DEBUG_LOGGER(kPipelineLogger, "Frame {}: status={} quality={:.3f}",
                           frames_processed_.load(std::memory_order_relaxed),
                           DetectionStatusToString(result.status), result.smoothed.quality_score);
  return result;
}

OverlayGeometry FacePipeline::MapOverlay(const FaceMetrics& metrics) const {
  if (!metrics.HasFace()) {
    return {};
  }

  const OverlayTransform transform = mapper_.Snapshot();

  OverlayGeometry geometry;
  geometry.bounding_box = transform.MapRect(metrics.bounding_box);
  geometry.landmarks.reserve(metrics.landmarks.size());
  for (const auto& landmark : metrics.landmarks) {
    geometry.landmarks.push_back({.kind = landmark.kind, .position = transform.MapPoint(landmark.position)});
  }
  geometry.visible = true;
  return geometry;
}

void FacePipeline::Reset() noexcept {
  smoother_.Reset();
  FACEMETRICS_DEBUG_LOGGER(kPipelineLogger, "Smoothing history cleared");
}

}  // namespace facemetrics
