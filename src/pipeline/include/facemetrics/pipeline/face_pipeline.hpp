#pragma once

#include <facemetrics/pch.hpp>

#include <facemetrics/pipeline/detection_status.hpp>
#include <facemetrics/pipeline/face_metrics.hpp>
#include <facemetrics/pipeline/frame_gate.hpp>
#include <facemetrics/pipeline/geometry.hpp>
#include <facemetrics/pipeline/metrics_extractor.hpp>
#include <facemetrics/pipeline/overlay_mapper.hpp>
#include <facemetrics/pipeline/pipeline_config.hpp>
#include <facemetrics/pipeline/pipeline_error.hpp>
#include <facemetrics/pipeline/range_estimator.hpp>
#include <facemetrics/pipeline/raw_detection.hpp>
#include <facemetrics/pipeline/temporal_smoother.hpp>

#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace facemetrics {

/**
 * @brief Everything the pipeline produces for one frame.
 */
struct FrameResult {
  FaceMetrics metrics;                                ///< Raw per-frame metrics.
  FaceMetrics smoothed;                               ///< After temporal smoothing, used for rendering.
  DetectionStatus status = DetectionStatus::kNoFace;  ///< Classified from the raw metrics.
  std::optional<float> range;                         ///< Range estimate, absent without a face.
};

/**
 * @brief Overlay geometry in display space, normalized to [0, 1].
 */
struct OverlayGeometry {
  Rect bounding_box;
  std::vector<Landmark> landmarks;
  bool visible = false;  ///< False for the no-face sentinel: nothing to render.
};

/**
 * @brief Runs extraction, classification, smoothing and overlay mapping for a stream of frames.
 * @details Built from one validated PipelineConfig. Frames are processed one at a time: a frame arriving while
 * another is in flight is dropped with PipelineError::kFrameDropped. A frame source that runs the detector itself
 * can hold the gate across detection with TryBeginFrame. SetTransform and MapOverlay may be called from a render
 * thread.
 */
class FacePipeline {
private:
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

public:
  /// Use Create.
  FacePipeline(PrivateTag tag, const PipelineConfig& config);
  FacePipeline(const FacePipeline&) = delete;
  FacePipeline(FacePipeline&&) = delete;
  ~FacePipeline() noexcept = default;

  FacePipeline& operator=(const FacePipeline&) = delete;
  FacePipeline& operator=(FacePipeline&&) = delete;

  /**
   * @brief Creates a pipeline.
   * @param config Calibration constants.
   * @return The pipeline, or PipelineError::kInvalidConfig if the configuration does not validate.
   */
  [[nodiscard]] static auto Create(const PipelineConfig& config = PipelineConfig::Default())
      -> std::expected<std::unique_ptr<FacePipeline>, PipelineError>;

  /**
   * @brief Processes the detection of one frame.
   * @param detection The detection, or nullopt when the detector found no face.
   * @return The frame result, or an error. kInvalidImageSize leaves the smoothing history untouched.
   */
  [[nodiscard]] auto ProcessFrame(const std::optional<RawDetection>& detection)
      -> std::expected<FrameResult, PipelineError>;

  /**
   * @brief Admits a frame before its detection is available.
   * @details Frames arriving while the ticket is alive are dropped. A failed attempt counts as a dropped frame.
   * @return A ticket to pass to ProcessFrame, or nullopt if another frame is in flight.
   */
  [[nodiscard]] std::optional<FrameGate::Ticket> TryBeginFrame() noexcept;

  /**
   * @brief Processes the detection of a frame admitted by TryBeginFrame.
   * @param ticket Ticket returned by this pipeline's TryBeginFrame.
   * @param detection The detection, or nullopt when the detector found no face.
   * @return The frame result, or an error. A ticket from another gate is rejected with kFrameDropped.
   */
  [[nodiscard]] auto ProcessFrame(const FrameGate::Ticket& ticket, const std::optional<RawDetection>& detection)
      -> std::expected<FrameResult, PipelineError>;

  /**
   * @brief Processes all detections of one frame, keeping only the primary face.
   */
  [[nodiscard]] auto ProcessFrame(std::span<const RawDetection> detections)
      -> std::expected<FrameResult, PipelineError> {
    return ProcessFrame(SelectPrimaryDetection(detections));
  }

  /**
   * @brief Maps metrics into display space using one transform snapshot.
   * @return Empty, invisible geometry for the no-face sentinel.
   */
  [[nodiscard]] OverlayGeometry MapOverlay(const FaceMetrics& metrics) const;

  [[nodiscard]] auto SetTransform(bool mirrored, int rotation_degrees) -> std::expected<void, PipelineError> {
    return mapper_.SetTransform(mirrored, rotation_degrees);
  }

  /**
   * @brief Clears the smoothing history. Call from the frame-processing thread.
   */
  void Reset() noexcept;

  [[nodiscard]] const PipelineConfig& Config() const noexcept { return config_; }
  [[nodiscard]] const OverlayMapper& Mapper() const noexcept { return mapper_; }
  [[nodiscard]] bool Busy() const noexcept { return gate_.Busy(); }

  [[nodiscard]] uint64_t FramesProcessed() const noexcept {
    return frames_processed_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] uint64_t FramesDropped() const noexcept { return frames_dropped_.load(std::memory_order_relaxed); }

private:
  void CountDropped() noexcept;

  [[nodiscard]] auto Process(const std::optional<RawDetection>& detection)
      -> std::expected<FrameResult, PipelineError>;

  PipelineConfig config_;
  MetricsExtractor extractor_;
  DetectionStatusClassifier classifier_;
  RangeEstimator range_estimator_;
  TemporalSmoother smoother_;
  OverlayMapper mapper_;
  FrameGate gate_;

  std::atomic<uint64_t> frames_processed_{0};
  std::atomic<uint64_t> frames_dropped_{0};
};

}  // namespace facemetrics
