#pragma once

#include <facemetrics/pch.hpp>

#include <facemetrics/pipeline/face_metrics.hpp>
#include <facemetrics/pipeline/pipeline_config.hpp>

#include <cstddef>
#include <deque>

namespace facemetrics {

/// Weight of the newest raw box in the smoothed box; the averaged box gets the rest.
inline constexpr float kNewestBoxWeight = 0.7F;

/**
 * @brief Damps frame-to-frame jitter over a bounded window of recent metrics.
 * @details Keeps copies of the last `window_size` records (FIFO). Continuous fields are averaged over the valid
 * frames in the window, the box is blended towards the newest frame, booleans are recomputed from the averaged
 * confidences, and discrete fields (glasses, landmarks, detection confidence) come from the newest frame.
 * Not thread-safe: confine to the frame-processing thread.
 */
class TemporalSmoother {
public:
  /**
   * @brief Constructs a smoother.
   * @param window_size Number of frames kept, at least 1.
   * @param thresholds Thresholds used to recompute is_smiling and are_eyes_open.
   */
  explicit TemporalSmoother(size_t window_size = 5, const ClassificationThresholds& thresholds = {}) noexcept;

  /**
   * @brief Records a frame and returns the current smoothed estimate.
   * @details The frame is returned unchanged when it is the no-face sentinel or when fewer than two valid frames
   * are in the window.
   * @param metrics Metrics of the newest frame.
   * @return Smoothed metrics.
   */
  [[nodiscard]] FaceMetrics Push(const FaceMetrics& metrics);

  /**
   * @brief Drops the whole history.
   */
  void Reset() noexcept { history_.clear(); }

  [[nodiscard]] size_t Size() const noexcept { return history_.size(); }
  [[nodiscard]] size_t Capacity() const noexcept { return capacity_; }

  /**
   * @brief Number of frames in the window with a detected face.
   */
  [[nodiscard]] size_t ValidCount() const noexcept;

private:
  [[nodiscard]] FaceMetrics Smooth() const;

  std::deque<FaceMetrics> history_;
  size_t capacity_ = 5;
  ClassificationThresholds thresholds_;
};

}  // namespace facemetrics
