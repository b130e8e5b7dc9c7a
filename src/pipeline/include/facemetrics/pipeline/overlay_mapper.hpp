#pragma once

#include <facemetrics/pch.hpp>

#include <facemetrics/pipeline/geometry.hpp>
#include <facemetrics/pipeline/pipeline_error.hpp>

#include <opencv2/core.hpp>

#include <expected>
#include <shared_mutex>

namespace facemetrics {

/**
 * @brief Sensor rotation and mirroring applied to overlay geometry.
 */
struct TransformState {
  bool mirrored = false;
  int rotation_degrees = 0;  ///< One of 0, 90, 180, 270.

  [[nodiscard]] constexpr bool operator==(const TransformState& other) const noexcept = default;
};

/**
 * @brief Reduces any rotation into [0, 360).
 */
[[nodiscard]] constexpr int NormalizeRotation(int degrees) noexcept {
  return ((degrees % 360) + 360) % 360;
}

/**
 * @brief Immutable sensor-to-display transform over normalized coordinates.
 * @details The affine matrix is translate(+0.5) * rotate(-rotation) * mirror * translate(-0.5), so points rotate
 * about the frame center. Snapshots are plain values and can be handed to a render thread.
 */
class OverlayTransform {
public:
  /**
   * @brief Creates the identity transform.
   */
  OverlayTransform() noexcept : OverlayTransform(TransformState{}) {}

  /**
   * @brief Builds the transform for a state.
   * @warning The rotation must already be normalized and a multiple of 90.
   */
  explicit OverlayTransform(const TransformState& state) noexcept;

  [[nodiscard]] Point2D MapPoint(Point2D point) const noexcept;

  /**
   * @brief Maps all four corners and returns their axis-aligned bounds.
   */
  [[nodiscard]] Rect MapRect(const Rect& rect) const noexcept;

  /**
   * @brief Returns the transform that undoes this one.
   * @details Mirrored transforms are reflections and therefore their own inverse; pure rotations invert by rotating
   * the other way.
   */
  [[nodiscard]] OverlayTransform Inverse() const noexcept;

  [[nodiscard]] const TransformState& State() const noexcept { return state_; }
  [[nodiscard]] const cv::Matx33f& Matrix() const noexcept { return matrix_; }

private:
  TransformState state_;
  cv::Matx33f matrix_;
};

/**
 * @brief Scales a normalized rectangle to canvas pixels.
 */
[[nodiscard]] constexpr Rect ToPixels(const Rect& normalized, float canvas_width, float canvas_height) noexcept {
  return {.left = normalized.left * canvas_width,
          .top = normalized.top * canvas_height,
          .right = normalized.right * canvas_width,
          .bottom = normalized.bottom * canvas_height};
}

/**
 * @brief Holds the current overlay transform.
 * @details SetTransform is a rare configuration change that may come from another thread. Every mapping call works
 * on one snapshot, so an update never lands halfway through a rectangle.
 */
class OverlayMapper {
public:
  OverlayMapper() noexcept;
  OverlayMapper(const OverlayMapper&) = delete;
  OverlayMapper(OverlayMapper&&) = delete;
  ~OverlayMapper() noexcept = default;

  OverlayMapper& operator=(const OverlayMapper&) = delete;
  OverlayMapper& operator=(OverlayMapper&&) = delete;

  /**
   * @brief Updates mirroring and rotation.
   * @param mirrored Whether x is mirrored before rotating.
   * @param rotation_degrees Sensor rotation; normalized into [0, 360) first.
   * @return Expected void, or PipelineError::kInvalidRotation if the rotation is not a multiple of 90.
   * The previous transform is kept on failure.
   */
  [[nodiscard]] auto SetTransform(bool mirrored, int rotation_degrees) -> std::expected<void, PipelineError>;

  /**
   * @brief Returns the current transform as an immutable value.
   */
  [[nodiscard]] OverlayTransform Snapshot() const;

  [[nodiscard]] TransformState State() const { return Snapshot().State(); }

  [[nodiscard]] Point2D MapPoint(Point2D point) const { return Snapshot().MapPoint(point); }
  [[nodiscard]] Rect MapRect(const Rect& rect) const { return Snapshot().MapRect(rect); }

private:
  mutable std::shared_mutex mutex_;
  OverlayTransform transform_;
};

}  // namespace facemetrics
