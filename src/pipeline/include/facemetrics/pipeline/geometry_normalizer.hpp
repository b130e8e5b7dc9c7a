#pragma once

#include <facemetrics/pch.hpp>

#include <facemetrics/pipeline/face_metrics.hpp>
#include <facemetrics/pipeline/geometry.hpp>
#include <facemetrics/pipeline/pipeline_error.hpp>
#include <facemetrics/pipeline/raw_detection.hpp>

#include <expected>
#include <vector>

namespace facemetrics {

/**
 * @brief Converts pixel geometry into resolution-independent coordinates.
 * @details Performs no rotation handling: the image size must already be rotation-corrected.
 */
class GeometryNormalizer {
public:
  /**
   * @brief Creates a normalizer for a frame of the given size.
   * @param image_width Frame width in pixels.
   * @param image_height Frame height in pixels.
   * @return The normalizer, or PipelineError::kInvalidImageSize if either dimension is not positive.
   */
  [[nodiscard]] static auto Create(int image_width, int image_height) -> std::expected<GeometryNormalizer, PipelineError>;

  /**
   * @brief Divides x by the image width and y by the image height.
   */
  [[nodiscard]] constexpr Point2D NormalizePoint(Point2D point_px) const noexcept {
    return {.x = point_px.x / width_, .y = point_px.y / height_};
  }

  [[nodiscard]] constexpr Rect NormalizeRect(const Rect& rect_px) const noexcept {
    return {.left = rect_px.left / width_,
            .top = rect_px.top / height_,
            .right = rect_px.right / width_,
            .bottom = rect_px.bottom / height_};
  }

  /**
   * @brief Center of a pixel rectangle as an offset from the image center.
   * @return Offset in [-0.5, 0.5] on both axes for boxes inside the frame.
   */
  [[nodiscard]] constexpr Point2D CenterOffset(const Rect& rect_px) const noexcept {
    const Point2D center = NormalizePoint(rect_px.Center());
    return {.x = center.x - 0.5F, .y = center.y - 0.5F};
  }

  /**
   * @brief Distance between two pixel points as a fraction of image width.
   */
  [[nodiscard]] float WidthFraction(Point2D a_px, Point2D b_px) const noexcept { return a_px.DistanceTo(b_px) / width_; }

  /**
   * @brief Normalizes the landmarks that are present, in LandmarkKind order.
   */
  [[nodiscard]] std::vector<Landmark> NormalizeLandmarks(const LandmarkSet& landmarks) const;

  [[nodiscard]] constexpr float ImageWidth() const noexcept { return width_; }
  [[nodiscard]] constexpr float ImageHeight() const noexcept { return height_; }

private:
  constexpr GeometryNormalizer(float width, float height) noexcept : width_(width), height_(height) {}

  float width_ = 1.0F;
  float height_ = 1.0F;
};

}  // namespace facemetrics
