#pragma once

#include <facemetrics/pch.hpp>

#include <algorithm>
#include <cmath>

namespace facemetrics {

/**
 * @brief 2D point used for landmarks, positions and rectangle corners.
 */
struct Point2D {
  float x = 0.0F;  ///< X coordinate.
  float y = 0.0F;  ///< Y coordinate.

  /**
   * @brief Calculates the Euclidean distance to another point.
   * @param other The other point.
   * @return Distance between points.
   */
  [[nodiscard]] float DistanceTo(Point2D other) const noexcept {
    const float dx = x - other.x;
    const float dy = y - other.y;
    return std::sqrt(dx * dx + dy * dy);
  }

  [[nodiscard]] constexpr bool operator==(const Point2D& other) const noexcept = default;

  [[nodiscard]] constexpr Point2D operator+(Point2D other) const noexcept { return {x + other.x, y + other.y}; }

  [[nodiscard]] constexpr Point2D operator-(Point2D other) const noexcept { return {x - other.x, y - other.y}; }

  [[nodiscard]] constexpr Point2D operator*(float scalar) const noexcept { return {x * scalar, y * scalar}; }

  [[nodiscard]] constexpr Point2D operator/(float scalar) const noexcept { return {x / scalar, y / scalar}; }
};

/**
 * @brief Axis-aligned rectangle stored as edges.
 * @details Used both for pixel boxes from the detector and for boxes normalized to [0, 1].
 */
struct Rect {
  float left = 0.0F;
  float top = 0.0F;
  float right = 0.0F;
  float bottom = 0.0F;

  /**
   * @brief Builds a rectangle from its center and size.
   */
  [[nodiscard]] static constexpr Rect FromCenter(Point2D center, float width, float height) noexcept {
    return {.left = center.x - width / 2.0F,
            .top = center.y - height / 2.0F,
            .right = center.x + width / 2.0F,
            .bottom = center.y + height / 2.0F};
  }

  [[nodiscard]] constexpr float Width() const noexcept { return right - left; }
  [[nodiscard]] constexpr float Height() const noexcept { return bottom - top; }

  [[nodiscard]] constexpr Point2D Center() const noexcept {
    return {.x = left + Width() / 2.0F, .y = top + Height() / 2.0F};
  }

  [[nodiscard]] constexpr Point2D TopLeft() const noexcept { return {.x = left, .y = top}; }
  [[nodiscard]] constexpr Point2D TopRight() const noexcept { return {.x = right, .y = top}; }
  [[nodiscard]] constexpr Point2D BottomLeft() const noexcept { return {.x = left, .y = bottom}; }
  [[nodiscard]] constexpr Point2D BottomRight() const noexcept { return {.x = right, .y = bottom}; }

  [[nodiscard]] constexpr float Area() const noexcept { return Width() * Height(); }

  /**
   * @brief Checks if the rectangle has positive width and height.
   */
  [[nodiscard]] constexpr bool Valid() const noexcept { return right > left && bottom > top; }

  /**
   * @brief Clamps every edge into [lo, hi].
   */
  [[nodiscard]] constexpr Rect Clamped(float lo = 0.0F, float hi = 1.0F) const noexcept {
    return {.left = std::clamp(left, lo, hi),
            .top = std::clamp(top, lo, hi),
            .right = std::clamp(right, lo, hi),
            .bottom = std::clamp(bottom, lo, hi)};
  }

  [[nodiscard]] constexpr bool operator==(const Rect& other) const noexcept = default;
};

}  // namespace facemetrics
