#pragma once

#include <facemetrics/pch.hpp>

#include <facemetrics/pipeline/geometry.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace facemetrics {

/**
 * @brief Anatomical points reported by the face-landmark detector.
 */
enum class LandmarkKind : uint8_t {
  kLeftEye = 0,
  kRightEye,
  kLeftEar,
  kRightEar,
  kLeftCheek,
  kRightCheek,
  kNoseBase,
  kMouthLeft,
  kMouthRight,
  kMouthBottom,
};

inline constexpr size_t kLandmarkKindCount = 10;

inline constexpr std::array<LandmarkKind, kLandmarkKindCount> kAllLandmarkKinds = {
    LandmarkKind::kLeftEye,   LandmarkKind::kRightEye,   LandmarkKind::kLeftEar,   LandmarkKind::kRightEar,
    LandmarkKind::kLeftCheek, LandmarkKind::kRightCheek, LandmarkKind::kNoseBase,  LandmarkKind::kMouthLeft,
    LandmarkKind::kMouthRight, LandmarkKind::kMouthBottom,
};

[[nodiscard]] constexpr std::string_view LandmarkKindToString(LandmarkKind kind) noexcept {
  switch (kind) {
    case LandmarkKind::kLeftEye:
      return "LeftEye";
    case LandmarkKind::kRightEye:
      return "RightEye";
    case LandmarkKind::kLeftEar:
      return "LeftEar";
    case LandmarkKind::kRightEar:
      return "RightEar";
    case LandmarkKind::kLeftCheek:
      return "LeftCheek";
    case LandmarkKind::kRightCheek:
      return "RightCheek";
    case LandmarkKind::kNoseBase:
      return "NoseBase";
    case LandmarkKind::kMouthLeft:
      return "MouthLeft";
    case LandmarkKind::kMouthRight:
      return "MouthRight";
    case LandmarkKind::kMouthBottom:
      return "MouthBottom";
  }
  return "Unknown";
}

/**
 * @brief Optional landmark positions indexed by LandmarkKind.
 */
class LandmarkSet {
public:
  constexpr LandmarkSet() noexcept = default;

  constexpr void Set(LandmarkKind kind, Point2D position) noexcept { points_[Index(kind)] = position; }
  constexpr void Clear(LandmarkKind kind) noexcept { points_[Index(kind)].reset(); }

  [[nodiscard]] constexpr std::optional<Point2D> Get(LandmarkKind kind) const noexcept { return points_[Index(kind)]; }
  [[nodiscard]] constexpr bool Has(LandmarkKind kind) const noexcept { return points_[Index(kind)].has_value(); }

  /**
   * @brief Number of landmarks that are present.
   */
  [[nodiscard]] constexpr size_t Count() const noexcept {
    size_t count = 0;
    for (const auto& point : points_) {
      if (point.has_value()) {
        ++count;
      }
    }
    return count;
  }

  [[nodiscard]] constexpr bool Empty() const noexcept { return Count() == 0; }

  [[nodiscard]] constexpr bool operator==(const LandmarkSet& other) const noexcept = default;

private:
  [[nodiscard]] static constexpr size_t Index(LandmarkKind kind) noexcept { return static_cast<size_t>(kind); }

  std::array<std::optional<Point2D>, kLandmarkKindCount> points_{};
};

/**
 * @brief One detector output for a single frame.
 * @details Pixel geometry is relative to the rotation-corrected frame: when the sensor is rotated by 90 or 270
 * degrees the caller swaps width and height before filling image_width/image_height.
 */
struct RawDetection {
  Rect bounding_box_px;  ///< Face box in source-image pixels.
  int image_width = 0;   ///< Frame width in pixels.
  int image_height = 0;  ///< Frame height in pixels.

  float pitch_deg = 0.0F;  ///< Positive = head down.
  float roll_deg = 0.0F;   ///< Positive = tilt to the viewer's right.
  float yaw_deg = 0.0F;    ///< Positive = turn to the viewer's right.

  LandmarkSet landmarks;

  std::optional<float> left_eye_open_prob;
  std::optional<float> right_eye_open_prob;
  std::optional<float> smile_prob;

  std::optional<uint32_t> tracking_id;

  [[nodiscard]] bool operator==(const RawDetection& other) const noexcept = default;
};

/**
 * @brief Picks the face to report when the detector returns several.
 * @details The detection with the largest tracking id wins; untracked detections rank below tracked ones and ties
 * keep the earliest entry.
 * @param detections All detections of one frame.
 * @return The primary detection, or nullopt if there are none.
 */
[[nodiscard]] constexpr auto SelectPrimaryDetection(std::span<const RawDetection> detections) noexcept
    -> std::optional<RawDetection> {
  if (detections.empty()) {
    return std::nullopt;
  }

  const RawDetection* best = &detections.front();
  for (const auto& detection : detections) {
    if (!detection.tracking_id.has_value()) {
      continue;
    }
    if (!best->tracking_id.has_value() || *detection.tracking_id > *best->tracking_id) {
      best = &detection;
    }
  }
  return *best;
}

}  // namespace facemetrics
