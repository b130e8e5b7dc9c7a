#pragma once

#include <facemetrics/pch.hpp>

#include <facemetrics/pipeline/geometry.hpp>
#include <facemetrics/pipeline/raw_detection.hpp>

#include <vector>

namespace facemetrics {

/**
 * @brief A landmark in normalized frame coordinates.
 */
struct Landmark {
  LandmarkKind kind = LandmarkKind::kLeftEye;
  Point2D position;  ///< Normalized to [0, 1] on both axes.

  [[nodiscard]] constexpr bool operator==(const Landmark& other) const noexcept = default;
};

/**
 * @brief Display-ready metrics for one frame.
 * @details A record with detection_confidence == 0 is the "no face" sentinel and has every other field at its
 * default. Consumers treat it as nothing to render.
 */
struct FaceMetrics {
  Rect bounding_box;                   ///< Normalized to [0, 1].
  float interpupillary_distance = 0.0F;  ///< Eye distance as a fraction of image width, not a physical unit.
  float face_width = 0.0F;             ///< Normalized to [0, 1].
  float face_height = 0.0F;            ///< Normalized to [0, 1].
  Point2D face_position;               ///< Box center in [-0.5, 0.5], (0, 0) = image center.

  float pitch = 0.0F;  ///< Degrees.
  float roll = 0.0F;   ///< Degrees.
  float yaw = 0.0F;    ///< Degrees.

  float quality_score = 0.0F;  ///< Composite score in [0, 1].

  float smile_confidence = 0.0F;
  bool is_smiling = false;
  float left_eye_open_confidence = 0.0F;
  float right_eye_open_confidence = 0.0F;
  bool are_eyes_open = false;

  /// Coarse heuristic (ear visible and both eyes confidently open), not a trained classifier.
  bool has_glasses = false;

  std::vector<Landmark> landmarks;  ///< Only landmarks present in the input, in LandmarkKind order.

  float detection_confidence = 0.0F;  ///< 0 = no face, any positive value = valid detection.

  /**
   * @brief Creates the "no face" sentinel.
   */
  [[nodiscard]] static FaceMetrics NoFace() noexcept { return {}; }

  /**
   * @brief Checks whether this record describes a detected face.
   */
  [[nodiscard]] constexpr bool HasFace() const noexcept { return detection_confidence > 0.0F; }

  [[nodiscard]] bool operator==(const FaceMetrics& other) const noexcept = default;
};

}  // namespace facemetrics
