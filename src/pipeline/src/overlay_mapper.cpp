#include <facemetrics/pipeline/overlay_mapper.hpp>

#include <facemetrics/pipeline/pipeline_logger.hpp>

#include <algorithm>
#include <expected>
#include <mutex>
#include <shared_mutex>
#include <utility>

#include <opencv2/core.hpp>

namespace facemetrics {

namespace {

// cos and sin of -(quarter_turns * 90) degrees, exact.
[[nodiscard]] constexpr std::pair<float, float> InverseQuarterTurn(int quarter_turns) noexcept {
  switch (quarter_turns % 4) {
    case 1:
      return {0.0F, -1.0F};
    case 2:
      return {-1.0F, 0.0F};
    case 3:
      return {0.0F, 1.0F};
    default:
      return {1.0F, 0.0F};
  }
}

[[nodiscard]] cv::Matx33f BuildMatrix(const TransformState& state) noexcept {
  const cv::Matx33f to_origin(1.0F, 0.0F, -0.5F,
                              0.0F, 1.0F, -0.5F,
                              0.0F, 0.0F, 1.0F);
  const cv::Matx33f from_origin(1.0F, 0.0F, 0.5F,
                                0.0F, 1.0F, 0.5F,
                                0.0F, 0.0F, 1.0F);
  const cv::Matx33f mirror(state.mirrored ? -1.0F : 1.0F, 0.0F, 0.0F,
                           0.0F, 1.0F, 0.0F,
                           0.0F, 0.0F, 1.0F);

  const auto [cos_a, sin_a] = InverseQuarterTurn(state.rotation_degrees / 90);
  const cv::Matx33f rotate(cos_a, -sin_a, 0.0F,
                           sin_a, cos_a, 0.0F,
                           0.0F, 0.0F, 1.0F);

  return from_origin * rotate * mirror * to_origin;
}

}  // namespace

OverlayTransform::OverlayTransform(const TransformState& state) noexcept : state_(state), matrix_(BuildMatrix(state)) {
  FACEMETRICS_ASSERT(state.rotation_degrees >= 0 && state.rotation_degrees < 360 && state.rotation_degrees % 90 == 0,
                     "Unnormalized rotation {}", state.rotation_degrees);
}

Point2D OverlayTransform::MapPoint(Point2D point) const noexcept {
  const cv::Vec3f mapped = matrix_ * cv::Vec3f(point.x, point.y, 1.0F);
  return {.x = mapped[0], .y = mapped[1]};
}

Rect OverlayTransform::MapRect(const Rect& rect) const noexcept {
  const Point2D corners[] = {MapPoint(rect.TopLeft()), MapPoint(rect.TopRight()), MapPoint(rect.BottomLeft()),
                             MapPoint(rect.BottomRight())};

  Rect bounds{.left = corners[0].x, .top = corners[0].y, .right = corners[0].x, .bottom = corners[0].y};
  for (const Point2D& corner : corners) {
    bounds.left = std::min(bounds.left, corner.x);
    bounds.top = std::min(bounds.top, corner.y);
    bounds.right = std::max(bounds.right, corner.x);
    bounds.bottom = std::max(bounds.bottom, corner.y);
  }
  return bounds;
}

OverlayTransform OverlayTransform::Inverse() const noexcept {
  if (state_.mirrored) {
    return *this;
  }
  return OverlayTransform(
      TransformState{.mirrored = false, .rotation_degrees = NormalizeRotation(-state_.rotation_degrees)});
}

OverlayMapper::OverlayMapper() noexcept {
  EnsurePipelineLogger();
}

auto OverlayMapper::SetTransform(bool mirrored, int rotation_degrees) -> std::expected<void, PipelineError> {
  const int normalized = NormalizeRotation(rotation_degrees);
  if (normalized % 90 != 0) {
    FACEMETRICS_WARN_LOGGER(kPipelineLogger, "Rejected rotation {} (normalized {}), keeping previous transform",
                            rotation_degrees, normalized);
    return std::unexpected(PipelineError::kInvalidRotation);
  }

  const OverlayTransform transform(TransformState{.mirrored = mirrored, .rotation_degrees = normalized});
  {
    const std::unique_lock lock(mutex_);
    transform_ = transform;
  }

  FACEMETRICS_DEBUG_LOGGER(kPipelineLogger, "Overlay transform set: mirrored={} rotation={}", mirrored, normalized);
  return {};
}

OverlayTransform OverlayMapper::Snapshot() const {
  const std::shared_lock lock(mutex_);
  return transform_;
}

}  // namespace facemetrics
