#include <facemetrics/pipeline/range_estimator.hpp>

#include <algorithm>
#include <cmath>
#include <optional>

namespace facemetrics {

std::optional<float> RangeEstimator::Estimate(const RawDetection& detection) const noexcept {
  if (detection.image_width <= 0 || detection.image_height <= 0) {
    return std::nullopt;
  }

  const float box_side = std::max(detection.bounding_box_px.Width(), detection.bounding_box_px.Height());
  if (!(box_side > 0.0F)) {
    return std::nullopt;
  }

  const auto image_side = static_cast<float>(std::min(detection.image_width, detection.image_height));
  return config_.scale * image_side / box_side;
}

}  // namespace facemetrics
