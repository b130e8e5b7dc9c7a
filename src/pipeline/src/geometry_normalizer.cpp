#include <facemetrics/pipeline/geometry_normalizer.hpp>

#include <facemetrics/pipeline/pipeline_logger.hpp>

#include <expected>
#include <vector>

namespace facemetrics {

auto GeometryNormalizer::Create(int image_width, int image_height) -> std::expected<GeometryNormalizer, PipelineError> {
  if (image_width <= 0 || image_height <= 0) {
    EnsurePipelineLogger();
    FACEMETRICS_WARN_LOGGER(kPipelineLogger, "Rejected image size {}x{}", image_width, image_height);
    return std::unexpected(PipelineError::kInvalidImageSize);
  }
  return GeometryNormalizer(static_cast<float>(image_width), static_cast<float>(image_height));
}

std::vector<Landmark> GeometryNormalizer::NormalizeLandmarks(const LandmarkSet& landmarks) const {
  std::vector<Landmark> result;
  result.reserve(landmarks.Count());
  for (const LandmarkKind kind : kAllLandmarkKinds) {
    if (const auto position = landmarks.Get(kind)) {
      result.push_back({.kind = kind, .position = NormalizePoint(*position)});
    }
  }
  return result;
}

}  // namespace facemetrics
