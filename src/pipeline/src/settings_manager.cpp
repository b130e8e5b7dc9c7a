#include <facemetrics/pipeline/settings_manager.hpp>

#include <facemetrics/core/logger.hpp>

#include <QString>
#include <QVariant>

#include <cstddef>
#include <expected>
#include <optional>

namespace facemetrics {

namespace {

[[nodiscard]] std::optional<float> ReadFloat(const QSettings& settings, const QString& key, float fallback) {
  bool ok = false;
  const float value = settings.value(key, fallback).toFloat(&ok);
  if (!ok) {
    FACEMETRICS_WARN("Malformed setting '{}': '{}'", key.toStdString(),
                     settings.value(key).toString().toStdString());
    return std::nullopt;
  }
  return value;
}

[[nodiscard]] std::optional<size_t> ReadCount(const QSettings& settings, const QString& key, size_t fallback) {
  bool ok = false;
  const qlonglong value = settings.value(key, static_cast<qulonglong>(fallback)).toLongLong(&ok);
  if (!ok || value < 0) {
    FACEMETRICS_WARN("Malformed setting '{}': '{}'", key.toStdString(),
                     settings.value(key).toString().toStdString());
    return std::nullopt;
  }
  return static_cast<size_t>(value);
}

}  // namespace

SettingsManager::SettingsManager(QObject* parent) : QObject(parent), settings_("FaceMetrics", "FaceMetrics") {
  FACEMETRICS_INFO("SettingsManager using {}", settings_.fileName().toStdString());
}

SettingsManager::SettingsManager(const QString& file_path, QObject* parent)
    : QObject(parent), settings_(file_path, QSettings::IniFormat) {
  FACEMETRICS_INFO("SettingsManager using {}", file_path.toStdString());
}

auto SettingsManager::Load() -> std::expected<PipelineConfig, PipelineError> {
  FACEMETRICS_INFO("Loading pipeline settings...");

  const PipelineConfig defaults = PipelineConfig::Default();
  PipelineConfig loaded;
  bool malformed = false;

  const auto read_float = [&](const QString& key, float fallback, float& target) {
    if (const auto value = ReadFloat(settings_, key, fallback)) {
      target = *value;
    } else {
      malformed = true;
    }
  };
  const auto read_count = [&](const QString& key, size_t fallback, size_t& target) {
    if (const auto value = ReadCount(settings_, key, fallback)) {
      target = *value;
    } else {
      malformed = true;
    }
  };

  // Smoothing
  read_count("smoothing/windowSize", defaults.smoothing_window_size, loaded.smoothing_window_size);

  // Quality
  read_float("quality/orientationWeight", defaults.quality.weights.orientation, loaded.quality.weights.orientation);
  read_float("quality/eyeOpennessWeight", defaults.quality.weights.eye_openness, loaded.quality.weights.eye_openness);
  read_float("quality/smileNeutralityWeight", defaults.quality.weights.smile_neutrality,
             loaded.quality.weights.smile_neutrality);
  read_float("quality/landmarkCoverageWeight", defaults.quality.weights.landmark_coverage,
             loaded.quality.weights.landmark_coverage);
  read_count("quality/fullLandmarkCount", defaults.quality.full_landmark_count, loaded.quality.full_landmark_count);

  // Orientation
  read_float("orientation/pitchWeight", defaults.quality.orientation_weights.pitch,
             loaded.quality.orientation_weights.pitch);
  read_float("orientation/rollWeight", defaults.quality.orientation_weights.roll,
             loaded.quality.orientation_weights.roll);
  read_float("orientation/yawWeight", defaults.quality.orientation_weights.yaw,
             loaded.quality.orientation_weights.yaw);
  read_float("orientation/limitDegrees", defaults.quality.orientation_limit_deg, loaded.quality.orientation_limit_deg);

  // Classification
  read_float("classification/smiling", defaults.classification.smiling, loaded.classification.smiling);
  read_float("classification/eyesOpen", defaults.classification.eyes_open, loaded.classification.eyes_open);
  read_float("classification/glassesEyeOpen", defaults.classification.glasses_eye_open,
             loaded.classification.glasses_eye_open);

  // Status
  read_float("status/tooFarRange", defaults.status.too_far_range, loaded.status.too_far_range);
  read_float("status/tooCloseRange", defaults.status.too_close_range, loaded.status.too_close_range);
  read_float("status/misalignedAngle", defaults.status.misaligned_angle_deg, loaded.status.misaligned_angle_deg);

  // Range
  read_float("range/scale", defaults.range.scale, loaded.range.scale);

  if (malformed) {
    FACEMETRICS_WARN("Stored pipeline settings are malformed, keeping current configuration");
    return std::unexpected(PipelineError::kInvalidConfig);
  }

  if (const auto valid = loaded.Validate(); !valid) {
    FACEMETRICS_WARN("Stored pipeline settings are invalid, keeping current configuration");
    return std::unexpected(valid.error());
  }

  config_ = loaded;
  FACEMETRICS_INFO("Pipeline settings loaded: window={}, too_far={}, too_close={}, misaligned={}",
                   config_.smoothing_window_size, config_.status.too_far_range, config_.status.too_close_range,
                   config_.status.misaligned_angle_deg);

  emit configChanged();
  return config_;
}

void SettingsManager::Save() {
  FACEMETRICS_INFO("Saving pipeline settings...");

  // Smoothing
  settings_.setValue("smoothing/windowSize", static_cast<qulonglong>(config_.smoothing_window_size));

  // Quality
  settings_.setValue("quality/orientationWeight", config_.quality.weights.orientation);
  settings_.setValue("quality/eyeOpennessWeight", config_.quality.weights.eye_openness);
  settings_.setValue("quality/smileNeutralityWeight", config_.quality.weights.smile_neutrality);
  settings_.setValue("quality/landmarkCoverageWeight", config_.quality.weights.landmark_coverage);
  settings_.setValue("quality/fullLandmarkCount", static_cast<qulonglong>(config_.quality.full_landmark_count));

  // Orientation
  settings_.setValue("orientation/pitchWeight", config_.quality.orientation_weights.pitch);
  settings_.setValue("orientation/rollWeight", config_.quality.orientation_weights.roll);
  settings_.setValue("orientation/yawWeight", config_.quality.orientation_weights.yaw);
  settings_.setValue("orientation/limitDegrees", config_.quality.orientation_limit_deg);

  // Classification
  settings_.setValue("classification/smiling", config_.classification.smiling);
  settings_.setValue("classification/eyesOpen", config_.classification.eyes_open);
  settings_.setValue("classification/glassesEyeOpen", config_.classification.glasses_eye_open);

  // Status
  settings_.setValue("status/tooFarRange", config_.status.too_far_range);
  settings_.setValue("status/tooCloseRange", config_.status.too_close_range);
  settings_.setValue("status/misalignedAngle", config_.status.misaligned_angle_deg);

  // Range
  settings_.setValue("range/scale", config_.range.scale);

  settings_.sync();
  if (settings_.status() != QSettings::NoError) {
    FACEMETRICS_ERROR("Failed to write pipeline settings to {}", settings_.fileName().toStdString());
    return;
  }
  FACEMETRICS_INFO("Pipeline settings saved");
}

auto SettingsManager::SetConfig(const PipelineConfig& config) -> std::expected<void, PipelineError> {
  if (const auto valid = config.Validate(); !valid) {
    return std::unexpected(valid.error());
  }
  if (config_ == config) {
    return {};
  }

  config_ = config;
  Save();
  emit configChanged();
  return {};
}

void SettingsManager::ResetToDefaults() {
  FACEMETRICS_INFO("Resetting pipeline settings to defaults...");

  settings_.clear();
  config_ = PipelineConfig::Default();
  Save();

  emit configChanged();
  FACEMETRICS_INFO("Pipeline settings reset to defaults");
}

}  // namespace facemetrics
