#pragma once

#include <facemetrics/pipeline/pipeline_config.hpp>
#include <facemetrics/pipeline/pipeline_error.hpp>

#include <QObject>
#include <QSettings>
#include <QString>

#include <expected>

namespace facemetrics {

/**
 * @brief Persists the pipeline calibration through QSettings.
 * @details Keys are grouped under smoothing, quality, orientation, classification, status and range.
 * Missing keys fall back to defaults. A stored configuration that fails validation is rejected and the current
 * configuration is kept.
 */
class SettingsManager final : public QObject {
  Q_OBJECT

public:
  /**
   * @brief Uses the native settings store of the FaceMetrics application.
   */
  explicit SettingsManager(QObject* parent = nullptr);

  /**
   * @brief Uses an INI file.
   * @param file_path Path of the INI file; created on first save.
   */
  explicit SettingsManager(const QString& file_path, QObject* parent = nullptr);

  ~SettingsManager() override = default;

  SettingsManager(const SettingsManager&) = delete;
  SettingsManager(SettingsManager&&) = delete;
  SettingsManager& operator=(const SettingsManager&) = delete;
  SettingsManager& operator=(SettingsManager&&) = delete;

  /**
   * @brief Reads the configuration from storage.
   * @return The loaded configuration, or PipelineError::kInvalidConfig if a value is malformed or the result does
   * not validate.
   */
  [[nodiscard]] auto Load() -> std::expected<PipelineConfig, PipelineError>;

  /**
   * @brief Writes the current configuration to storage.
   */
  void Save();

  /**
   * @brief Replaces and saves the configuration.
   * @return Expected void, or PipelineError::kInvalidConfig; the current configuration is kept on failure.
   */
  [[nodiscard]] auto SetConfig(const PipelineConfig& config) -> std::expected<void, PipelineError>;

  /**
   * @brief Clears storage and rewrites the defaults.
   */
  void ResetToDefaults();

  [[nodiscard]] const PipelineConfig& Config() const noexcept { return config_; }
  [[nodiscard]] QString FileName() const { return settings_.fileName(); }

signals:
  void configChanged();

private:
  QSettings settings_;
  PipelineConfig config_;
};

}  // namespace facemetrics
