#include <doctest/doctest.h>

#include <facemetrics/pipeline/settings_manager.hpp>

#include <QSettings>
#include <QString>
#include <QTemporaryDir>

namespace {

facemetrics::PipelineConfig MakeCustomConfig() {
  facemetrics::PipelineConfig config;
  config.smoothing_window_size = 7;
  config.classification.smiling = 0.6f;
  config.status.too_far_range = 180.0f;
  config.status.too_close_range = 40.0f;
  config.status.misaligned_angle_deg = 15.0f;
  config.range.scale = 60.0f;
  return config;
}

}  // namespace

TEST_SUITE("facemetrics::SettingsManager") {
  TEST_CASE("SettingsManager::Load: Missing keys fall back to defaults") {
    QTemporaryDir temp_dir;
    REQUIRE(temp_dir.isValid());

    facemetrics::SettingsManager manager(temp_dir.filePath("settings.ini"));
    const auto config = manager.Load();

    REQUIRE(config.has_value());
    CHECK(*config == facemetrics::PipelineConfig::Default());
    CHECK(manager.Config() == facemetrics::PipelineConfig::Default());
  }

  TEST_CASE("SettingsManager::SetConfig: Persists across instances") {
    QTemporaryDir temp_dir;
    REQUIRE(temp_dir.isValid());
    const QString path = temp_dir.filePath("settings.ini");
    const auto custom = MakeCustomConfig();

    {
      facemetrics::SettingsManager writer(path);
      REQUIRE(writer.SetConfig(custom).has_value());
      CHECK(writer.Config() == custom);
    }

    facemetrics::SettingsManager reader(path);
    const auto loaded = reader.Load();
    REQUIRE(loaded.has_value());

    CHECK_EQ(loaded->smoothing_window_size, 7u);
    CHECK_EQ(loaded->classification.smiling, doctest::Approx(0.6f));
    CHECK_EQ(loaded->status.too_far_range, doctest::Approx(180.0f));
    CHECK_EQ(loaded->status.too_close_range, doctest::Approx(40.0f));
    CHECK_EQ(loaded->status.misaligned_angle_deg, doctest::Approx(15.0f));
    CHECK_EQ(loaded->range.scale, doctest::Approx(60.0f));
    CHECK_EQ(loaded->quality.weights.orientation, doctest::Approx(0.4f));
  }

  TEST_CASE("SettingsManager::Load: Partial file keeps defaults for the rest") {
    QTemporaryDir temp_dir;
    REQUIRE(temp_dir.isValid());
    const QString path = temp_dir.filePath("settings.ini");

    {
      QSettings raw(path, QSettings::IniFormat);
      raw.setValue("status/misalignedAngle", "25");
      raw.sync();
    }

    facemetrics::SettingsManager manager(path);
    const auto loaded = manager.Load();
    REQUIRE(loaded.has_value());

    CHECK_EQ(loaded->status.misaligned_angle_deg, doctest::Approx(25.0f));
    CHECK_EQ(loaded->status.too_far_range, doctest::Approx(150.0f));
    CHECK_EQ(loaded->smoothing_window_size, 5u);
  }

  TEST_CASE("SettingsManager::Load: Malformed value is rejected") {
    QTemporaryDir temp_dir;
    REQUIRE(temp_dir.isValid());
    const QString path = temp_dir.filePath("settings.ini");

    {
      QSettings raw(path, QSettings::IniFormat);
      raw.setValue("smoothing/windowSize", "three");
      raw.sync();
    }

    facemetrics::SettingsManager manager(path);
    const auto loaded = manager.Load();

    REQUIRE_FALSE(loaded.has_value());
    CHECK_EQ(loaded.error(), facemetrics::PipelineError::kInvalidConfig);
    CHECK(manager.Config() == facemetrics::PipelineConfig::Default());
  }

  TEST_CASE("SettingsManager::Load: Inconsistent values are rejected") {
    QTemporaryDir temp_dir;
    REQUIRE(temp_dir.isValid());
    const QString path = temp_dir.filePath("settings.ini");

    {
      QSettings raw(path, QSettings::IniFormat);
      raw.setValue("status/tooCloseRange", "500");
      raw.sync();
    }

    facemetrics::SettingsManager manager(path);
    const auto loaded = manager.Load();

    REQUIRE_FALSE(loaded.has_value());
    CHECK_EQ(loaded.error(), facemetrics::PipelineError::kInvalidConfig);
    CHECK(manager.Config() == facemetrics::PipelineConfig::Default());
  }

  TEST_CASE("SettingsManager::SetConfig: Rejects invalid configuration") {
    QTemporaryDir temp_dir;
    REQUIRE(temp_dir.isValid());

    facemetrics::SettingsManager manager(temp_dir.filePath("settings.ini"));
    auto invalid = facemetrics::PipelineConfig::Default();
    invalid.quality.weights.orientation = 0.9f;

    const auto result = manager.SetConfig(invalid);
    REQUIRE_FALSE(result.has_value());
    CHECK_EQ(result.error(), facemetrics::PipelineError::kInvalidConfig);
    CHECK(manager.Config() == facemetrics::PipelineConfig::Default());
  }

  TEST_CASE("SettingsManager::SetConfig: Signals only on change") {
    QTemporaryDir temp_dir;
    REQUIRE(temp_dir.isValid());

    facemetrics::SettingsManager manager(temp_dir.filePath("settings.ini"));
    int changes = 0;
    QObject::connect(&manager, &facemetrics::SettingsManager::configChanged, [&changes] { ++changes; });

    REQUIRE(manager.SetConfig(facemetrics::PipelineConfig::Default()).has_value());
    CHECK_EQ(changes, 0);

    REQUIRE(manager.SetConfig(MakeCustomConfig()).has_value());
    CHECK_EQ(changes, 1);

    REQUIRE(manager.SetConfig(MakeCustomConfig()).has_value());
    CHECK_EQ(changes, 1);
  }

  TEST_CASE("SettingsManager::ResetToDefaults: Restores and persists defaults") {
    QTemporaryDir temp_dir;
    REQUIRE(temp_dir.isValid());
    const QString path = temp_dir.filePath("settings.ini");

    {
      facemetrics::SettingsManager manager(path);
      REQUIRE(manager.SetConfig(MakeCustomConfig()).has_value());

      int changes = 0;
      QObject::connect(&manager, &facemetrics::SettingsManager::configChanged, [&changes] { ++changes; });
      manager.ResetToDefaults();

      CHECK_EQ(changes, 1);
      CHECK(manager.Config() == facemetrics::PipelineConfig::Default());
    }

    facemetrics::SettingsManager reader(path);
    const auto loaded = reader.Load();
    REQUIRE(loaded.has_value());
    CHECK_EQ(loaded->smoothing_window_size, 5u);
    CHECK_EQ(loaded->status.too_far_range, doctest::Approx(150.0f));
    CHECK_EQ(loaded->range.scale, doctest::Approx(50.0f));
  }

  TEST_CASE("SettingsManager::FileName: Reports the INI path") {
    QTemporaryDir temp_dir;
    REQUIRE(temp_dir.isValid());
    const QString path = temp_dir.filePath("settings.ini");

    const facemetrics::SettingsManager manager(path);
    CHECK(manager.FileName().endsWith("settings.ini"));
  }
}  // TEST_SUITE
