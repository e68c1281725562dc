#include <gtest/gtest.h>

#include "../IOManager.hpp"
#include "../Settings.hpp"
#include "TestSupport.hpp"

class SettingsTest : public TempDirTest {};

TEST(SettingsConfigTest, DefaultsMatchDocumentedValues) {
  const WatermarkConfig config = Settings::make_config(WatermarkOptions{});

  EXPECT_EQ(config.anchor, Anchor::RightBottom);
  EXPECT_EQ(config.font_size, 96);
  EXPECT_EQ(config.auto_ratio, 0.0);
  EXPECT_EQ(config.color, (Rgb{255, 255, 255}));
  EXPECT_EQ(config.opacity, 220);
  EXPECT_EQ(config.margin, 20);
  EXPECT_FALSE(config.font_path.has_value());
  EXPECT_EQ(config.stroke_width, 2);
  EXPECT_EQ(config.stroke_color, (Rgb{0, 0, 0}));
  EXPECT_FALSE(config.fallback_mtime);
  EXPECT_EQ(config.jpeg_quality, 92);
}

TEST(SettingsConfigTest, OutOfRangeValuesAreClamped) {
  WatermarkOptions options;
  options.opacity = 300;
  options.margin = -4;
  options.stroke_width = -1;
  options.jpeg_quality = 0;

  const WatermarkConfig config = Settings::make_config(options);

  EXPECT_EQ(config.opacity, 255);
  EXPECT_EQ(config.margin, 0);
  EXPECT_EQ(config.stroke_width, 0);
  EXPECT_EQ(config.jpeg_quality, 1);

  options.opacity = -20;
  EXPECT_EQ(Settings::make_config(options).opacity, 0);
}

TEST(SettingsConfigTest, InvalidValuesAreRejectedUpFront) {
  auto kind_of = [](const WatermarkOptions& options) {
    try {
      Settings::make_config(options);
    } catch (const WatermarkError& e) {
      return std::optional<ErrorKind>(e.kind());
    }
    return std::optional<ErrorKind>();
  };

  WatermarkOptions bad_position;
  bad_position.position = "somewhere";
  WatermarkOptions bad_color;
  bad_color.color = "#xyz";
  WatermarkOptions bad_size;
  bad_size.font_size = 0;
  WatermarkOptions bad_ratio;
  bad_ratio.auto_size = -0.5;
  WatermarkOptions huge_ratio;
  huge_ratio.auto_size = 1e9;
  WatermarkOptions bad_shadow;
  bad_shadow.shadow_color = "shade";

  EXPECT_EQ(kind_of(bad_position), ErrorKind::InvalidPosition);
  EXPECT_EQ(kind_of(bad_color), ErrorKind::InvalidOption);
  EXPECT_EQ(kind_of(bad_size), ErrorKind::InvalidOption);
  EXPECT_EQ(kind_of(bad_ratio), ErrorKind::InvalidOption);
  EXPECT_EQ(kind_of(huge_ratio), ErrorKind::InvalidOption);
  EXPECT_EQ(kind_of(bad_shadow), ErrorKind::InvalidOption);
}

TEST(SettingsConfigTest, AutoSizeAcceptsTheWholeUnitRange) {
  WatermarkOptions options;
  options.auto_size = Settings::kMaxAutoRatio;

  EXPECT_DOUBLE_EQ(Settings::make_config(options).auto_ratio, 1.0);
}

TEST(SettingsConfigTest, ShadowIsOffByDefaultAndClamped) {
  const WatermarkConfig defaults = Settings::make_config(WatermarkOptions{});
  EXPECT_EQ(defaults.shadow_dx, 0);
  EXPECT_EQ(defaults.shadow_dy, 0);

  WatermarkOptions options;
  options.shadow_dx = 3;
  options.shadow_dy = -200;
  options.shadow_color = "#808080";
  const WatermarkConfig config = Settings::make_config(options);

  EXPECT_EQ(config.shadow_dx, 3);
  EXPECT_EQ(config.shadow_dy, -50);
  EXPECT_EQ(config.shadow_color, (Rgb{128, 128, 128}));
}

TEST(SettingsConfigTest, FontPathIsKeptWhenGiven) {
  WatermarkOptions options;
  options.font = "/fonts/Custom.ttf";

  EXPECT_EQ(Settings::make_config(options).font_path,
            fs::path("/fonts/Custom.ttf"));
}

TEST_F(SettingsTest, OutputDirDefaultsToWorkingDirectory) {
  const fs::path previous = fs::current_path();
  fs::current_path(test_dir);
  const fs::path cwd = fs::current_path();

  const fs::path resolved = Settings::resolve_output_dir(WatermarkOptions{});
  WatermarkOptions custom;
  custom.output_dir = "elsewhere";
  const fs::path explicit_dir = Settings::resolve_output_dir(custom);

  fs::current_path(previous);
  EXPECT_EQ(resolved, cwd / "output");
  EXPECT_EQ(explicit_dir, cwd / "elsewhere");
}

TEST_F(SettingsTest, TemplateSurvivesSaveAndLoad) {
  WatermarkOptions options;
  options.position = "top-left";
  options.auto_size = 0.08;
  options.color = "gold";
  options.shadow_dx = -2;
  options.shadow_color = "navy";
  options.fallback_mtime = true;
  options.keep_exif = false;
  const fs::path path = test_dir / "templates" / "mine.json";

  ASSERT_TRUE(IOManager::save_options(path, options));
  const auto loaded = IOManager::load_options(path, WatermarkOptions{});

  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(json(*loaded), json(options));
}

TEST_F(SettingsTest, PartialTemplateKeepsBaseValues) {
  const fs::path path =
      CreateDummyFile("partial.json", R"({"opacity": 128, "unknown": 1})");
  WatermarkOptions base;
  base.margin = 7;

  const auto loaded = IOManager::load_options(path, base);

  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->opacity, 128);
  EXPECT_EQ(loaded->margin, 7);
  EXPECT_EQ(loaded->position, "rb");
}

TEST_F(SettingsTest, BrokenTemplatesAreRejected) {
  const fs::path malformed = CreateDummyFile("malformed.json", "{ nope");
  const fs::path wrong_type =
      CreateDummyFile("wrong_type.json", R"({"font_size": "large"})");
  const fs::path not_object = CreateDummyFile("array.json", "[1, 2]");

  EXPECT_FALSE(IOManager::load_options(malformed, {}).has_value());
  EXPECT_FALSE(IOManager::load_options(wrong_type, {}).has_value());
  EXPECT_FALSE(IOManager::load_options(not_object, {}).has_value());
  EXPECT_FALSE(
      IOManager::load_options(test_dir / "absent.json", {}).has_value());
}
