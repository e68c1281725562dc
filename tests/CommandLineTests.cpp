#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../CommandLine.hpp"
#include "TestSupport.hpp"

class CommandLineTest : public TempDirTest {
 protected:
  CliRequest Parse(std::vector<std::string> args) {
    args.insert(args.begin(), "photo_watermark");
    std::vector<const char*> argv;
    for (const auto& arg : args) {
      argv.push_back(arg.c_str());
    }
    return CommandLine::parse(static_cast<int>(argv.size()), argv.data());
  }

  ErrorKind ParseErrorKind(std::vector<std::string> args) {
    try {
      Parse(std::move(args));
    } catch (const WatermarkError& e) {
      return e.kind();
    }
    ADD_FAILURE() << "parse succeeded";
    return ErrorKind::PathNotFound;
  }
};

TEST_F(CommandLineTest, OnlyPathGivesDefaults) {
  const CliRequest request = Parse({"photos"});

  EXPECT_EQ(request.input, fs::path("photos"));
  EXPECT_EQ(json(request.options), json(WatermarkOptions{}));
  EXPECT_FALSE(request.dry_run);
  EXPECT_FALSE(request.interactive);
  EXPECT_FALSE(request.config_file.has_value());
}

TEST_F(CommandLineTest, FlagsOverrideDefaults) {
  const CliRequest request = Parse(
      {"--position", "top-left", "--font-size", "50", "--auto-size", "0.1",
       "--color", "#FF0000", "--opacity", "128", "--margin", "5", "--font",
       "/fonts/a.ttf", "--stroke-width", "0", "--stroke-color", "white",
       "--shadow-dx", "3", "--shadow-dy=-2", "--shadow-color", "gray",
       "--fallback-mtime", "--jpeg-quality", "80", "--strip-exif", "-o",
       "out", "img.jpg"});

  const WatermarkOptions& o = request.options;
  EXPECT_EQ(request.input, fs::path("img.jpg"));
  EXPECT_EQ(o.position, "top-left");
  EXPECT_EQ(o.font_size, 50);
  EXPECT_DOUBLE_EQ(o.auto_size, 0.1);
  EXPECT_EQ(o.color, "#FF0000");
  EXPECT_EQ(o.opacity, 128);
  EXPECT_EQ(o.margin, 5);
  EXPECT_EQ(o.font, "/fonts/a.ttf");
  EXPECT_EQ(o.stroke_width, 0);
  EXPECT_EQ(o.stroke_color, "white");
  EXPECT_EQ(o.shadow_dx, 3);
  EXPECT_EQ(o.shadow_dy, -2);
  EXPECT_EQ(o.shadow_color, "gray");
  EXPECT_TRUE(o.fallback_mtime);
  EXPECT_EQ(o.jpeg_quality, 80);
  EXPECT_FALSE(o.keep_exif);
  EXPECT_EQ(o.output_dir, "out");
}

TEST_F(CommandLineTest, ExplicitFlagsBeatTemplateValues) {
  const fs::path settings = CreateDummyFile(
      "settings.json",
      R"({"position": "c", "opacity": 99, "fallback_mtime": true})");

  const CliRequest request =
      Parse({"--config", settings.string(), "--opacity", "10", "photos"});

  EXPECT_EQ(request.options.position, "c");
  EXPECT_EQ(request.options.opacity, 10);
  EXPECT_TRUE(request.options.fallback_mtime);
  EXPECT_EQ(request.options.font_size, 96);
}

TEST_F(CommandLineTest, ModeSwitches) {
  const CliRequest request =
      Parse({"--dry-run", "-q", "--log-file", "run.log", "--save-config",
             "t.json", "photos"});

  EXPECT_TRUE(request.dry_run);
  EXPECT_TRUE(request.quiet);
  EXPECT_EQ(request.log_file, fs::path("run.log"));
  EXPECT_EQ(request.save_config, fs::path("t.json"));
}

TEST_F(CommandLineTest, HelpNeedsNoPath) {
  EXPECT_TRUE(Parse({"--help"}).show_help);
  EXPECT_NE(CommandLine::usage().find("--fallback-mtime"), std::string::npos);
}

TEST_F(CommandLineTest, BadInvocationsAreRejected) {
  EXPECT_EQ(ParseErrorKind({}), ErrorKind::InvalidOption);
  EXPECT_EQ(ParseErrorKind({"--no-such-flag", "x"}), ErrorKind::InvalidOption);
  EXPECT_EQ(ParseErrorKind({"--font-size", "big", "x"}),
            ErrorKind::InvalidOption);
  EXPECT_EQ(ParseErrorKind({"a", "b"}), ErrorKind::InvalidOption);
  EXPECT_EQ(
      ParseErrorKind({"--config", (test_dir / "absent.json").string(), "x"}),
      ErrorKind::InvalidOption);
}
