#include <gtest/gtest.h>

#include <opencv2/imgproc.hpp>

#include "../FontResolver.hpp"
#include "../Placement.hpp"
#include "../WatermarkRenderer.hpp"

class WatermarkRendererTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config.font_size = 48;
    config.stroke_width = 0;
    config.opacity = 255;
    config.margin = 20;
    face = FontResolver::builtin_face();
  }

  // Bounding box of every pixel that differs between the two images.
  static cv::Rect ChangedRegion(const cv::Mat& before, const cv::Mat& after) {
    cv::Mat diff;
    cv::absdiff(before, after, diff);
    if (diff.channels() > 1) {
      cv::Mat gray;
      cv::cvtColor(diff, gray, diff.channels() == 4 ? cv::COLOR_BGRA2GRAY
                                                    : cv::COLOR_BGR2GRAY);
      diff = gray;
    }
    cv::Mat mask = diff > 0;
    return cv::boundingRect(mask);
  }

  WatermarkConfig config;
  std::unique_ptr<TextFace> face;
};

TEST_F(WatermarkRendererTest, KeepsSizeAndPixelType) {
  WatermarkRenderer renderer(config);
  for (int type : {CV_8UC1, CV_8UC3, CV_8UC4, CV_16UC3, CV_32FC3}) {
    cv::Mat base(240, 320, type, cv::Scalar::all(10));

    const cv::Mat out = renderer.render(base, "2023-05-01", *face);

    EXPECT_EQ(out.size(), base.size()) << type;
    EXPECT_EQ(out.type(), base.type()) << type;
  }
}

TEST_F(WatermarkRendererTest, LeavesSourceUntouched) {
  WatermarkRenderer renderer(config);
  cv::Mat base(240, 320, CV_8UC3, cv::Scalar(30, 60, 90));
  const cv::Mat pristine = base.clone();

  const cv::Mat out = renderer.render(base, "2023-05-01", *face);

  EXPECT_EQ(cv::norm(base, pristine, cv::NORM_INF), 0.0);
  EXPECT_GT(cv::norm(out, pristine, cv::NORM_INF), 0.0);
}

TEST_F(WatermarkRendererTest, RightBottomTextLandsInsideItsBox) {
  // 1. Arrange
  WatermarkRenderer renderer(config);
  cv::Mat base(300, 400, CV_8UC3, cv::Scalar::all(0));
  const TextSprite sprite = renderer.rasterize("2023-05-01", *face, 48);
  const Point origin = Placement::anchor_origin(
      Anchor::RightBottom, base.cols, base.rows, sprite.size().width,
      sprite.size().height, config.margin);
  const cv::Rect expected(origin.x, origin.y, sprite.size().width,
                          sprite.size().height);

  // 2. Act
  const cv::Mat out = renderer.render(base, "2023-05-01", *face);

  // 3. Assert
  const cv::Rect changed = ChangedRegion(base, out);
  EXPECT_GT(changed.area(), 0);
  EXPECT_EQ(changed & expected, changed);
  EXPECT_LE(changed.br().x, base.cols - config.margin);
  EXPECT_LE(changed.br().y, base.rows - config.margin);
}

TEST_F(WatermarkRendererTest, LeftTopAnchorRespectsMargin) {
  config.anchor = Anchor::LeftTop;
  WatermarkRenderer renderer(config);
  cv::Mat base(300, 400, CV_8UC1, cv::Scalar::all(0));

  const cv::Mat out = renderer.render(base, "2023-05-01", *face);

  const cv::Rect changed = ChangedRegion(base, out);
  EXPECT_GE(changed.x, config.margin);
  EXPECT_GE(changed.y, config.margin);
  EXPECT_LT(changed.x, base.cols / 2);
}

TEST_F(WatermarkRendererTest, ZeroOpacityChangesNothing) {
  config.opacity = 0;
  WatermarkRenderer renderer(config);
  cv::Mat base(240, 320, CV_8UC3, cv::Scalar(30, 60, 90));

  const cv::Mat out = renderer.render(base, "2023-05-01", *face);

  EXPECT_EQ(cv::norm(base, out, cv::NORM_INF), 0.0);
}

TEST_F(WatermarkRendererTest, PartialOpacityBlendsWithBackground) {
  config.opacity = 128;
  WatermarkRenderer renderer(config);
  cv::Mat base(300, 400, CV_8UC1, cv::Scalar::all(0));

  const cv::Mat out = renderer.render(base, "2023-05-01", *face);

  double max_value = 0.0;
  cv::minMaxLoc(out, nullptr, &max_value);
  EXPECT_GT(max_value, 100.0);
  EXPECT_LT(max_value, 140.0);
}

TEST_F(WatermarkRendererTest, StrokeIsDrawnInStrokeColour) {
  config.stroke_width = 3;
  config.color = Rgb{255, 255, 255};
  config.stroke_color = Rgb{255, 0, 0};
  config.font_size = 96;
  WatermarkRenderer renderer(config);
  cv::Mat base(400, 800, CV_8UC3, cv::Scalar::all(0));

  const cv::Mat out = renderer.render(base, "2023-05-01", *face);

  cv::Mat red, white;
  cv::inRange(out, cv::Scalar(0, 0, 200), cv::Scalar(60, 60, 255), red);
  cv::inRange(out, cv::Scalar(200, 200, 200), cv::Scalar(255, 255, 255),
              white);
  EXPECT_GT(cv::countNonZero(red), 0);
  EXPECT_GT(cv::countNonZero(white), 0);
}

TEST_F(WatermarkRendererTest, StrokeWidensTheTextBox) {
  WatermarkRenderer plain(config);
  WatermarkConfig stroked_config = config;
  stroked_config.stroke_width = 4;
  WatermarkRenderer stroked(stroked_config);

  const TextSprite a = plain.rasterize("2023-05-01", *face, 48);
  const TextSprite b = stroked.rasterize("2023-05-01", *face, 48);

  EXPECT_GT(b.size().width, a.size().width);
  EXPECT_GT(b.size().height, a.size().height);
}

TEST_F(WatermarkRendererTest, OversizedTextIsClippedNotRejected) {
  WatermarkRenderer renderer(config);
  cv::Mat base(20, 30, CV_8UC3, cv::Scalar::all(0));

  cv::Mat out;
  ASSERT_NO_THROW(out = renderer.render(base, "2023-05-01", *face));
  EXPECT_EQ(out.size(), base.size());
}

TEST_F(WatermarkRendererTest, AutoSizeFollowsShorterEdge) {
  config.font_size = 50;
  config.auto_ratio = 0.1;
  WatermarkRenderer renderer(config);

  EXPECT_EQ(renderer.font_size_for(cv::Mat(1000, 2000, CV_8UC1)), 100);
}

TEST_F(WatermarkRendererTest, RejectsUnsupportedLayouts) {
  WatermarkRenderer renderer(config);
  cv::Mat two_channel(50, 50, CV_8UC2, cv::Scalar::all(0));

  try {
    renderer.render(two_channel, "2023-05-01", *face);
    FAIL() << "expected UnsupportedFormat";
  } catch (const WatermarkError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::UnsupportedFormat);
  }
  EXPECT_THROW(renderer.render(cv::Mat(), "2023-05-01", *face),
               WatermarkError);
}

TEST_F(WatermarkRendererTest, ShadowIsDrawnAtItsOffset) {
  // 1. Arrange
  WatermarkRenderer plain(config);
  WatermarkConfig shadowed_config = config;
  shadowed_config.color = Rgb{255, 255, 255};
  shadowed_config.shadow_dx = 6;
  shadowed_config.shadow_dy = 4;
  shadowed_config.shadow_color = Rgb{255, 0, 0};
  WatermarkRenderer shadowed(shadowed_config);

  // 2. Act
  const TextSprite a = plain.rasterize("2023-05-01", *face, 48);
  const TextSprite b = shadowed.rasterize("2023-05-01", *face, 48);

  // 3. Assert
  EXPECT_EQ(b.size(), a.size() + cv::Size(6, 4));

  cv::Mat red;
  cv::inRange(b.color, cv::Scalar(0, 0, 200), cv::Scalar(60, 60, 255), red);
  ASSERT_GT(cv::countNonZero(red), 0);
  // Shadow pixels sit below and right of the text, never in its top-left.
  const cv::Rect shadow_box = cv::boundingRect(red);
  EXPECT_GE(shadow_box.x, 6);
  EXPECT_GE(shadow_box.y, 4);
  EXPECT_GT(shadow_box.br().x, a.size().width);
  EXPECT_GT(shadow_box.br().y, a.size().height);
}

TEST_F(WatermarkRendererTest, NoShadowByDefault) {
  config.color = Rgb{255, 255, 255};
  WatermarkRenderer renderer(config);

  const TextSprite sprite = renderer.rasterize("2023-05-01", *face, 48);

  cv::Mat black;
  cv::inRange(sprite.color, cv::Scalar::all(0), cv::Scalar::all(0), black);
  cv::Mat covered_black = black & (sprite.coverage > 0);
  EXPECT_EQ(cv::countNonZero(covered_black), 0);
}
