#include <gtest/gtest.h>

#include "../FontResolver.hpp"
#include "TestSupport.hpp"

class FontResolverTest : public TempDirTest {};

TEST_F(FontResolverTest, MissingRequestedFontFallsBackToBuiltin) {
  FontResolver resolver({});

  const FontResolution font = resolver.resolve(test_dir / "missing.ttf");

  ASSERT_NE(font.face, nullptr);
  EXPECT_EQ(font.face->describe(), "built-in Hershey font");
  ASSERT_EQ(font.failures.size(), 1u);
  EXPECT_NE(font.failures[0].find("missing.ttf"), std::string::npos);
}

TEST_F(FontResolverTest, CorruptFontFileIsReportedAndSkipped) {
  const fs::path bogus = CreateDummyFile("bogus.ttf", "this is no font");
  FontResolver resolver({bogus});

  const FontResolution font = resolver.resolve(bogus);

  ASSERT_NE(font.face, nullptr);
  EXPECT_EQ(font.face->describe(), "built-in Hershey font");
  // Once as the requested font, once as a system candidate.
  EXPECT_EQ(font.failures.size(), 2u);
}

TEST_F(FontResolverTest, AbsentSystemCandidatesAreProbedSilently) {
  FontResolver resolver({test_dir / "a.ttf", test_dir / "b.otf"});

  const FontResolution font = resolver.resolve(std::nullopt);

  ASSERT_NE(font.face, nullptr);
  EXPECT_TRUE(font.failures.empty());
}

TEST(BuiltinFaceTest, MeasuresAndDrawsAsciiText) {
  auto face = FontResolver::builtin_face();
  int baseline = 0;

  const cv::Size size = face->text_size("2023-05-01", 48, &baseline);
  cv::Mat canvas(size.height + baseline + 20, size.width + 20, CV_8UC3,
                 cv::Scalar::all(0));
  face->draw(canvas, "2023-05-01", cv::Point(10, 10 + size.height), 48,
             cv::Scalar::all(255), 0);

  EXPECT_GT(size.width, size.height);
  EXPECT_GT(cv::countNonZero(canvas.reshape(1)), 0);
}
