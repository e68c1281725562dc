#pragma once

#include <memory>
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

// A loaded font able to measure and draw a line of text. `origin` is the
// left end of the baseline. `grow` thickens the glyphs by that many pixels on
// every side, which is how stroke outlines are drawn.
class TextFace {
 public:
  virtual ~TextFace() = default;

  virtual std::string describe() const = 0;
  virtual cv::Size text_size(const std::string& text, int pixelHeight,
                             int* baseline) const = 0;
  virtual void draw(cv::Mat& canvas, const std::string& text,
                    cv::Point origin, int pixelHeight, const cv::Scalar& color,
                    int grow) const = 0;
};

struct FontResolution {
  std::unique_ptr<TextFace> face;
  // One entry per candidate that was tried and could not be loaded.
  std::vector<std::string> failures;
};

class FontResolver {
 public:
  explicit FontResolver(
      std::vector<fs::path> systemCandidates = default_system_fonts());

  // Tries the requested font, then each system candidate, then the built-in
  // Hershey font. Always returns a usable face.
  FontResolution resolve(const std::optional<fs::path>& requested) const;

  static std::vector<fs::path> default_system_fonts();
  static std::unique_ptr<TextFace> builtin_face();

 private:
  std::vector<fs::path> m_system_candidates;
};
