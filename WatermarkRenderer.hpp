#pragma once

#include <opencv2/core.hpp>
#include <string>

#include "FontResolver.hpp"
#include "types.hpp"

// Rasterised watermark text: `color` holds the stroke and fill colours over
// black, `coverage` how opaque each pixel is. Both are cropped to the tight
// box around the drawn glyphs, stroke included.
struct TextSprite {
  cv::Mat color;     // CV_8UC3, BGR
  cv::Mat coverage;  // CV_8UC1

  cv::Size size() const { return color.size(); }
};

class WatermarkRenderer {
 public:
  explicit WatermarkRenderer(const WatermarkConfig& config);

  int font_size_for(const cv::Mat& image) const;

  TextSprite rasterize(const std::string& text, const TextFace& face,
                       int fontSize) const;

  // Returns a copy of `base` with `text` composited onto it. Supports 1, 3
  // and 4 channel images of 8 bit, 16 bit or float depth; the result keeps
  // the type and size of `base`. Throws WatermarkError(UnsupportedFormat).
  cv::Mat render(const cv::Mat& base, const std::string& text,
                 const TextFace& face) const;

 private:
  const WatermarkConfig& m_config;
};
