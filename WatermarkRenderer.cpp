#include "WatermarkRenderer.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>
#include <opencv2/imgproc.hpp>
#include <vector>

#include "Placement.hpp"

namespace {
cv::Scalar to_bgr(const Rgb& rgb) { return cv::Scalar(rgb.b, rgb.g, rgb.r); }

double depth_max(int depth) {
  switch (depth) {
    case CV_8U:
      return 255.0;
    case CV_16U:
      return 65535.0;
    case CV_32F:
      return 1.0;
    default:
      return 0.0;
  }
}

// Premultiplied "over": target = target * (1 - a) + paint, where both the
// coverage and the paint are scaled by the configured opacity.
void composite(cv::Mat target, const cv::Mat& color, const cv::Mat& coverage,
               int opacity) {
  const double max_value = depth_max(target.depth());
  const double strength = opacity / 255.0;

  cv::Mat alpha;
  coverage.convertTo(alpha, CV_32F, strength / 255.0);
  cv::Mat inv_alpha = 1.0 - alpha;

  cv::Mat paint;
  color.convertTo(paint, CV_32F, strength * max_value / 255.0);
  std::vector<cv::Mat> paint_planes;
  if (target.channels() == 1) {
    cv::Mat gray;
    cv::cvtColor(paint, gray, cv::COLOR_BGR2GRAY);
    paint_planes.push_back(gray);
  } else {
    cv::split(paint, paint_planes);
  }

  std::vector<cv::Mat> planes;
  cv::split(target, planes);
  for (size_t c = 0; c < paint_planes.size(); ++c) {
    cv::Mat plane;
    planes[c].convertTo(plane, CV_32F);
    cv::Mat blended = plane.mul(inv_alpha) + paint_planes[c];
    blended.convertTo(planes[c], target.depth());
  }
  if (target.channels() == 4) {
    cv::Mat plane;
    planes[3].convertTo(plane, CV_32F);
    cv::Mat blended = plane.mul(inv_alpha) + alpha * max_value;
    blended.convertTo(planes[3], target.depth());
  }
  cv::merge(planes, target);
}
}  // namespace

WatermarkRenderer::WatermarkRenderer(const WatermarkConfig& config)
    : m_config(config) {}

int WatermarkRenderer::font_size_for(const cv::Mat& image) const {
  return Placement::resolve_font_size(image.cols, image.rows,
                                      m_config.font_size, m_config.auto_ratio);
}

TextSprite WatermarkRenderer::rasterize(const std::string& text,
                                        const TextFace& face,
                                        int fontSize) const {
  const int grow = m_config.stroke_width;
  int baseline = 0;
  const cv::Size extent = face.text_size(text, fontSize, &baseline);
  const cv::Point shadow_offset(m_config.shadow_dx, m_config.shadow_dy);
  const int pad = fontSize / 2 + 2 * grow + 2 +
                  std::max(std::abs(shadow_offset.x), std::abs(shadow_offset.y));
  const cv::Size canvas_size(extent.width + 2 * pad,
                             extent.height + baseline + 2 * pad);
  const cv::Point origin(pad, pad + extent.height);

  cv::Mat color(canvas_size, CV_8UC3, cv::Scalar::all(0));
  cv::Mat mask(canvas_size, CV_8UC3, cv::Scalar::all(0));
  const cv::Scalar opaque = cv::Scalar::all(255);

  // Shadow, then stroke, then fill; later layers cover earlier ones.
  if (shadow_offset != cv::Point(0, 0)) {
    face.draw(color, text, origin + shadow_offset, fontSize,
              to_bgr(m_config.shadow_color), grow);
    face.draw(mask, text, origin + shadow_offset, fontSize, opaque, grow);
  }
  if (grow > 0) {
    face.draw(color, text, origin, fontSize, to_bgr(m_config.stroke_color),
              grow);
    face.draw(mask, text, origin, fontSize, opaque, grow);
  }
  face.draw(color, text, origin, fontSize, to_bgr(m_config.color), 0);
  face.draw(mask, text, origin, fontSize, opaque, 0);

  cv::Mat coverage;
  cv::cvtColor(mask, coverage, cv::COLOR_BGR2GRAY);
  const cv::Rect box = cv::boundingRect(coverage);
  if (box.empty()) {
    return {};
  }
  return {color(box).clone(), coverage(box).clone()};
}

cv::Mat WatermarkRenderer::render(const cv::Mat& base, const std::string& text,
                                  const TextFace& face) const {
  if (base.empty()) {
    throw WatermarkError(ErrorKind::UnsupportedFormat, "Empty image");
  }
  const int channels = base.channels();
  if ((channels != 1 && channels != 3 && channels != 4) ||
      depth_max(base.depth()) == 0.0) {
    throw WatermarkError(
        ErrorKind::UnsupportedFormat,
        std::format("Unsupported pixel layout: {} channels, depth {}",
                    channels, base.depth()));
  }

  cv::Mat result = base.clone();
  const TextSprite sprite = rasterize(text, face, font_size_for(base));
  if (sprite.color.empty() || m_config.opacity == 0) {
    return result;
  }

  const Point origin = Placement::anchor_origin(
      m_config.anchor, base.cols, base.rows, sprite.size().width,
      sprite.size().height, m_config.margin);
  const cv::Rect placed(origin.x, origin.y, sprite.size().width,
                        sprite.size().height);
  const cv::Rect visible = placed & cv::Rect(0, 0, base.cols, base.rows);
  if (visible.empty()) {
    return result;
  }
  const cv::Rect sprite_roi(visible.x - placed.x, visible.y - placed.y,
                            visible.width, visible.height);
  composite(result(visible), sprite.color(sprite_roi),
            sprite.coverage(sprite_roi), m_config.opacity);
  return result;
}
