#include "Settings.hpp"

#include <algorithm>
#include <cmath>
#include <format>

#include "Color.hpp"
#include "IOManager.hpp"
#include "Placement.hpp"
#include "utils.hpp"

namespace {
constexpr int kMaxShadowOffset = 50;

int clamp_logged(std::string_view name, int value, int lo, int hi) {
  const int clamped = std::clamp(value, lo, hi);
  if (clamped != value) {
    IOManager::log(std::format("Warning: {} {} out of range, using {}", name,
                               value, clamped));
  }
  return clamped;
}
}  // namespace

WatermarkConfig Settings::make_config(const WatermarkOptions& options) {
  WatermarkConfig config;
  config.anchor = Placement::parse_anchor(options.position);

  if (options.font_size <= 0) {
    throw WatermarkError(
        ErrorKind::InvalidOption,
        std::format("Font size must be positive, got {}", options.font_size));
  }
  config.font_size = options.font_size;

  if (!std::isfinite(options.auto_size) || options.auto_size < 0.0 ||
      options.auto_size > Settings::kMaxAutoRatio) {
    throw WatermarkError(
        ErrorKind::InvalidOption,
        std::format("Auto size ratio must be between 0 and {}, got {}",
                    Settings::kMaxAutoRatio, options.auto_size));
  }
  config.auto_ratio = options.auto_size;

  config.color = Color::parse(options.color);
  config.stroke_color = Color::parse(options.stroke_color);
  config.opacity = clamp_logged("opacity", options.opacity, 0, 255);
  config.margin = std::max(0, options.margin);
  config.stroke_width = std::max(0, options.stroke_width);
  config.shadow_dx = clamp_logged("shadow dx", options.shadow_dx,
                                  -kMaxShadowOffset, kMaxShadowOffset);
  config.shadow_dy = clamp_logged("shadow dy", options.shadow_dy,
                                  -kMaxShadowOffset, kMaxShadowOffset);
  config.shadow_color = Color::parse(options.shadow_color);
  config.jpeg_quality = clamp_logged("jpeg quality", options.jpeg_quality, 1, 100);

  if (!options.font.empty()) {
    config.font_path = path_from_utf8(options.font);
  }
  config.fallback_mtime = options.fallback_mtime;
  config.keep_exif = options.keep_exif;
  return config;
}

fs::path Settings::resolve_output_dir(const WatermarkOptions& options) {
  if (options.output_dir.empty()) {
    return fs::current_path() / "output";
  }
  return fs::absolute(path_from_utf8(options.output_dir));
}
