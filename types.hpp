#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

enum class ErrorKind {
  PathNotFound,
  NoImagesFound,
  NoDateAvailable,
  UnsupportedFormat,
  FontLoad,
  OutputWrite,
  InvalidPosition,
  InvalidOption
};

inline std::string_view to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::PathNotFound:
      return "PathNotFound";
    case ErrorKind::NoImagesFound:
      return "NoImagesFound";
    case ErrorKind::NoDateAvailable:
      return "NoDateAvailable";
    case ErrorKind::UnsupportedFormat:
      return "UnsupportedFormat";
    case ErrorKind::FontLoad:
      return "FontLoad";
    case ErrorKind::OutputWrite:
      return "OutputWrite";
    case ErrorKind::InvalidPosition:
      return "InvalidPosition";
    case ErrorKind::InvalidOption:
      return "InvalidOption";
  }
  return "Unknown";
}

class WatermarkError : public std::runtime_error {
 public:
  WatermarkError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), m_kind(kind) {}

  ErrorKind kind() const noexcept { return m_kind; }

 private:
  ErrorKind m_kind;
};

enum class Anchor {
  LeftTop,
  TopCenter,
  RightTop,
  CenterLeft,
  Center,
  CenterRight,
  LeftBottom,
  BottomCenter,
  RightBottom
};

struct Rgb {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;

  bool operator==(const Rgb&) const = default;
};

// Options exactly as the user supplied them, on the command line or in a
// settings template. Validated into a WatermarkConfig before use.
struct WatermarkOptions {
  std::string position = "rb";
  int font_size = 96;
  double auto_size = 0.0;
  std::string color = "#FFFFFF";
  int opacity = 220;
  int margin = 20;
  std::string font;
  int stroke_width = 2;
  std::string stroke_color = "#000000";
  int shadow_dx = 0;
  int shadow_dy = 0;
  std::string shadow_color = "#000000";
  bool fallback_mtime = false;
  int jpeg_quality = 92;
  std::string output_dir;
  bool keep_exif = true;
};

// Keys missing from a template keep whatever value `o` already holds.
inline void from_json(const json& j, WatermarkOptions& o) {
  o.position = j.value("position", o.position);
  o.font_size = j.value("font_size", o.font_size);
  o.auto_size = j.value("auto_size", o.auto_size);
  o.color = j.value("color", o.color);
  o.opacity = j.value("opacity", o.opacity);
  o.margin = j.value("margin", o.margin);
  o.font = j.value("font", o.font);
  o.stroke_width = j.value("stroke_width", o.stroke_width);
  o.stroke_color = j.value("stroke_color", o.stroke_color);
  o.shadow_dx = j.value("shadow_dx", o.shadow_dx);
  o.shadow_dy = j.value("shadow_dy", o.shadow_dy);
  o.shadow_color = j.value("shadow_color", o.shadow_color);
  o.fallback_mtime = j.value("fallback_mtime", o.fallback_mtime);
  o.jpeg_quality = j.value("jpeg_quality", o.jpeg_quality);
  o.output_dir = j.value("output_dir", o.output_dir);
  o.keep_exif = j.value("keep_exif", o.keep_exif);
}

inline void to_json(json& j, const WatermarkOptions& o) {
  j = json{{"position", o.position},
           {"font_size", o.font_size},
           {"auto_size", o.auto_size},
           {"color", o.color},
           {"opacity", o.opacity},
           {"margin", o.margin},
           {"font", o.font},
           {"stroke_width", o.stroke_width},
           {"stroke_color", o.stroke_color},
           {"shadow_dx", o.shadow_dx},
           {"shadow_dy", o.shadow_dy},
           {"shadow_color", o.shadow_color},
           {"fallback_mtime", o.fallback_mtime},
           {"jpeg_quality", o.jpeg_quality},
           {"output_dir", o.output_dir},
           {"keep_exif", o.keep_exif}};
}

struct WatermarkConfig {
  Anchor anchor = Anchor::RightBottom;
  int font_size = 96;
  double auto_ratio = 0.0;
  Rgb color{255, 255, 255};
  int opacity = 220;
  int margin = 20;
  std::optional<fs::path> font_path;
  int stroke_width = 2;
  Rgb stroke_color{0, 0, 0};
  // Drop shadow offset in pixels; (0, 0) draws no shadow.
  int shadow_dx = 0;
  int shadow_dy = 0;
  Rgb shadow_color{0, 0, 0};
  bool fallback_mtime = false;
  int jpeg_quality = 92;
  bool keep_exif = true;
};

enum class DateSource { DateTimeOriginal, DateTimeDigitized, DateTime, FileMtime };

inline std::string_view to_string(DateSource source) {
  switch (source) {
    case DateSource::DateTimeOriginal:
      return "DateTimeOriginal";
    case DateSource::DateTimeDigitized:
      return "DateTimeDigitized";
    case DateSource::DateTime:
      return "DateTime";
    case DateSource::FileMtime:
      return "file mtime";
  }
  return "unknown";
}

struct CaptureDate {
  std::string text;  // YYYY-MM-DD
  DateSource source;
};

struct ImageTask {
  fs::path source_path;
  fs::path output_path;
};

struct ProcessOutcome {
  ImageTask task;
  bool success = false;
  std::optional<CaptureDate> date;
  std::optional<ErrorKind> error;
  std::string message;
};

struct BatchSummary {
  std::size_t succeeded = 0;
  std::size_t skipped = 0;
  std::size_t failed = 0;
  std::vector<ProcessOutcome> outcomes;

  std::size_t total() const { return succeeded + skipped + failed; }
};
