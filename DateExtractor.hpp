#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "types.hpp"

class DateExtractor {
 public:
  explicit DateExtractor(bool fallbackToMtime);

  // Throws WatermarkError(NoDateAvailable) when neither EXIF nor (if
  // enabled) the modification time yields a date.
  CaptureDate extract(const fs::path& path) const;

  // "YYYY:MM:DD HH:MM:SS" (or with '-' separators) -> "YYYY-MM-DD".
  static std::optional<std::string> parse_exif_datetime(std::string_view raw);
  static std::string format_mtime(const fs::path& path);

 private:
  std::optional<CaptureDate> read_exif_date(const fs::path& path) const;

  bool m_fallback_to_mtime;
};
