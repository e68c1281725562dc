#include "DateExtractor.hpp"

#include <array>
#include <charconv>
#include <chrono>
#include <ctime>
#include <exiv2/exiv2.hpp>
#include <format>
#include <utility>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {
const std::array<std::pair<const char*, DateSource>, 3> kDateKeys = {{
    {"Exif.Photo.DateTimeOriginal", DateSource::DateTimeOriginal},
    {"Exif.Photo.DateTimeDigitized", DateSource::DateTimeDigitized},
    {"Exif.Image.DateTime", DateSource::DateTime},
}};

std::optional<int> parse_field(std::string_view sv) {
  int value = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
  if (ec != std::errc() || ptr != sv.data() + sv.size()) return std::nullopt;
  return value;
}
}  // namespace

DateExtractor::DateExtractor(bool fallbackToMtime)
    : m_fallback_to_mtime(fallbackToMtime) {}

std::optional<std::string> DateExtractor::parse_exif_datetime(
    std::string_view raw) {
  std::string_view value = trim_ascii(raw);
  // Some writers pad unknown dates with NULs or spaces.
  if (auto nul = value.find('\0'); nul != std::string_view::npos) {
    value = trim_ascii(value.substr(0, nul));
  }
  std::string_view date_part = value.substr(0, value.find_first_of(" T"));
  if (date_part.size() != 10) return std::nullopt;

  const char sep = date_part[4];
  if ((sep != ':' && sep != '-') || date_part[7] != sep) return std::nullopt;

  auto year = parse_field(date_part.substr(0, 4));
  auto month = parse_field(date_part.substr(5, 2));
  auto day = parse_field(date_part.substr(8, 2));
  if (!year || !month || !day) return std::nullopt;

  const std::chrono::year_month_day ymd{
      std::chrono::year{*year},
      std::chrono::month{static_cast<unsigned>(*month)},
      std::chrono::day{static_cast<unsigned>(*day)}};
  if (!ymd.ok()) return std::nullopt;

  return std::format("{:04}-{:02}-{:02}", *year, *month, *day);
}

std::string DateExtractor::format_mtime(const fs::path& path) {
  const auto ftime = fs::last_write_time(path);
  const auto sys_time = std::chrono::file_clock::to_sys(ftime);
  const std::time_t tt = std::chrono::system_clock::to_time_t(
      std::chrono::time_point_cast<std::chrono::system_clock::duration>(
          sys_time));
  std::tm local{};
#ifdef _WIN32
  localtime_s(&local, &tt);
#else
  localtime_r(&tt, &local);
#endif
  return std::format("{:04}-{:02}-{:02}", local.tm_year + 1900,
                     local.tm_mon + 1, local.tm_mday);
}

std::optional<CaptureDate> DateExtractor::read_exif_date(
    const fs::path& path) const {
  try {
    Exiv2::Image::UniquePtr image =
        Exiv2::ImageFactory::open(safe_path_to_string(path));
    if (!image.get()) return std::nullopt;
    image->readMetadata();
    const auto& exifData = image->exifData();
    if (exifData.empty()) return std::nullopt;

    for (const auto& [key, source] : kDateKeys) {
      auto datum = exifData.findKey(Exiv2::ExifKey(key));
      if (datum == exifData.end() || datum->count() == 0) continue;
      if (auto date = parse_exif_datetime(datum->toString())) {
        return CaptureDate{*date, source};
      }
      IOManager::log(std::format("Warning: Ignoring unparseable {} '{}' in '{}'",
                                 key, datum->toString(),
                                 safe_path_to_string(path)));
    }
  } catch (const Exiv2::Error& e) {
    IOManager::log(std::format("Non-critical Exiv2 error reading '{}': {}",
                               safe_path_to_string(path), e.what()));
  } catch (const std::exception& e) {
    IOManager::log(
        std::format("Non-critical standard exception reading '{}': {}",
                    safe_path_to_string(path), e.what()));
  }
  return std::nullopt;
}

CaptureDate DateExtractor::extract(const fs::path& path) const {
  if (auto exif_date = read_exif_date(path)) {
    return *exif_date;
  }
  if (m_fallback_to_mtime) {
    try {
      return CaptureDate{format_mtime(path), DateSource::FileMtime};
    } catch (const fs::filesystem_error& e) {
      throw WatermarkError(
          ErrorKind::NoDateAvailable,
          std::format("No EXIF date and modification time unreadable: {}",
                      e.what()));
    }
  }
  throw WatermarkError(ErrorKind::NoDateAvailable,
                       std::format("No EXIF capture date in '{}'",
                                   safe_path_to_string(path)));
}
