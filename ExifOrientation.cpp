#include "ExifOrientation.hpp"

#include <charconv>
#include <exiv2/exiv2.hpp>
#include <format>
#include <string>

#include "IOManager.hpp"
#include "utils.hpp"

int ExifOrientation::read(const fs::path& path) {
  try {
    Exiv2::Image::UniquePtr image =
        Exiv2::ImageFactory::open(safe_path_to_string(path));
    if (!image.get()) return kUpright;
    image->readMetadata();
    const auto& exifData = image->exifData();
    auto datum = exifData.findKey(Exiv2::ExifKey("Exif.Image.Orientation"));
    if (datum == exifData.end() || datum->count() == 0) return kUpright;

    const std::string raw = datum->toString();
    int value = kUpright;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc() || value < 1 || value > 8) {
      IOManager::log(std::format("Warning: Ignoring orientation '{}' in '{}'",
                                 raw, safe_path_to_string(path)));
      return kUpright;
    }
    return value;
  } catch (const Exiv2::Error& e) {
    IOManager::log(std::format("Non-critical Exiv2 error reading '{}': {}",
                               safe_path_to_string(path), e.what()));
  }
  return kUpright;
}

cv::Mat ExifOrientation::apply(const cv::Mat& image, int orientation) {
  cv::Mat result;
  switch (orientation) {
    case 2:
      cv::flip(image, result, 1);
      break;
    case 3:
      cv::rotate(image, result, cv::ROTATE_180);
      break;
    case 4:
      cv::flip(image, result, 0);
      break;
    case 5:
      cv::transpose(image, result);
      break;
    case 6:
      cv::rotate(image, result, cv::ROTATE_90_CLOCKWISE);
      break;
    case 7:
      cv::transpose(image, result);
      cv::flip(result, result, -1);
      break;
    case 8:
      cv::rotate(image, result, cv::ROTATE_90_COUNTERCLOCKWISE);
      break;
    default:
      result = image;
      break;
  }
  return result;
}
