#include "OutputWriter.hpp"

#include <exiv2/exiv2.hpp>
#include <format>
#include <string>
#include <opencv2/imgcodecs.hpp>
#include <vector>

#include "ExifOrientation.hpp"
#include "IOManager.hpp"
#include "utils.hpp"

OutputWriter::OutputWriter(fs::path outputDir, int jpegQuality, bool keepExif)
    : m_output_dir(std::move(outputDir)),
      m_jpeg_quality(jpegQuality),
      m_keep_exif(keepExif) {}

void OutputWriter::ensure_output_dir() const {
  std::error_code ec;
  fs::create_directories(m_output_dir, ec);
  if (ec || !fs::is_directory(m_output_dir)) {
    throw WatermarkError(
        ErrorKind::OutputWrite,
        std::format("Cannot create output directory '{}': {}",
                    safe_path_to_string(m_output_dir),
                    ec ? ec.message() : "not a directory"));
  }
}

fs::path OutputWriter::output_path_for(const fs::path& source) const {
  fs::path name = source.stem();
  name += "_wm";
  name += source.extension();
  return m_output_dir / name;
}

void OutputWriter::write(const cv::Mat& image, const ImageTask& task) const {
  std::error_code ec;
  if (fs::exists(task.output_path, ec) &&
      fs::equivalent(task.source_path, task.output_path, ec)) {
    throw WatermarkError(
        ErrorKind::OutputWrite,
        std::format("Refusing to overwrite source '{}'",
                    safe_path_to_string(task.source_path)));
  }

  ensure_output_dir();

  std::vector<int> params;
  const std::string ext =
      string_to_lower_ascii(safe_path_to_string(task.output_path.extension()));
  if (ext == ".jpg" || ext == ".jpeg") {
    params = {cv::IMWRITE_JPEG_QUALITY, m_jpeg_quality,
              cv::IMWRITE_JPEG_SAMPLING_FACTOR,
              cv::IMWRITE_JPEG_SAMPLING_FACTOR_444};
  } else if (ext == ".webp") {
    params = {cv::IMWRITE_WEBP_QUALITY, m_jpeg_quality};
  }

  bool written = false;
  try {
    written = cv::imwrite(safe_path_to_string(task.output_path), image, params);
  } catch (const cv::Exception& e) {
    throw WatermarkError(
        ErrorKind::OutputWrite,
        std::format("Failed to encode '{}': {}",
                    safe_path_to_string(task.output_path), e.what()));
  }
  if (!written) {
    throw WatermarkError(ErrorKind::OutputWrite,
                         std::format("Failed to write '{}'",
                                     safe_path_to_string(task.output_path)));
  }

  if (m_keep_exif) {
    copy_exif(task.source_path, task.output_path);
  }
}

void OutputWriter::copy_exif(const fs::path& from, const fs::path& to) const {
  try {
    Exiv2::Image::UniquePtr source =
        Exiv2::ImageFactory::open(safe_path_to_string(from));
    if (!source.get()) return;
    source->readMetadata();
    if (source->exifData().empty()) return;

    Exiv2::Image::UniquePtr target =
        Exiv2::ImageFactory::open(safe_path_to_string(to));
    if (!target.get() || !target->supportsMetadata(Exiv2::mdExif)) return;
    target->readMetadata();

    // The pixels are already upright and the embedded thumbnail shows the
    // unstamped photo.
    Exiv2::ExifData data = source->exifData();
    Exiv2::ExifThumb thumbnail(data);
    thumbnail.erase();
    auto orientation = data.findKey(Exiv2::ExifKey("Exif.Image.Orientation"));
    if (orientation != data.end()) {
      orientation->setValue(std::to_string(ExifOrientation::kUpright));
    }
    target->setExifData(data);
    target->writeMetadata();
  } catch (const Exiv2::Error& e) {
    IOManager::log(std::format("Warning: Could not copy EXIF into '{}': {}",
                               safe_path_to_string(to), e.what()));
  }
}
