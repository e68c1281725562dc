#pragma once

#include <opencv2/core.hpp>

#include "types.hpp"

class OutputWriter {
 public:
  OutputWriter(fs::path outputDir, int jpegQuality, bool keepExif);

  const fs::path& output_dir() const { return m_output_dir; }

  // Creates the output directory if needed. Throws
  // WatermarkError(OutputWrite) when that is impossible.
  void ensure_output_dir() const;

  // "<output_dir>/<stem>_wm<ext>" for `source`.
  fs::path output_path_for(const fs::path& source) const;

  // Encodes `image` to `task.output_path`. `image` must already be upright:
  // copied EXIF is marked upright and loses its thumbnail. Throws
  // WatermarkError (OutputWrite) on failure or when the target is the source
  // itself.
  void write(const cv::Mat& image, const ImageTask& task) const;

 private:
  void copy_exif(const fs::path& from, const fs::path& to) const;

  fs::path m_output_dir;
  int m_jpeg_quality;
  bool m_keep_exif;
};
