#pragma once

#include <opencv2/core.hpp>

#include "types.hpp"

// EXIF Orientation (tag 0x0112): 1 upright, 2 mirrored, 3 rotated 180,
// 4 flipped, 5 transposed, 6 rotated 90 CW, 7 transversed, 8 rotated 90 CCW.
namespace ExifOrientation {
inline constexpr int kUpright = 1;

// Orientation recorded in `path`, kUpright when absent or unreadable.
int read(const fs::path& path);

// Pixels of `image` turned so they display upright without the tag.
cv::Mat apply(const cv::Mat& image, int orientation);
}  // namespace ExifOrientation
