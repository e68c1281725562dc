#pragma once

#include <string_view>

#include "types.hpp"

struct Point {
  int x = 0;
  int y = 0;

  bool operator==(const Point&) const = default;
};

namespace Placement {
// Resolves every accepted spelling ("rb", "bottom-right", "Right-Bottom"...)
// to its anchor. Throws WatermarkError(InvalidPosition) otherwise.
Anchor parse_anchor(std::string_view alias);
std::string_view anchor_name(Anchor anchor);

// Top-left corner of a `textW` x `textH` box inside a `imageW` x `imageH`
// image. May be negative when the image is smaller than the box plus
// margins.
Point anchor_origin(Anchor anchor, int imageW, int imageH, int textW,
                    int textH, int margin);

// auto_ratio > 0 wins over the fixed size, with a floor of kMinAutoFontSize.
inline constexpr int kMinAutoFontSize = 12;
int resolve_font_size(int imageW, int imageH, int fixedSize, double autoRatio);
}  // namespace Placement
