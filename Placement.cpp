#include "Placement.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <utility>

#include "utils.hpp"

namespace {
const std::array<std::pair<std::string_view, Anchor>, 36> kAnchorAliases = {{
    {"lt", Anchor::LeftTop},
    {"left-top", Anchor::LeftTop},
    {"top-left", Anchor::LeftTop},
    {"tl", Anchor::LeftTop},
    {"tc", Anchor::TopCenter},
    {"top-center", Anchor::TopCenter},
    {"center-top", Anchor::TopCenter},
    {"top", Anchor::TopCenter},
    {"rt", Anchor::RightTop},
    {"right-top", Anchor::RightTop},
    {"top-right", Anchor::RightTop},
    {"tr", Anchor::RightTop},
    {"cl", Anchor::CenterLeft},
    {"center-left", Anchor::CenterLeft},
    {"left-center", Anchor::CenterLeft},
    {"left", Anchor::CenterLeft},
    {"c", Anchor::Center},
    {"center", Anchor::Center},
    {"middle", Anchor::Center},
    {"cc", Anchor::Center},
    {"cr", Anchor::CenterRight},
    {"center-right", Anchor::CenterRight},
    {"right-center", Anchor::CenterRight},
    {"right", Anchor::CenterRight},
    {"lb", Anchor::LeftBottom},
    {"left-bottom", Anchor::LeftBottom},
    {"bottom-left", Anchor::LeftBottom},
    {"bl", Anchor::LeftBottom},
    {"bc", Anchor::BottomCenter},
    {"bottom-center", Anchor::BottomCenter},
    {"center-bottom", Anchor::BottomCenter},
    {"bottom", Anchor::BottomCenter},
    {"rb", Anchor::RightBottom},
    {"right-bottom", Anchor::RightBottom},
    {"bottom-right", Anchor::RightBottom},
    {"br", Anchor::RightBottom},
}};

// Floor division; the span is negative when the text is wider than the image.
int half(int value) {
  return value >= 0 ? value / 2 : -((-value + 1) / 2);
}
}  // namespace

Anchor Placement::parse_anchor(std::string_view alias) {
  const std::string key = string_to_lower_ascii(trim_ascii(alias));
  auto it = std::find_if(kAnchorAliases.begin(), kAnchorAliases.end(),
                         [&](const auto& entry) { return entry.first == key; });
  if (it == kAnchorAliases.end()) {
    throw WatermarkError(ErrorKind::InvalidPosition,
                         std::format("Unknown position '{}'", alias));
  }
  return it->second;
}

std::string_view Placement::anchor_name(Anchor anchor) {
  switch (anchor) {
    case Anchor::LeftTop:
      return "left-top";
    case Anchor::TopCenter:
      return "top-center";
    case Anchor::RightTop:
      return "right-top";
    case Anchor::CenterLeft:
      return "center-left";
    case Anchor::Center:
      return "center";
    case Anchor::CenterRight:
      return "center-right";
    case Anchor::LeftBottom:
      return "left-bottom";
    case Anchor::BottomCenter:
      return "bottom-center";
    case Anchor::RightBottom:
      return "right-bottom";
  }
  return "right-bottom";
}

Point Placement::anchor_origin(Anchor anchor, int imageW, int imageH,
                               int textW, int textH, int margin) {
  const int left = margin;
  const int right = imageW - textW - margin;
  const int hcenter = half(imageW - textW);
  const int top = margin;
  const int bottom = imageH - textH - margin;
  const int vcenter = half(imageH - textH);

  switch (anchor) {
    case Anchor::LeftTop:
      return {left, top};
    case Anchor::TopCenter:
      return {hcenter, top};
    case Anchor::RightTop:
      return {right, top};
    case Anchor::CenterLeft:
      return {left, vcenter};
    case Anchor::Center:
      return {hcenter, vcenter};
    case Anchor::CenterRight:
      return {right, vcenter};
    case Anchor::LeftBottom:
      return {left, bottom};
    case Anchor::BottomCenter:
      return {hcenter, bottom};
    case Anchor::RightBottom:
      return {right, bottom};
  }
  return {right, bottom};
}

int Placement::resolve_font_size(int imageW, int imageH, int fixedSize,
                                 double autoRatio) {
  if (autoRatio > 0.0) {
    const double shorter = static_cast<double>(std::min(imageW, imageH));
    const int size = static_cast<int>(std::lround(shorter * autoRatio));
    return std::max(kMinAutoFontSize, size);
  }
  return fixedSize;
}
