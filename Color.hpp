#pragma once

#include <string_view>

#include "types.hpp"

namespace Color {
// Accepts #RGB, #RRGGBB, #RRGGBBAA (alpha ignored), rgb(r, g, b) and the CSS
// colour keywords. Throws WatermarkError(InvalidOption).
Rgb parse(std::string_view text);
}  // namespace Color
