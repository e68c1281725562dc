#pragma once

#include "types.hpp"

namespace Settings {
// Auto size is a fraction of the shorter image edge.
inline constexpr double kMaxAutoRatio = 1.0;

// Validates user options into the immutable config shared by every task.
// Throws WatermarkError (InvalidPosition, InvalidOption).
WatermarkConfig make_config(const WatermarkOptions& options);

// `output_dir` when set, otherwise "output" under the working directory.
// Always absolute.
fs::path resolve_output_dir(const WatermarkOptions& options);
}  // namespace Settings
