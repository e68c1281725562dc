#pragma once

#include <optional>
#include <stop_token>
#include <vector>

#include "types.hpp"

namespace PathResolver {
bool is_supported_image(const fs::path& path);

// Expands `input` into the image files to process. A directory is walked
// recursively, skipping `excludedDir` and anything beneath it. Throws
// WatermarkError (PathNotFound, UnsupportedFormat).
std::vector<fs::path> resolve(
    const fs::path& input, const std::optional<fs::path>& excludedDir,
    std::optional<std::stop_token> stoken = std::nullopt);
}  // namespace PathResolver
