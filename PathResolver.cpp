#include "PathResolver.hpp"

#include <algorithm>
#include <array>
#include <format>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {
constexpr std::array<std::string_view, 7> kImageExtensions = {
    ".jpg", ".jpeg", ".png", ".bmp", ".tif", ".tiff", ".webp"};

fs::path normalized(const fs::path& p) {
  std::error_code ec;
  fs::path result = fs::weakly_canonical(p, ec);
  if (ec) {
    result = fs::absolute(p).lexically_normal();
  }
  if (!result.has_filename() && result.has_relative_path()) {
    result = result.parent_path();
  }
  return result;
}

// True when `path` is `root` or lies below it. Both must be normalized.
bool is_within(const fs::path& path, const fs::path& root) {
  return std::mismatch(root.begin(), root.end(), path.begin(), path.end())
             .first == root.end();
}
}  // namespace

bool PathResolver::is_supported_image(const fs::path& path) {
  const std::string ext =
      string_to_lower_ascii(safe_path_to_string(path.extension()));
  return std::find(kImageExtensions.begin(), kImageExtensions.end(), ext) !=
         kImageExtensions.end();
}

std::vector<fs::path> PathResolver::resolve(
    const fs::path& input, const std::optional<fs::path>& excludedDir,
    std::optional<std::stop_token> stoken) {
  std::error_code ec;
  const auto status = fs::status(input, ec);
  if (ec || !fs::exists(status)) {
    throw WatermarkError(ErrorKind::PathNotFound,
                         std::format("Input path does not exist: {}",
                                     safe_path_to_string(input)));
  }

  if (fs::is_regular_file(status)) {
    if (!is_supported_image(input)) {
      throw WatermarkError(
          ErrorKind::UnsupportedFormat,
          std::format("Not a supported image type: {}",
                      safe_path_to_string(input)));
    }
    return {input};
  }

  if (!fs::is_directory(status)) {
    throw WatermarkError(
        ErrorKind::UnsupportedFormat,
        std::format("Neither a file nor a directory: {}",
                    safe_path_to_string(input)));
  }

  std::optional<fs::path> excluded;
  if (excludedDir) {
    excluded = normalized(*excludedDir);
    if (is_within(normalized(input), *excluded)) {
      IOManager::log(std::format(
          "Warning: '{}' is inside the output directory, nothing to scan",
          safe_path_to_string(input)));
      return {};
    }
  }

  IOManager::log(std::format("Scanning '{}' for images...",
                             safe_path_to_string(input)));

  std::vector<fs::path> images;
  fs::recursive_directory_iterator it(
      input, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    throw WatermarkError(
        ErrorKind::PathNotFound,
        std::format("Cannot read directory '{}': {}",
                    safe_path_to_string(input), ec.message()));
  }

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      IOManager::log(std::format("Warning: Error while scanning '{}': {}",
                                 safe_path_to_string(input), ec.message()));
      break;
    }
    if (stoken && stoken->stop_requested()) {
      IOManager::log("Scan cancelled.");
      break;
    }

    const auto& entry = *it;
    std::error_code entry_ec;
    if (entry.is_directory(entry_ec)) {
      if (excluded && normalized(entry.path()) == *excluded) {
        IOManager::log(std::format("Skipping output directory '{}'",
                                   safe_path_to_string(entry.path())));
        it.disable_recursion_pending();
      }
      continue;
    }
    if (entry.is_regular_file(entry_ec) && is_supported_image(entry.path())) {
      images.push_back(entry.path());
    }
  }

  std::sort(images.begin(), images.end());

  if (images.empty()) {
    IOManager::log(std::format("Warning: No supported images found in '{}'",
                               safe_path_to_string(input)));
  } else {
    IOManager::log(std::format("Found {} images.", images.size()));
  }
  return images;
}
