#pragma once

#include <functional>
#include <optional>

#include "types.hpp"

namespace IOManager {
// Opens the optional log file. Without one, messages only reach the handler.
void initialize_logger(const std::optional<fs::path>& logPath = std::nullopt);

void set_log_handler(std::function<void(std::string_view)> handler);
bool has_log_handler();

void log(std::string_view message);

// Loads a settings template on top of `base`. Returns nullopt (and logs the
// reason) when the file is missing or malformed.
std::optional<WatermarkOptions> load_options(const fs::path& templatePath,
                                             const WatermarkOptions& base);
bool save_options(const fs::path& templatePath,
                  const WatermarkOptions& options);
}  // namespace IOManager
