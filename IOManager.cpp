#include "IOManager.hpp"

#include <chrono>
#include <format>
#include <fstream>
#include <functional>
#include <mutex>

#include "utils.hpp"

namespace {
std::ofstream g_log_file;

std::mutex log_mutex;

std::function<void(std::string_view)> g_log_handler = nullptr;

}  // namespace

void IOManager::initialize_logger(const std::optional<fs::path>& logPath) {
  std::scoped_lock lock(log_mutex);
  if (g_log_file.is_open()) {
    g_log_file.close();
  }
  if (logPath) {
    g_log_file.open(*logPath, std::ios_base::app);
  }
}

void IOManager::set_log_handler(std::function<void(std::string_view)> handler) {
  std::scoped_lock lock(log_mutex);
  g_log_handler = std::move(handler);
}

bool IOManager::has_log_handler() {
  std::scoped_lock lock(log_mutex);
  return static_cast<bool>(g_log_handler);
}

void IOManager::log(std::string_view message) {
  std::scoped_lock lock(log_mutex);

  auto now = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
  auto time_str = std::format("{:%Y-%m-%d %H:%M:%S}", now);
  std::string full_message = std::format("{} | {}", time_str, message);

  if (g_log_handler) {
    g_log_handler(full_message);
  }

  if (g_log_file.is_open()) {
    g_log_file << full_message << "\n" << std::flush;
  }
}

std::optional<WatermarkOptions> IOManager::load_options(
    const fs::path& templatePath, const WatermarkOptions& base) {
  if (!fs::exists(templatePath)) {
    log(std::format("Error: Settings template not found at {}",
                    safe_path_to_string(templatePath)));
    return std::nullopt;
  }
  std::ifstream templateFile(templatePath);
  try {
    json templateJson = json::parse(templateFile);
    if (!templateJson.is_object()) {
      log(std::format("Error: Settings template {} is not a JSON object",
                      safe_path_to_string(templatePath)));
      return std::nullopt;
    }
    WatermarkOptions options = base;
    from_json(templateJson, options);
    return options;
  } catch (const json::exception& e) {
    log(std::format("Error parsing {}: {}", safe_path_to_string(templatePath),
                    e.what()));
    return std::nullopt;
  }
}

bool IOManager::save_options(const fs::path& templatePath,
                             const WatermarkOptions& options) {
  if (templatePath.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(templatePath.parent_path(), ec);
    if (ec) {
      log(std::format("Error: Cannot create directory for {}: {}",
                      safe_path_to_string(templatePath), ec.message()));
      return false;
    }
  }
  std::ofstream templateFile(templatePath);
  if (!templateFile) {
    log(std::format("Error: Cannot open {} for writing",
                    safe_path_to_string(templatePath)));
    return false;
  }
  templateFile << json(options).dump(2) << "\n";
  log(std::format("Settings template saved to {}",
                  safe_path_to_string(templatePath)));
  return static_cast<bool>(templateFile);
}
