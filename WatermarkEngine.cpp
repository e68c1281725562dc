#include "WatermarkEngine.hpp"

#include <format>
#include <opencv2/imgcodecs.hpp>

#include "ExifOrientation.hpp"
#include "IOManager.hpp"
#include "PathResolver.hpp"
#include "utils.hpp"

WatermarkEngine::WatermarkEngine(const WatermarkConfig& config,
                                 fs::path outputDir, FontResolver fonts)
    : m_config(config),
      m_dates(config.fallback_mtime),
      m_fonts(std::move(fonts)),
      m_renderer(m_config),
      m_writer(std::move(outputDir), config.jpeg_quality, config.keep_exif) {}

std::vector<ImageTask> WatermarkEngine::generate_plan(
    const fs::path& input, std::optional<std::stop_token> stoken) const {
  std::vector<ImageTask> plan;
  for (auto& source :
       PathResolver::resolve(input, m_writer.output_dir(), stoken)) {
    fs::path output = m_writer.output_path_for(source);
    plan.push_back({std::move(source), std::move(output)});
  }
  return plan;
}

PlanPreview WatermarkEngine::preview(const ImageTask& task) const {
  PlanPreview result{task, std::nullopt, {}};
  try {
    result.date = m_dates.extract(task.source_path);
  } catch (const WatermarkError& e) {
    result.problem = e.what();
  }
  return result;
}

void WatermarkEngine::watermark(const ImageTask& task,
                                const CaptureDate& date) const {
  cv::Mat image;
  try {
    image = cv::imread(safe_path_to_string(task.source_path),
                       cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception& e) {
    throw WatermarkError(ErrorKind::UnsupportedFormat,
                         std::format("Cannot decode image: {}", e.what()));
  }
  if (image.empty()) {
    throw WatermarkError(ErrorKind::UnsupportedFormat,
                         "Cannot decode image");
  }
  image = ExifOrientation::apply(image,
                                 ExifOrientation::read(task.source_path));

  FontResolution font = m_fonts.resolve(m_config.font_path);
  for (const auto& failure : font.failures) {
    IOManager::log(std::format("Warning: {}. Falling back.", failure));
  }

  cv::Mat rendered;
  try {
    rendered = m_renderer.render(image, date.text, *font.face);
  } catch (const cv::Exception& e) {
    throw WatermarkError(ErrorKind::UnsupportedFormat,
                         std::format("Rendering failed: {}", e.what()));
  }
  m_writer.write(rendered, task);
}

ProcessOutcome WatermarkEngine::process(const ImageTask& task) const {
  ProcessOutcome outcome{task};
  const std::string name = safe_path_to_string(task.source_path);
  try {
    outcome.date = m_dates.extract(task.source_path);
    watermark(task, *outcome.date);
    outcome.success = true;
    outcome.message = std::format("{} ({})", outcome.date->text,
                                  to_string(outcome.date->source));
    IOManager::log(std::format("Done '{}' -> '{}' [{}]", name,
                               safe_path_to_string(task.output_path),
                               outcome.message));
  } catch (const WatermarkError& e) {
    outcome.error = e.kind();
    outcome.message = e.what();
    if (e.kind() == ErrorKind::NoDateAvailable) {
      IOManager::log(std::format("Skipping '{}': {}", name, e.what()));
    } else {
      IOManager::log(std::format("ERROR processing '{}': {}", name, e.what()));
    }
  } catch (const fs::filesystem_error& e) {
    outcome.error = ErrorKind::OutputWrite;
    outcome.message = e.what();
    IOManager::log(std::format("ERROR processing '{}': {}", name, e.what()));
  } catch (const std::exception& e) {
    outcome.error = ErrorKind::UnsupportedFormat;
    outcome.message = e.what();
    IOManager::log(std::format("ERROR processing '{}': {}", name, e.what()));
  }
  return outcome;
}

BatchSummary WatermarkEngine::run(const std::vector<ImageTask>& plan,
                                  std::optional<std::stop_token> stoken) const {
  BatchSummary summary;
  if (plan.empty()) {
    return summary;
  }
  m_writer.ensure_output_dir();

  for (const auto& task : plan) {
    if (stoken && stoken->stop_requested()) {
      IOManager::log("Processing cancelled.");
      break;
    }
    ProcessOutcome outcome = process(task);
    if (outcome.success) {
      ++summary.succeeded;
    } else if (outcome.error == ErrorKind::NoDateAvailable) {
      ++summary.skipped;
    } else {
      ++summary.failed;
    }
    summary.outcomes.push_back(std::move(outcome));
  }

  IOManager::log(std::format("Batch complete: {} written, {} skipped, {} failed.",
                             summary.succeeded, summary.skipped,
                             summary.failed));
  return summary;
}
