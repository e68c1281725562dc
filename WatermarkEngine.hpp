#pragma once

#include <optional>
#include <stop_token>
#include <vector>

#include "DateExtractor.hpp"
#include "FontResolver.hpp"
#include "OutputWriter.hpp"
#include "WatermarkRenderer.hpp"

struct PlanPreview {
  ImageTask task;
  std::optional<CaptureDate> date;
  std::string problem;
};

class WatermarkEngine {
 public:
  WatermarkEngine(const WatermarkConfig& config, fs::path outputDir,
                  FontResolver fonts = FontResolver());
  WatermarkEngine(const WatermarkEngine&) = delete;
  WatermarkEngine& operator=(const WatermarkEngine&) = delete;

  const OutputWriter& writer() const { return m_writer; }

  // Resolves `input` into tasks, skipping the output directory. Throws
  // WatermarkError (PathNotFound, UnsupportedFormat).
  std::vector<ImageTask> generate_plan(
      const fs::path& input,
      std::optional<std::stop_token> stoken = std::nullopt) const;

  // Date lookup only; nothing is decoded or written.
  PlanPreview preview(const ImageTask& task) const;

  // Runs one task end to end. Never throws: failures are logged and
  // reported in the outcome.
  ProcessOutcome process(const ImageTask& task) const;

  BatchSummary run(const std::vector<ImageTask>& plan,
                   std::optional<std::stop_token> stoken = std::nullopt) const;

 private:
  void watermark(const ImageTask& task, const CaptureDate& date) const;

  WatermarkConfig m_config;
  DateExtractor m_dates;
  FontResolver m_fonts;
  WatermarkRenderer m_renderer;
  OutputWriter m_writer;
};
