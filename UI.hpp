#pragma once

#include <atomic>
#include <deque>
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "WatermarkEngine.hpp"

// Interactive review: scan the input, inspect the date each image would get,
// pick the ones to stamp and run the batch on a worker thread.
class UI : public std::enable_shared_from_this<UI> {
 public:
  UI(const WatermarkConfig& config, const fs::path& outputDir,
     const fs::path& inputPath);
  void run();

 private:
  enum class Job { Idle, Scanning, Watermarking };

  struct ReviewRow {
    PlanPreview preview;
    bool selected = false;
    std::optional<ProcessOutcome> outcome;
  };

  // Runs `work` on the worker thread unless another job is active.
  void start_job(Job job, std::string status,
                 std::function<void(const std::stop_token&)> work);
  void scan();
  void apply_selection();
  void quit();
  void select_all(bool selected);
  void on_scan_finished(std::vector<PlanPreview> previews);
  void on_batch_finished(BatchSummary summary);
  bool handle_event(const ftxui::Event& event);

  ftxui::Element render_list() const;
  ftxui::Element render_details() const;
  ftxui::Element render_log();
  std::string selection_summary() const;

  void append_log(std::string_view message);

  ftxui::ScreenInteractive m_screen;
  const fs::path m_input_path;
  WatermarkEngine m_engine;

  std::vector<ReviewRow> m_rows;
  int m_cursor = 0;
  std::string m_status;
  std::atomic<Job> m_job = Job::Idle;
  std::jthread m_worker;

  std::mutex m_log_mutex;
  std::deque<std::string> m_log_lines;
};
