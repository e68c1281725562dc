#include "UI.hpp"

#include <algorithm>
#include <format>
#include <ftxui/dom/elements.hpp>
#include <utility>

#include "IOManager.hpp"
#include "utils.hpp"

using namespace ftxui;

namespace {
constexpr std::size_t kMaxLogLines = 200;

Element outcome_badge(const std::optional<ProcessOutcome>& outcome) {
  if (!outcome) {
    return text("");
  }
  if (outcome->success) {
    return text(" done") | color(Color::Green);
  }
  if (outcome->error == ErrorKind::NoDateAvailable) {
    return text(" skipped") | color(Color::Yellow);
  }
  return text(" failed") | color(Color::Red);
}

Element labelled(const std::string& label, Element value) {
  return hbox({text(label) | bold | size(WIDTH, EQUAL, 8), std::move(value)});
}
}  // namespace

UI::UI(const WatermarkConfig& config, const fs::path& outputDir,
       const fs::path& inputPath)
    : m_screen(ScreenInteractive::Fullscreen()),
      m_input_path(inputPath),
      m_engine(config, outputDir),
      m_status("Starting...") {}

void UI::append_log(std::string_view message) {
  {
    std::scoped_lock lock(m_log_mutex);
    m_log_lines.emplace_back(message);
    while (m_log_lines.size() > kMaxLogLines) {
      m_log_lines.pop_front();
    }
  }
  m_screen.Post(Event::Custom);
}

void UI::start_job(Job job, std::string status,
                   std::function<void(const std::stop_token&)> work) {
  Job expected = Job::Idle;
  if (!m_job.compare_exchange_strong(expected, job)) {
    return;
  }
  m_status = std::move(status);

  // Assigning over a finished jthread joins it.
  m_worker = std::jthread([self = shared_from_this(), work = std::move(work)](
                              const std::stop_token& stoken) {
    try {
      work(stoken);
    } catch (const std::exception& e) {
      IOManager::log(std::format("ERROR: {}", e.what()));
      self->m_screen.Post([self, message = std::string(e.what())] {
        self->m_status = "Failed: " + message;
      });
    }
    self->m_screen.Post([self] { self->m_job = Job::Idle; });
  });
}

void UI::scan() {
  start_job(Job::Scanning, "Scanning...", [this](const std::stop_token& stoken) {
    std::vector<PlanPreview> previews;
    for (const auto& task : m_engine.generate_plan(m_input_path, stoken)) {
      if (stoken.stop_requested()) {
        IOManager::log("Scan cancelled.");
        return;
      }
      previews.push_back(m_engine.preview(task));
    }
    m_screen.Post([this, previews = std::move(previews)]() mutable {
      on_scan_finished(std::move(previews));
    });
  });
}

void UI::on_scan_finished(std::vector<PlanPreview> previews) {
  m_rows.clear();
  m_cursor = 0;
  std::size_t dated = 0;
  for (auto& preview : previews) {
    const bool has_date = preview.date.has_value();
    dated += has_date ? 1 : 0;
    m_rows.push_back({std::move(preview), has_date, std::nullopt});
  }
  if (m_rows.empty()) {
    m_status = "No images found.";
  } else {
    m_status = std::format("{} images, {} with a date.", m_rows.size(), dated);
  }
}

void UI::apply_selection() {
  std::vector<ImageTask> tasks;
  for (const auto& row : m_rows) {
    if (row.selected) {
      tasks.push_back(row.preview.task);
    }
  }
  if (tasks.empty()) {
    m_status = "Nothing selected.";
    return;
  }

  const std::size_t count = tasks.size();
  start_job(Job::Watermarking, std::format("Watermarking {} images...", count),
            [this, tasks = std::move(tasks)](const std::stop_token& stoken) {
              BatchSummary summary = m_engine.run(tasks, stoken);
              m_screen.Post([this, summary = std::move(summary)]() mutable {
                on_batch_finished(std::move(summary));
              });
            });
}

void UI::on_batch_finished(BatchSummary summary) {
  for (auto& outcome : summary.outcomes) {
    auto row = std::find_if(m_rows.begin(), m_rows.end(),
                            [&](const ReviewRow& r) {
                              return r.preview.task.source_path ==
                                     outcome.task.source_path;
                            });
    if (row != m_rows.end()) {
      row->selected = false;
      row->outcome = std::move(outcome);
    }
  }
  m_status = std::format("{} written, {} skipped, {} failed -> {}",
                         summary.succeeded, summary.skipped, summary.failed,
                         safe_path_to_string(m_engine.writer().output_dir()));
}

void UI::select_all(bool selected) {
  for (auto& row : m_rows) {
    row.selected = selected && row.preview.date.has_value();
  }
}

void UI::quit() {
  IOManager::log("Quit requested.");
  m_worker.request_stop();
  m_screen.Exit();
}

bool UI::handle_event(const Event& event) {
  if (event.is_mouse()) return false;

  if (event == Event::Character('q') || event == Event::Escape) {
    quit();
    return true;
  }
  if (m_job != Job::Idle) {
    return false;
  }

  const int last = static_cast<int>(m_rows.size()) - 1;
  if (event == Event::ArrowUp || event == Event::Character('k')) {
    if (m_cursor > 0) --m_cursor;
  } else if (event == Event::ArrowDown || event == Event::Character('j')) {
    if (m_cursor < last) ++m_cursor;
  } else if (event == Event::Character(' ')) {
    if (m_rows.empty()) return true;
    ReviewRow& row = m_rows[m_cursor];
    if (row.preview.date) {
      row.selected = !row.selected;
    } else {
      m_status = "No capture date for this file.";
    }
  } else if (event == Event::Character('a')) {
    select_all(true);
  } else if (event == Event::Character('n')) {
    select_all(false);
  } else if (event == Event::Character('s')) {
    scan();
  } else if (event == Event::Return) {
    apply_selection();
  } else {
    return false;
  }
  return true;
}

std::string UI::selection_summary() const {
  const auto selected = std::count_if(
      m_rows.begin(), m_rows.end(),
      [](const ReviewRow& row) { return row.selected; });
  return std::format("{} of {} selected", selected, m_rows.size());
}

Element UI::render_list() const {
  if (m_rows.empty()) {
    return text("No images listed. Press 's' to scan.") | dim | center;
  }
  Elements lines;
  for (int i = 0; i < static_cast<int>(m_rows.size()); ++i) {
    const ReviewRow& row = m_rows[i];
    Element line = hbox({
        text(row.selected ? "[x] " : "[ ] "),
        text(safe_path_to_string(row.preview.task.source_path.filename())) |
            flex,
        text(row.preview.date ? row.preview.date->text : "no date") |
            size(WIDTH, EQUAL, 11),
        outcome_badge(row.outcome) | size(WIDTH, EQUAL, 9),
    });
    if (!row.preview.date) {
      line = line | dim;
    }
    if (i == m_cursor) {
      line = line | inverted | focus;
    }
    lines.push_back(std::move(line));
  }
  return vbox(std::move(lines)) | vscroll_indicator | frame;
}

Element UI::render_details() const {
  if (m_rows.empty()) {
    return text("");
  }
  const ReviewRow& row = m_rows[m_cursor];
  Elements lines;
  lines.push_back(labelled(
      "Source", text(safe_path_to_string(row.preview.task.source_path))));
  lines.push_back(labelled(
      "Output", text(safe_path_to_string(row.preview.task.output_path))));
  if (row.preview.date) {
    lines.push_back(labelled(
        "Date", text(std::format("{} from {}", row.preview.date->text,
                                 to_string(row.preview.date->source)))));
  } else {
    lines.push_back(
        labelled("Date", text(row.preview.problem) | color(Color::Yellow)));
  }
  if (row.outcome) {
    lines.push_back(labelled("Result", paragraph(row.outcome->message)));
  }
  return vbox(std::move(lines));
}

Element UI::render_log() {
  Elements lines;
  {
    std::scoped_lock lock(m_log_mutex);
    for (const auto& line : m_log_lines) {
      lines.push_back(text(line));
    }
  }
  if (!lines.empty()) {
    lines.back() = lines.back() | focus;
  }
  return vbox(std::move(lines)) | vscroll_indicator | frame;
}

void UI::run() {
  try {
    IOManager::set_log_handler(
        [this](std::string_view message) { append_log(message); });

    auto buttons = Container::Horizontal({
        Button(" Scan (s) ", [this] { scan(); }),
        Button(" Watermark (Enter) ", [this] { apply_selection(); }),
        Button(" Quit (q) ", [this] { quit(); }),
    });

    auto root = Renderer(buttons, [this, buttons] {
                  Element toolbar = buttons->Render();
                  if (m_job != Job::Idle) {
                    toolbar = toolbar | dim;
                  }
                  return vbox({
                             hbox({text(" Photo Watermark ") | bold, filler(),
                                   text(safe_path_to_string(m_input_path) +
                                        " ")}) |
                                 color(Color::White) | bgcolor(Color::Blue),
                             toolbar,
                             separator(),
                             render_list() | flex,
                             separator(),
                             render_details(),
                             separator(),
                             hbox({text(" " + m_status), filler(),
                                   text(selection_summary() + " ")}),
                             separator(),
                             render_log() | size(HEIGHT, EQUAL, 8),
                         }) |
                         border;
                }) |
                CatchEvent([this](Event event) { return handle_event(event); });

    scan();
    m_screen.Loop(root);

    m_worker.request_stop();
    m_worker = std::jthread();
    IOManager::set_log_handler(nullptr);

  } catch (const std::exception& e) {
    IOManager::set_log_handler(nullptr);
    IOManager::log(
        std::format("CRITICAL: Exception in UI::run(): {}", e.what()));
    throw;
  }
}
