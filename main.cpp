#include <exception>
#include <exiv2/exiv2.hpp>
#include <format>
#include <memory>
#include <print>
#include <vector>

#include "CommandLine.hpp"
#include "IOManager.hpp"
#include "Settings.hpp"
#include "UI.hpp"
#include "WatermarkEngine.hpp"
#include "utils.hpp"

namespace {
constexpr int kExitSetupFailure = 1;

void print_plan(const WatermarkEngine& engine,
                const std::vector<ImageTask>& plan) {
  for (const auto& task : plan) {
    const PlanPreview item = engine.preview(task);
    if (item.date) {
      std::println("{} -> {}  [{} from {}]",
                   safe_path_to_string(task.source_path),
                   safe_path_to_string(task.output_path), item.date->text,
                   to_string(item.date->source));
    } else {
      std::println("{}  [skip: {}]", safe_path_to_string(task.source_path),
                   item.problem);
    }
  }
}

// Per-file skips and failures are reported in the summary, not the exit code.
void run_batch(const CliRequest& request, const WatermarkConfig& config,
              const fs::path& outputDir) {
  WatermarkEngine engine(config, outputDir);
  const std::vector<ImageTask> plan = engine.generate_plan(request.input);

  if (request.dry_run) {
    print_plan(engine, plan);
    return;
  }

  const BatchSummary summary = engine.run(plan);
  if (plan.empty()) {
    std::println("No images to watermark.");
    return;
  }
  std::println("Watermarked {} of {} images ({} skipped, {} failed). Output: {}",
               summary.succeeded, summary.total(), summary.skipped,
               summary.failed, safe_path_to_string(outputDir));
}
}  // namespace

int main(int argc, char* argv[]) {
  Exiv2::XmpParser::initialize();

  IOManager::set_log_handler([](std::string_view message) {
    std::println(stderr, "{}", message);
  });

  int exit_code = 0;
  try {
    const CliRequest request = CommandLine::parse(argc, argv);
    if (request.show_help) {
      std::println("{}", CommandLine::usage());
      IOManager::set_log_handler(nullptr);
      Exiv2::XmpParser::terminate();
      return 0;
    }

    IOManager::initialize_logger(request.log_file);
    if (request.quiet || request.interactive) {
      IOManager::set_log_handler(nullptr);
    }
    IOManager::log("--- Photo Watermark Started ---");

    const WatermarkConfig config = Settings::make_config(request.options);
    const fs::path outputDir = Settings::resolve_output_dir(request.options);
    IOManager::log(std::format("Output directory: {}",
                               safe_path_to_string(outputDir)));

    if (request.save_config &&
        !IOManager::save_options(*request.save_config, request.options)) {
      throw WatermarkError(ErrorKind::InvalidOption,
                           std::format("Cannot write settings template '{}'",
                                       safe_path_to_string(*request.save_config)));
    }

    if (request.interactive) {
      IOManager::log("Initializing UI...");
      auto application =
          std::make_shared<UI>(config, outputDir, request.input);
      application->run();
    } else {
      run_batch(request, config, outputDir);
    }

    IOManager::log("--- Photo Watermark Exited ---");

  } catch (const WatermarkError& e) {
    IOManager::log(std::format("CRITICAL: {}", e.what()));
    if (!IOManager::has_log_handler()) {
      std::println(stderr, "Error: {}", e.what());
    }
    if (e.kind() == ErrorKind::InvalidOption ||
        e.kind() == ErrorKind::InvalidPosition) {
      std::println(stderr, "Run with --help for usage.");
    }
    exit_code = kExitSetupFailure;
  } catch (const std::exception& e) {
    IOManager::log(std::format("FATAL EXCEPTION: {}", e.what()));
    if (!IOManager::has_log_handler()) {
      std::println(stderr, "Fatal error: {}", e.what());
    }
    exit_code = kExitSetupFailure;
  }

  IOManager::set_log_handler(nullptr);
  Exiv2::XmpParser::terminate();
  return exit_code;
}
