#include "CommandLine.hpp"

#include <boost/program_options.hpp>
#include <format>
#include <sstream>

#include "IOManager.hpp"
#include "utils.hpp"

namespace po = boost::program_options;

namespace {
po::options_description build_options() {
  const WatermarkOptions defaults;

  po::options_description general("General");
  general.add_options()
    ("help,h", "Show this help and exit")
    ("config", po::value<std::string>(),
      "Load settings from a JSON template; explicit flags still win")
    ("save-config", po::value<std::string>(),
      "Write the effective settings to a JSON template")
    ("output,o", po::value<std::string>(),
      "Output directory (default: ./output)")
    ("log-file", po::value<std::string>(), "Append log lines to this file")
    ("dry-run", po::bool_switch(), "List what would be done, write nothing")
    ("interactive,i", po::bool_switch(),
      "Review the plan in a terminal UI before applying it")
    ("quiet,q", po::bool_switch(), "Do not echo log lines to stderr");

  po::options_description watermark("Watermark");
  watermark.add_options()
    ("position", po::value<std::string>()->default_value(defaults.position),
      "lt, rt, lb, rb, c, tc, bc, cl, cr or a long alias such as top-left")
    ("font-size", po::value<int>()->default_value(defaults.font_size),
      "Font size in pixels")
    ("auto-size", po::value<double>()->default_value(defaults.auto_size),
      "Font size as a ratio of the shorter image edge; overrides --font-size")
    ("color", po::value<std::string>()->default_value(defaults.color),
      "Text colour: #RRGGBB, #RGB, rgb(r,g,b) or a colour name")
    ("opacity", po::value<int>()->default_value(defaults.opacity),
      "Opacity 0-255")
    ("margin", po::value<int>()->default_value(defaults.margin),
      "Distance from the image edge in pixels")
    ("font", po::value<std::string>(),
      "TrueType/OpenType font file (default: search system fonts)")
    ("stroke-width", po::value<int>()->default_value(defaults.stroke_width),
      "Outline width in pixels, 0 disables")
    ("stroke-color",
      po::value<std::string>()->default_value(defaults.stroke_color),
      "Outline colour")
    ("shadow-dx", po::value<int>()->default_value(defaults.shadow_dx),
      "Horizontal drop shadow offset in pixels, -50 to 50 (write negative "
      "values as --shadow-dx=-2)")
    ("shadow-dy", po::value<int>()->default_value(defaults.shadow_dy),
      "Vertical drop shadow offset in pixels; 0 for both disables the shadow")
    ("shadow-color",
      po::value<std::string>()->default_value(defaults.shadow_color),
      "Drop shadow colour")
    ("fallback-mtime", po::bool_switch(),
      "Use the file modification date when there is no EXIF date")
    ("jpeg-quality", po::value<int>()->default_value(defaults.jpeg_quality),
      "JPEG/WebP quality 1-100")
    ("strip-exif", po::bool_switch(),
      "Do not copy EXIF metadata into the output files");

  po::options_description all("Usage: photo_watermark [options] <path>");
  all.add(general).add(watermark);
  return all;
}

template <typename T>
void apply_if_given(const po::variables_map& vm, const char* key, T& target) {
  auto it = vm.find(key);
  if (it != vm.end() && !it->second.defaulted()) {
    target = it->second.as<T>();
  }
}

bool switch_given(const po::variables_map& vm, const char* key) {
  auto it = vm.find(key);
  return it != vm.end() && it->second.as<bool>();
}

std::optional<fs::path> path_option(const po::variables_map& vm,
                                    const char* key) {
  auto it = vm.find(key);
  if (it == vm.end()) return std::nullopt;
  return path_from_utf8(it->second.as<std::string>());
}
}  // namespace

std::string CommandLine::usage() {
  std::ostringstream out;
  out << build_options();
  return out.str();
}

CliRequest CommandLine::parse(int argc, const char* const argv[]) {
  po::options_description all = build_options();
  all.add_options()("path", po::value<std::string>(), "Input file or directory");
  po::positional_options_description positional;
  positional.add("path", 1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw WatermarkError(ErrorKind::InvalidOption, e.what());
  }

  CliRequest request;
  if (vm.count("help")) {
    request.show_help = true;
    return request;
  }

  auto input = path_option(vm, "path");
  if (!input) {
    throw WatermarkError(ErrorKind::InvalidOption,
                         "Missing input path (a file or a directory)");
  }
  request.input = *input;

  request.config_file = path_option(vm, "config");
  request.save_config = path_option(vm, "save-config");
  request.log_file = path_option(vm, "log-file");
  request.dry_run = switch_given(vm, "dry-run");
  request.interactive = switch_given(vm, "interactive");
  request.quiet = switch_given(vm, "quiet");

  WatermarkOptions& options = request.options;
  if (request.config_file) {
    auto loaded = IOManager::load_options(*request.config_file, options);
    if (!loaded) {
      throw WatermarkError(
          ErrorKind::InvalidOption,
          std::format("Cannot load settings template '{}'",
                      safe_path_to_string(*request.config_file)));
    }
    options = *loaded;
  }

  apply_if_given(vm, "position", options.position);
  apply_if_given(vm, "font-size", options.font_size);
  apply_if_given(vm, "auto-size", options.auto_size);
  apply_if_given(vm, "color", options.color);
  apply_if_given(vm, "opacity", options.opacity);
  apply_if_given(vm, "margin", options.margin);
  apply_if_given(vm, "font", options.font);
  apply_if_given(vm, "stroke-width", options.stroke_width);
  apply_if_given(vm, "stroke-color", options.stroke_color);
  apply_if_given(vm, "shadow-dx", options.shadow_dx);
  apply_if_given(vm, "shadow-dy", options.shadow_dy);
  apply_if_given(vm, "shadow-color", options.shadow_color);
  apply_if_given(vm, "jpeg-quality", options.jpeg_quality);
  apply_if_given(vm, "output", options.output_dir);
  if (switch_given(vm, "fallback-mtime")) {
    options.fallback_mtime = true;
  }
  if (switch_given(vm, "strip-exif")) {
    options.keep_exif = false;
  }
  return request;
}
