#include "FontResolver.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <opencv2/freetype.hpp>
#include <opencv2/imgproc.hpp>

#include "utils.hpp"

namespace {
class FreeTypeFace : public TextFace {
 public:
  explicit FreeTypeFace(const fs::path& fontPath)
      : m_path(fontPath), m_ft2(cv::freetype::createFreeType2()) {
    m_ft2->loadFontData(safe_path_to_string(fontPath), 0);
  }

  std::string describe() const override {
    return std::format("font '{}'", safe_path_to_string(m_path));
  }

  cv::Size text_size(const std::string& text, int pixelHeight,
                     int* baseline) const override {
    return m_ft2->getTextSize(text, pixelHeight, -1, baseline);
  }

  void draw(cv::Mat& canvas, const std::string& text, cv::Point origin,
            int pixelHeight, const cv::Scalar& color,
            int grow) const override {
    m_ft2->putText(canvas, text, origin, pixelHeight, color, -1, cv::LINE_AA,
                   false);
    if (grow > 0) {
      m_ft2->putText(canvas, text, origin, pixelHeight, color, 2 * grow,
                     cv::LINE_AA, false);
    }
  }

 private:
  fs::path m_path;
  cv::Ptr<cv::freetype::FreeType2> m_ft2;
};

class HersheyFace : public TextFace {
 public:
  std::string describe() const override { return "built-in Hershey font"; }

  cv::Size text_size(const std::string& text, int pixelHeight,
                     int* baseline) const override {
    const int thickness = base_thickness(pixelHeight);
    return cv::getTextSize(text, kFontFace, scale_for(pixelHeight, thickness),
                           thickness, baseline);
  }

  void draw(cv::Mat& canvas, const std::string& text, cv::Point origin,
            int pixelHeight, const cv::Scalar& color,
            int grow) const override {
    const int thickness = base_thickness(pixelHeight);
    cv::putText(canvas, text, origin, kFontFace,
                scale_for(pixelHeight, thickness), color,
                thickness + 2 * grow, cv::LINE_AA);
  }

 private:
  static constexpr int kFontFace = cv::FONT_HERSHEY_SIMPLEX;

  static int base_thickness(int pixelHeight) {
    return std::max(1, static_cast<int>(std::lround(pixelHeight / 14.0)));
  }

  static double scale_for(int pixelHeight, int thickness) {
    return cv::getFontScaleFromHeight(kFontFace, pixelHeight, thickness);
  }
};
}  // namespace

FontResolver::FontResolver(std::vector<fs::path> systemCandidates)
    : m_system_candidates(std::move(systemCandidates)) {}

std::vector<fs::path> FontResolver::default_system_fonts() {
#ifdef _WIN32
  return {"C:\\Windows\\Fonts\\msyh.ttc", "C:\\Windows\\Fonts\\simhei.ttf",
          "C:\\Windows\\Fonts\\arial.ttf"};
#elif defined(__APPLE__)
  return {"/System/Library/Fonts/PingFang.ttc",
          "/System/Library/Fonts/Helvetica.ttc"};
#else
  return {"/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
          "/usr/share/fonts/TTF/DejaVuSans.ttf",
          "/usr/share/fonts/dejavu/DejaVuSans.ttf",
          "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
          "/usr/share/fonts/opentype/noto/NotoSansCJK-Regular.ttc"};
#endif
}

std::unique_ptr<TextFace> FontResolver::builtin_face() {
  return std::make_unique<HersheyFace>();
}

FontResolution FontResolver::resolve(
    const std::optional<fs::path>& requested) const {
  FontResolution result;

  auto try_load = [&](const fs::path& candidate) -> bool {
    try {
      result.face = std::make_unique<FreeTypeFace>(candidate);
      return true;
    } catch (const cv::Exception& e) {
      result.failures.push_back(std::format(
          "Cannot load font '{}': {}", safe_path_to_string(candidate),
          e.what()));
    }
    return false;
  };

  if (requested) {
    std::error_code ec;
    if (!fs::is_regular_file(*requested, ec)) {
      result.failures.push_back(std::format(
          "Font file '{}' not found", safe_path_to_string(*requested)));
    } else if (try_load(*requested)) {
      return result;
    }
  }

  for (const auto& candidate : m_system_candidates) {
    std::error_code ec;
    if (!fs::is_regular_file(candidate, ec)) continue;
    if (try_load(candidate)) {
      return result;
    }
  }

  result.face = builtin_face();
  return result;
}
