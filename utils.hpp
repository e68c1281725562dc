#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// Converts a path to a UTF-8 std::string for logging and display.
inline std::string safe_path_to_string(const fs::path& p) {
  auto u8str = p.u8string();
  return std::string(reinterpret_cast<const char*>(u8str.c_str()),
                     u8str.length());
}

// Inverse of safe_path_to_string: builds a path from UTF-8 input such as a
// command-line argument or a JSON string.
inline fs::path path_from_utf8(std::string_view utf8) {
  return fs::path(std::u8string(
      reinterpret_cast<const char8_t*>(utf8.data()), utf8.size()));
}

// ASCII-only lowercase. Enough for extensions, option values and colour
// names.
inline std::string string_to_lower_ascii(std::string_view sv) {
  std::string result;
  result.reserve(sv.length());
  for (char c : sv) {
    if (c >= 'A' && c <= 'Z') {
      result += static_cast<char>(c + ('a' - 'A'));
    } else {
      result += c;
    }
  }
  return result;
}

inline std::string_view trim_ascii(std::string_view sv) {
  constexpr std::string_view kSpace = " \t\r\n\v\f";
  const auto first = sv.find_first_not_of(kSpace);
  if (first == std::string_view::npos) return {};
  const auto last = sv.find_last_not_of(kSpace);
  return sv.substr(first, last - first + 1);
}
