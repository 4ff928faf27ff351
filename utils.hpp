#pragma once

#include <algorithm>
#include <filesystem>
#include <string>
#include <string_view>
#include <thread>

namespace fs = std::filesystem;

// A central, thread-safe utility to convert a std::filesystem::path to a
// UTF-8 encoded std::string, suitable for logging and display.
inline std::string safe_path_to_string(const fs::path& p) {
  // path::u8string() is locale-independent and returns a UTF-8 encoded string.
  // On C++20/23, this returns a std::u8string, which needs to be converted.
  auto u8str = p.u8string();
  return std::string(reinterpret_cast<const char*>(u8str.c_str()),
                     u8str.length());
}

// Builds a path from a UTF-8 std::string (the inverse of the above).
inline fs::path utf8_to_path(std::string_view sv) {
  return fs::path(std::u8string(reinterpret_cast<const char8_t*>(sv.data()),
                                sv.length()));
}

// A simple, locale-independent function to convert a string to lowercase.
// It only handles basic ASCII characters, which is safe and sufficient for
// things like file extensions and common keywords.
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

inline std::string string_to_upper_ascii(std::string_view sv) {
  std::string result;
  result.reserve(sv.length());
  for (char c : sv) {
    if (c >= 'a' && c <= 'z') {
      result += static_cast<char>(c - ('a' - 'A'));
    } else {
      result += c;
    }
  }
  return result;
}

inline std::string trim_ascii(std::string_view sv) {
  constexpr std::string_view whitespace = " \t\r\n\v\f";
  const auto first = sv.find_first_not_of(whitespace);
  if (first == std::string_view::npos) return {};
  const auto last = sv.find_last_not_of(whitespace);
  return std::string(sv.substr(first, last - first + 1));
}

// Maps a configured thread count to a usable one; 0 means "match the host".
inline unsigned resolve_thread_count(unsigned configured) {
  if (configured > 0) return configured;
  return std::max(1u, std::thread::hardware_concurrency());
}
