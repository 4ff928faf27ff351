#include "DateFilter.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <vector>

#include "utils.hpp"

namespace {
std::vector<std::string_view> split(std::string_view sv, char delimiter) {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  while (true) {
    const auto pos = sv.find(delimiter, start);
    if (pos == std::string_view::npos) {
      parts.push_back(sv.substr(start));
      break;
    }
    parts.push_back(sv.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

std::string normalize_dashes(std::string_view text) {
  static constexpr std::string_view kEnDash = "\xE2\x80\x93";
  static constexpr std::string_view kEmDash = "\xE2\x80\x94";

  std::string result(text);
  for (auto dash : {kEnDash, kEmDash}) {
    std::size_t pos = 0;
    while ((pos = result.find(dash, pos)) != std::string::npos) {
      result.replace(pos, dash.length(), "-");
      ++pos;
    }
  }
  return result;
}

bool is_digits(std::string_view sv) {
  return std::all_of(sv.begin(), sv.end(),
                     [](char c) { return c >= '0' && c <= '9'; });
}

bool parse_number(std::string_view sv, std::size_t min_digits,
                  std::size_t max_digits, int& out) {
  if (sv.length() < min_digits || sv.length() > max_digits) return false;
  if (!is_digits(sv)) return false;
  const auto* first = sv.data();
  const auto* last = sv.data() + sv.length();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}
}  // namespace

std::expected<std::chrono::year_month_day, std::string> DateFilter::parse_date(
    std::string_view text) {
  const std::string trimmed = trim_ascii(text);
  const auto parts = split(trimmed, '/');
  if (parts.size() != 3) {
    return std::unexpected(
        std::format("'{}' is not a date in DD/MM/YYYY format", trimmed));
  }

  int day = 0;
  int month = 0;
  int year = 0;
  // Day and month take one or two digits, the year exactly four.
  if (!parse_number(parts[0], 1, 2, day) ||
      !parse_number(parts[1], 1, 2, month) ||
      !parse_number(parts[2], 4, 4, year)) {
    return std::unexpected(
        std::format("'{}' is not a date in DD/MM/YYYY format", trimmed));
  }

  const std::chrono::year_month_day date{
      std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
      std::chrono::day{static_cast<unsigned>(day)}};
  if (!date.ok()) {
    return std::unexpected(
        std::format("'{}' is not a valid calendar date", trimmed));
  }
  return date;
}

std::expected<DateWindow, std::string> DateFilter::parse(
    std::string_view text) {
  const std::string normalized = normalize_dashes(text);

  if (normalized.find('-') == std::string::npos) {
    auto single = parse_date(normalized);
    if (!single) return std::unexpected(single.error());
    return DateWindow{*single, *single};
  }

  const auto parts = split(normalized, '-');
  if (parts.size() != 2) {
    return std::unexpected(std::string(
        "Invalid range format. Use 'DD/MM/YYYY - DD/MM/YYYY'."));
  }

  auto start = parse_date(parts[0]);
  if (!start) return std::unexpected(start.error());
  auto end = parse_date(parts[1]);
  if (!end) return std::unexpected(end.error());

  if (*end < *start) {
    return std::unexpected(
        std::format("Range end {} is before its start {}",
                    format_window(DateWindow{*end, *end}),
                    format_window(DateWindow{*start, *start})));
  }
  return DateWindow{*start, *end};
}

bool DateFilter::includes(const DateWindow& window,
                          std::chrono::year_month_day date) {
  return window.start <= date && date <= window.end;
}

std::string DateFilter::format_window(const DateWindow& window) {
  auto format_date = [](std::chrono::year_month_day d) {
    return std::format("{:02}/{:02}/{:04}", static_cast<unsigned>(d.day()),
                       static_cast<unsigned>(d.month()),
                       static_cast<int>(d.year()));
  };
  if (window.start == window.end) return format_date(window.start);
  return std::format("{} - {}", format_date(window.start),
                     format_date(window.end));
}
