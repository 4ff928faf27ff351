#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <string_view>

#include "types.hpp"

// Parsing of the user's date filter. Accepted forms, day/month/year order:
//   "01/06/2024"
//   "01/06/2024 - 05/06/2024"   (also '-' without spaces, en dash, em dash)
// Empty input is not handled here; the caller decides that it means
// "no filter".
namespace DateFilter {
std::expected<DateWindow, std::string> parse(std::string_view text);

std::expected<std::chrono::year_month_day, std::string> parse_date(
    std::string_view text);

bool includes(const DateWindow& window, std::chrono::year_month_day date);

std::string format_window(const DateWindow& window);
}  // namespace DateFilter
