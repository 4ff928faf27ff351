#pragma once

#include <functional>
#include <optional>
#include <string_view>

#include "types.hpp"

namespace IOManager {
void initialize_logger();

void set_log_handler(std::function<void(std::string_view)> handler);

void log(std::string_view message);
std::optional<Config> load_config(const fs::path& configPath);
}  // namespace IOManager
