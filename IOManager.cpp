#include "IOManager.hpp"

#include <chrono>
#include <format>
#include <fstream>
#include <functional>
#include <mutex>

#include "utils.hpp"

namespace {
std::ofstream& get_log_stream() {
  static std::ofstream log_file("camera_sorter.log", std::ios_base::app);
  return log_file;
}

std::mutex log_mutex;

std::function<void(std::string_view)> g_log_handler = nullptr;

std::set<std::string> normalize_extensions(
    const std::set<std::string>& extensions) {
  std::set<std::string> normalized;
  for (const auto& ext : extensions) {
    std::string lower = string_to_lower_ascii(trim_ascii(ext));
    if (lower.empty()) continue;
    if (!lower.starts_with('.')) lower.insert(lower.begin(), '.');
    normalized.insert(std::move(lower));
  }
  return normalized;
}

}  // namespace

void IOManager::initialize_logger() { get_log_stream(); }

void IOManager::set_log_handler(std::function<void(std::string_view)> handler) {
  std::scoped_lock lock(log_mutex);
  g_log_handler = handler;
}

void IOManager::log(std::string_view message) {
  std::scoped_lock lock(log_mutex);

  auto now = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
  auto time_str = std::format("{:%Y-%m-%d %H:%M:%S}", now);
  std::string full_message = std::format("{} | {}", time_str, message);

  if (g_log_handler) {
    g_log_handler(full_message);
  }

  auto& log_stream = get_log_stream();
  if (log_stream.is_open()) {
    log_stream << full_message << "\n" << std::flush;
  }
}

std::optional<Config> IOManager::load_config(const fs::path& configPath) {
  if (!fs::exists(configPath)) {
    log(std::format("Error: Config file not found at {}",
                    safe_path_to_string(configPath)));
    return std::nullopt;
  }
  std::ifstream configFile(configPath);
  try {
    json configJson = json::parse(configFile);
    Config config = configJson.get<Config>();
    config.photo_extensions = normalize_extensions(config.photo_extensions);
    config.video_extensions = normalize_extensions(config.video_extensions);

    for (const auto& ext : config.photo_extensions) {
      if (config.video_extensions.contains(ext)) {
        log(std::format(
            "Error: extension '{}' is listed as both photo and video", ext));
        return std::nullopt;
      }
    }
    return config;
  } catch (const json::exception& e) {
    log(std::format("Error parsing config.json: {}", e.what()));
    return std::nullopt;
  }
}
