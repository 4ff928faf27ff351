#include <exception>
#include <exiv2/exiv2.hpp>
#include <format>
#include <memory>
#include <print>
#include <vector>

#include "IOManager.hpp"
#include "MetadataProbe.hpp"
#include "UI.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

int main(int argc, char* argv[]) {
  // Exiv2 is safe to use from several threads on distinct images once the
  // XMP parser has been initialized here, before any worker starts.
  Exiv2::XmpParser::initialize();

  try {
    IOManager::initialize_logger();
    IOManager::log("--- Camera Sorter Started ---");

    fs::path exePath;
    if (argc > 0) {
      exePath = fs::path(argv[0]).parent_path();
    }
    if (exePath.empty()) {
      exePath = fs::current_path();
    }

    std::vector<fs::path> configPaths = {exePath / "config.json",
                                         fs::current_path() / "config.json",
                                         exePath.parent_path() / "config.json"};

    Config config;
    bool config_found = false;
    for (const auto& configPath : configPaths) {
      IOManager::log(std::format("Trying config path: {}",
                                 safe_path_to_string(configPath)));
      if (!fs::exists(configPath)) continue;

      config_found = true;
      auto configOpt = IOManager::load_config(configPath);
      if (!configOpt) {
        IOManager::log("CRITICAL: Failed to load configuration.");
        std::println(stderr, "\n=== ERROR ===");
        std::println(stderr, "Failed to load {}!",
                     safe_path_to_string(configPath));
        std::println(stderr, "Check camera_sorter.log for details.");
        Exiv2::XmpParser::terminate();
        return 1;
      }
      config = *configOpt;
      IOManager::log(std::format("Configuration loaded successfully from: {}",
                                 safe_path_to_string(configPath)));
      break;
    }
    if (!config_found) {
      IOManager::log("No config.json found. Using built-in extension lists.");
    }

    IOManager::log("Initializing UI...");
    auto application =
        std::make_shared<UI>(config, std::make_shared<Exiv2Probe>());
    application->run();

    IOManager::log("--- Camera Sorter Exited Normally ---");

    Exiv2::XmpParser::terminate();
    return 0;

  } catch (const std::exception& e) {
    IOManager::log(std::format("FATAL EXCEPTION: {}", e.what()));
    std::println(stderr, "\n=== FATAL ERROR ===");
    std::println(stderr, "Exception: {}", e.what());
    std::println(stderr, "Check camera_sorter.log for details.");
    Exiv2::XmpParser::terminate();
    return 1;
  }
}
