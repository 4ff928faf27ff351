#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

struct Config {
  std::set<std::string> photo_extensions = {".jpg", ".jpeg", ".cr2",
                                            ".nef", ".arw",  ".dng",
                                            ".cr3", ".raf",  ".gpr"};
  std::set<std::string> video_extensions = {".mp4", ".mov", ".avi", ".mkv"};
  // 0 means "use std::thread::hardware_concurrency()".
  unsigned probe_threads = 0;
  unsigned transfer_threads = 0;
};

inline void from_json(const json& j, Config& c) {
  if (j.contains("photo_extensions")) {
    j.at("photo_extensions").get_to(c.photo_extensions);
  }
  if (j.contains("video_extensions")) {
    j.at("video_extensions").get_to(c.video_extensions);
  }
  if (j.contains("probe_threads")) {
    j.at("probe_threads").get_to(c.probe_threads);
  }
  if (j.contains("transfer_threads")) {
    j.at("transfer_threads").get_to(c.transfer_threads);
  }
}

enum class MediaKind { PHOTO, VIDEO, UNSUPPORTED };

struct MediaFile {
  fs::path source;
  std::string extension;  // lowercase, with the leading dot
  MediaKind kind = MediaKind::UNSUPPORTED;
};

// What a single metadata probe found. Both fields are empty when the
// back end failed for any reason.
struct ProbeResult {
  std::optional<std::string> identity;
  std::optional<std::chrono::local_seconds> captured_at;
};

// Inclusive calendar window, start <= end.
struct DateWindow {
  std::chrono::year_month_day start;
  std::chrono::year_month_day end;
};

struct DestinationPlan {
  fs::path event_root;
  fs::path photo_root;
  fs::path video_root;
  fs::path graphics_root;
  std::vector<fs::path> video_aux_folders;
};

struct TransferOutcome {
  fs::path source;
  bool success = false;
  std::string reason;
};

struct TransferSummary {
  std::size_t succeeded = 0;
  std::vector<TransferOutcome> failed;

  std::size_t total() const { return succeeded + failed.size(); }
};
