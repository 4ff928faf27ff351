#include "DestinationPlanner.hpp"

#include <algorithm>
#include <format>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {
void ensure_directory(const fs::path& dir) {
  if (fs::create_directories(dir)) {
    IOManager::log(
        std::format("[DIR] Creating directory: '{}'", safe_path_to_string(dir)));
  }
}
}  // namespace

std::string DestinationPlanner::folder_suffix(std::string_view identity,
                                              std::string_view user_name) {
  std::string suffix = std::format("{}_{}", identity, user_name);
  std::replace(suffix.begin(), suffix.end(), ' ', '_');
  return suffix;
}

DestinationPlan DestinationPlanner::plan(const fs::path& event_root,
                                         std::string_view identity,
                                         std::string_view user_name) {
  const fs::path suffix = utf8_to_path(folder_suffix(identity, user_name));
  const fs::path videography = event_root / "Videography";

  DestinationPlan plan;
  plan.event_root = event_root;
  plan.graphics_root = event_root / "Graphics";
  plan.photo_root = event_root / "Photography" / suffix;
  plan.video_root = videography / suffix;
  plan.video_aux_folders = {videography / "EXPORT",
                            videography / "Project Files",
                            videography / "VFX + SFX Folder"};

  ensure_directory(plan.graphics_root);
  return plan;
}

void DestinationPlanner::prepare(const DestinationPlan& plan,
                                 const std::vector<MediaFile>& files) {
  const bool has_photos =
      std::any_of(files.begin(), files.end(), [](const MediaFile& f) {
        return f.kind == MediaKind::PHOTO;
      });
  const bool has_videos =
      std::any_of(files.begin(), files.end(), [](const MediaFile& f) {
        return f.kind == MediaKind::VIDEO;
      });

  if (has_photos) {
    ensure_directory(plan.photo_root);
  }
  if (has_videos) {
    ensure_directory(plan.video_root);
    for (const auto& folder : plan.video_aux_folders) {
      ensure_directory(folder);
    }
  }
}
