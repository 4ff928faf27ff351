#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

// Destination layout for one event:
//
//   <event>/Graphics
//   <event>/Photography/<identity>_<user>/<EXT>/...
//   <event>/Videography/<identity>_<user>/<EXT>/...
//   <event>/Videography/{EXPORT, Project Files, VFX + SFX Folder}
//
// Every directory is created with create_directories, so existing
// directories are never an error. Failing to create one throws
// fs::filesystem_error, which the caller treats as fatal.
namespace DestinationPlanner {
std::string folder_suffix(std::string_view identity,
                          std::string_view user_name);

// Computes the layout and creates the Graphics folder.
DestinationPlan plan(const fs::path& event_root, std::string_view identity,
                     std::string_view user_name);

// Creates the photo root when a photo is planned, and the video root plus
// the auxiliary video folders when a video is planned.
void prepare(const DestinationPlan& plan, const std::vector<MediaFile>& files);
}  // namespace DestinationPlanner
