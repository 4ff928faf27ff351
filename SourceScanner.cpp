#include "SourceScanner.hpp"

#include <algorithm>
#include <cstdint>
#include <execution>
#include <format>
#include <system_error>

#include "DateFilter.hpp"
#include "IOManager.hpp"
#include "utils.hpp"

SourceScanner::SourceScanner(const FileClassifier& classifier)
    : m_classifier(classifier) {}

std::vector<MediaFile> SourceScanner::scan(const fs::path& root) const {
  if (!fs::is_directory(root)) {
    throw fs::filesystem_error(
        "Source folder is not a readable directory", root,
        std::make_error_code(std::errc::not_a_directory));
  }

  std::vector<MediaFile> files;
  try {
    for (const auto& entry : fs::recursive_directory_iterator(
             root, fs::directory_options::skip_permission_denied)) {
      if (!entry.is_regular_file()) continue;
      if (FileClassifier::is_excluded(entry.path())) continue;
      files.push_back(m_classifier.describe(entry.path()));
    }
  } catch (const fs::filesystem_error& e) {
    IOManager::log(std::format("Error during directory scan of '{}': {}",
                               safe_path_to_string(root), e.what()));
    throw;
  }

  std::sort(files.begin(), files.end(),
            [](const MediaFile& a, const MediaFile& b) {
              return a.source < b.source;
            });
  return files;
}

std::vector<fs::path> SourceScanner::photo_candidates(
    const std::vector<MediaFile>& files) {
  std::vector<fs::path> candidates;
  for (const auto& file : files) {
    if (file.kind == MediaKind::PHOTO) candidates.push_back(file.source);
  }
  return candidates;
}

std::vector<MediaFile> SourceScanner::filter_by_date(
    const std::vector<MediaFile>& files,
    const std::optional<DateWindow>& window, const MetadataProbe& probe) {
  if (!window) return files;

  // One flag per input file; workers only ever touch their own slot.
  std::vector<std::uint8_t> keep(files.size(), 0);
  std::vector<std::size_t> indices(files.size());
  for (std::size_t i = 0; i < indices.size(); ++i) indices[i] = i;

  std::for_each(std::execution::par, indices.begin(), indices.end(),
                [&](std::size_t i) {
                  try {
                    const auto date = capture_date(probe, files[i]);
                    keep[i] = DateFilter::includes(*window, date) ? 1 : 0;
                  } catch (const fs::filesystem_error& e) {
                    IOManager::log(std::format(
                        "Warning: cannot determine the date of '{}': {}. "
                        "Skipping.",
                        safe_path_to_string(files[i].source), e.what()));
                  }
                });

  std::vector<MediaFile> selected;
  for (std::size_t i = 0; i < files.size(); ++i) {
    if (keep[i]) selected.push_back(files[i]);
  }

  IOManager::log(std::format("Date filter {} kept {} of {} files.",
                             DateFilter::format_window(*window),
                             selected.size(), files.size()));
  return selected;
}
