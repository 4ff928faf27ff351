#pragma once

#include <optional>
#include <vector>

#include "FileClassifier.hpp"
#include "MetadataProbe.hpp"
#include "types.hpp"

class SourceScanner {
 public:
  explicit SourceScanner(const FileClassifier& classifier);

  // Recursively lists every importable file under root. Throws
  // fs::filesystem_error when root itself cannot be read.
  std::vector<MediaFile> scan(const fs::path& root) const;

  static std::vector<fs::path> photo_candidates(
      const std::vector<MediaFile>& files);

  // Keeps the files whose capture date lies inside window. Without a
  // window nothing is probed and every file is kept.
  static std::vector<MediaFile> filter_by_date(
      const std::vector<MediaFile>& files,
      const std::optional<DateWindow>& window, const MetadataProbe& probe);

 private:
  const FileClassifier& m_classifier;
};
