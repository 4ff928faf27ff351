#pragma once

#include <string>

#include "types.hpp"

// Maps file extensions to media kinds using the configured extension sets.
class FileClassifier {
 public:
  explicit FileClassifier(const Config& config);

  MediaKind classify(const fs::path& path) const;
  MediaFile describe(const fs::path& path) const;

  // Hidden files and files whose name starts with '_' are never imported.
  static bool is_excluded(const fs::path& path);

  // Name of the per-extension subfolder, e.g. ".cr2" -> "CR2".
  static std::string subfolder_for(std::string_view extension);

 private:
  static std::string extension_of(const fs::path& path);

  const Config& m_config;
};
