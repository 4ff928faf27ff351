#include "FileClassifier.hpp"

#include "utils.hpp"

FileClassifier::FileClassifier(const Config& config) : m_config(config) {}

std::string FileClassifier::extension_of(const fs::path& path) {
  return string_to_lower_ascii(safe_path_to_string(path.extension()));
}

MediaKind FileClassifier::classify(const fs::path& path) const {
  const std::string ext = extension_of(path);
  if (ext.empty()) return MediaKind::UNSUPPORTED;
  if (m_config.photo_extensions.contains(ext)) return MediaKind::PHOTO;
  if (m_config.video_extensions.contains(ext)) return MediaKind::VIDEO;
  return MediaKind::UNSUPPORTED;
}

MediaFile FileClassifier::describe(const fs::path& path) const {
  return MediaFile{path, extension_of(path), classify(path)};
}

bool FileClassifier::is_excluded(const fs::path& path) {
  const std::string name = safe_path_to_string(path.filename());
  return name.starts_with('.') || name.starts_with('_');
}

std::string FileClassifier::subfolder_for(std::string_view extension) {
  if (extension.starts_with('.')) extension.remove_prefix(1);
  return string_to_upper_ascii(extension);
}
