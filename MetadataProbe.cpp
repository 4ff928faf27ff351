#include "MetadataProbe.hpp"

#include <algorithm>
#include <charconv>
#include <ctime>
#include <exiv2/exiv2.hpp>
#include <format>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {
std::optional<std::string> read_exif_string(const Exiv2::ExifData& exifData,
                                            const char* key) {
  auto it = exifData.findKey(Exiv2::ExifKey(key));
  if (it == exifData.end()) return std::nullopt;

  std::string value = it->toString();
  // ASCII tags are NUL padded by some cameras.
  if (auto nul = value.find('\0'); nul != std::string::npos) {
    value.erase(nul);
  }
  value = trim_ascii(value);
  if (value.empty()) return std::nullopt;
  return value;
}

bool read_field(std::string_view text, std::size_t offset, std::size_t width,
                int& out) {
  const auto field = text.substr(offset, width);
  if (!std::all_of(field.begin(), field.end(),
                   [](char c) { return c >= '0' && c <= '9'; })) {
    return false;
  }
  const auto* first = field.data();
  const auto* last = first + field.length();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}
}  // namespace

ProbeResult Exiv2Probe::probe(const fs::path& path) const {
  ProbeResult result;
  try {
    Exiv2::Image::UniquePtr image =
        Exiv2::ImageFactory::open(safe_path_to_string(path));
    if (!image.get()) return result;
    image->readMetadata();
    const auto& exifData = image->exifData();
    if (exifData.empty()) return result;

    result.identity = read_exif_string(exifData, "Exif.Image.Model");
    if (auto date_str =
            read_exif_string(exifData, "Exif.Photo.DateTimeOriginal")) {
      result.captured_at = parse_capture_timestamp(*date_str);
    }
  } catch (const Exiv2::Error& e) {
    IOManager::log(std::format("Non-critical Exiv2 error reading '{}': {}",
                               safe_path_to_string(path), e.what()));
    return ProbeResult{};
  } catch (const std::exception& e) {
    IOManager::log(
        std::format("Non-critical standard exception reading '{}': {}",
                    safe_path_to_string(path), e.what()));
    return ProbeResult{};
  }
  return result;
}

std::optional<std::chrono::local_seconds> parse_capture_timestamp(
    std::string_view text) {
  const std::string trimmed = trim_ascii(text);
  const std::string_view sv = trimmed;
  if (sv.length() != 19) return std::nullopt;

  const char date_sep = sv[4];
  if ((date_sep != ':' && date_sep != '-') || sv[7] != date_sep ||
      sv[10] != ' ' || sv[13] != ':' || sv[16] != ':') {
    return std::nullopt;
  }

  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  if (!read_field(sv, 0, 4, year) || !read_field(sv, 5, 2, month) ||
      !read_field(sv, 8, 2, day) || !read_field(sv, 11, 2, hour) ||
      !read_field(sv, 14, 2, minute) || !read_field(sv, 17, 2, second)) {
    return std::nullopt;
  }

  const std::chrono::year_month_day date{
      std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
      std::chrono::day{static_cast<unsigned>(day)}};
  if (!date.ok() || hour > 23 || minute > 59 || second > 60) {
    return std::nullopt;
  }

  return std::chrono::local_days{date} + std::chrono::hours{hour} +
         std::chrono::minutes{minute} + std::chrono::seconds{second};
}

std::chrono::year_month_day modification_date(const fs::path& path) {
  const auto file_time = fs::last_write_time(path);
  const auto sys_time = std::chrono::time_point_cast<
      std::chrono::system_clock::duration>(
      std::chrono::file_clock::to_sys(file_time));
  const std::time_t t = std::chrono::system_clock::to_time_t(sys_time);

  std::tm local{};
#ifdef _WIN32
  localtime_s(&local, &t);
#else
  localtime_r(&t, &local);
#endif
  return std::chrono::year_month_day{
      std::chrono::year{local.tm_year + 1900},
      std::chrono::month{static_cast<unsigned>(local.tm_mon + 1)},
      std::chrono::day{static_cast<unsigned>(local.tm_mday)}};
}

std::chrono::year_month_day capture_date(const MetadataProbe& probe,
                                         const MediaFile& file) {
  if (file.kind == MediaKind::PHOTO) {
    if (auto captured = probe.probe(file.source).captured_at) {
      return std::chrono::year_month_day{
          std::chrono::floor<std::chrono::days>(*captured)};
    }
  }
  return modification_date(file.source);
}
