#pragma once

#include <chrono>
#include <optional>
#include <string_view>

#include "types.hpp"

// One metadata extraction attempt against one file. Implementations must not
// throw: any failure of the back end is reported as an empty ProbeResult.
class MetadataProbe {
 public:
  virtual ~MetadataProbe() = default;
  virtual ProbeResult probe(const fs::path& path) const = 0;
};

// Reads Exif.Image.Model and Exif.Photo.DateTimeOriginal through Exiv2.
// Exiv2::XmpParser::initialize() must have been called before the first
// probe runs on a worker thread.
class Exiv2Probe : public MetadataProbe {
 public:
  ProbeResult probe(const fs::path& path) const override;
};

// Accepts "YYYY:MM:DD HH:MM:SS" and "YYYY-MM-DD HH:MM:SS".
std::optional<std::chrono::local_seconds> parse_capture_timestamp(
    std::string_view text);

// Last write time of the file as a calendar date in the host's local time.
// Throws fs::filesystem_error if the file cannot be stat'ed.
std::chrono::year_month_day modification_date(const fs::path& path);

// The date a file was captured: the embedded timestamp for photos when the
// probe finds one, the modification date otherwise.
std::chrono::year_month_day capture_date(const MetadataProbe& probe,
                                         const MediaFile& file);
