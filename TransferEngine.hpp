#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

#include "types.hpp"

// Copies one file. Reports failure by throwing fs::filesystem_error.
using CopyFunction =
    std::function<void(const fs::path& from, const fs::path& to)>;

// Called once per finished file, from the worker that finished it. Calls
// are serialized and `done` increases by one on every call.
using ProgressCallback = std::function<void(
    const TransferOutcome& outcome, std::size_t done, std::size_t total)>;

// fs::copy_file, overwriting an existing destination, then carries over the
// modification time and permissions where the file system allows it.
void copy_preserving_metadata(const fs::path& from, const fs::path& to);

class TransferEngine {
 public:
  explicit TransferEngine(unsigned worker_count,
                          CopyFunction copy = copy_preserving_metadata);

  // Transfers every file on a fixed pool of worker threads. A file
  // succeeds when the copy reports no error and the destination has the
  // same size as the source. Unsupported files fail without touching the
  // destination. When two files map to the same destination, the first in
  // `files` order is copied and the others fail as duplicates. No per-file
  // failure stops the other files.
  TransferSummary run(const std::vector<MediaFile>& files,
                      const DestinationPlan& plan,
                      const ProgressCallback& progress = nullptr) const;

  // <photo_root|video_root>/<EXT>/<file name>, or nothing for unsupported
  // files.
  static std::optional<fs::path> destination_for(const MediaFile& file,
                                                 const DestinationPlan& plan);

 private:
  TransferOutcome transfer_one(const MediaFile& file,
                               const DestinationPlan& plan) const;

  unsigned m_worker_count;
  CopyFunction m_copy;
};
