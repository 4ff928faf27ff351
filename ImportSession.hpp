#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "FileClassifier.hpp"
#include "MetadataProbe.hpp"
#include "TransferEngine.hpp"
#include "types.hpp"

struct ImportRequest {
  fs::path source_root;
  fs::path event_root;
  std::string user_name;
  std::optional<DateWindow> window;
};

// Asked for a camera model when none could be read from the photos.
using IdentityPrompt = std::function<std::string()>;

// Runs one import end to end: scan, identity race, planning, date filter,
// transfer. The identity stage always finishes before the transfer stage
// starts.
class ImportSession {
 public:
  ImportSession(const Config& config,
                std::shared_ptr<const MetadataProbe> probe,
                CopyFunction copy = copy_preserving_metadata);

  // Throws fs::filesystem_error when the source cannot be read or the
  // event folder cannot be written, and std::invalid_argument when the
  // prompt returns an empty identity. A stop request honoured before the
  // transfer stage yields an empty summary; once copying has started the
  // run completes.
  TransferSummary run(const ImportRequest& request,
                      const IdentityPrompt& ask_identity,
                      const ProgressCallback& progress = nullptr,
                      std::optional<std::stop_token> stoken = std::nullopt) const;

 private:
  std::optional<std::string> resolve_identity(
      const fs::path& source_root, const IdentityPrompt& ask_identity,
      std::optional<std::stop_token> stoken) const;

  const Config& m_config;
  FileClassifier m_classifier;
  std::shared_ptr<const MetadataProbe> m_probe;
  CopyFunction m_copy;
};
