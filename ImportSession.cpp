#include "ImportSession.hpp"

#include <format>
#include <stdexcept>

#include "CameraIdentityResolver.hpp"
#include "DateFilter.hpp"
#include "DestinationPlanner.hpp"
#include "IOManager.hpp"
#include "SourceScanner.hpp"
#include "utils.hpp"

ImportSession::ImportSession(const Config& config,
                             std::shared_ptr<const MetadataProbe> probe,
                             CopyFunction copy)
    : m_config(config),
      m_classifier(config),
      m_probe(std::move(probe)),
      m_copy(std::move(copy)) {}

std::optional<std::string> ImportSession::resolve_identity(
    const fs::path& source_root, const IdentityPrompt& ask_identity,
    std::optional<std::stop_token> stoken) const {
  IOManager::log("Gathering photo files for camera-model detection...");
  const SourceScanner scanner(m_classifier);
  const auto candidates =
      SourceScanner::photo_candidates(scanner.scan(source_root));

  const CameraIdentityResolver resolver(
      m_probe, resolve_thread_count(m_config.probe_threads));
  if (auto identity = resolver.resolve_first(candidates, stoken)) {
    return identity;
  }
  if (stoken && stoken->stop_requested()) return std::nullopt;

  IOManager::log("No camera model found. Asking for one.");
  std::string manual = trim_ascii(ask_identity());
  if (manual.empty() && stoken && stoken->stop_requested()) {
    return std::nullopt;
  }
  if (manual.empty()) {
    throw std::invalid_argument("A camera model is required to tag the files");
  }
  IOManager::log(std::format("Using camera model entered by user: {}", manual));
  return manual;
}

TransferSummary ImportSession::run(const ImportRequest& request,
                                   const IdentityPrompt& ask_identity,
                                   const ProgressCallback& progress,
                                   std::optional<std::stop_token> stoken) const {
  IOManager::log(std::format("Importing '{}' into '{}'",
                             safe_path_to_string(request.source_root),
                             safe_path_to_string(request.event_root)));

  const auto identity =
      resolve_identity(request.source_root, ask_identity, stoken);
  if (!identity || (stoken && stoken->stop_requested())) {
    IOManager::log("Import cancelled before any file was copied.");
    return {};
  }

  const DestinationPlan plan =
      DestinationPlanner::plan(request.event_root, *identity, request.user_name);

  IOManager::log("Building file list for transfer...");
  const SourceScanner scanner(m_classifier);
  const auto files = SourceScanner::filter_by_date(
      scanner.scan(request.source_root), request.window, *m_probe);

  DestinationPlanner::prepare(plan, files);
  IOManager::log(std::format("Found {} files to process.", files.size()));

  const TransferEngine engine(resolve_thread_count(m_config.transfer_threads),
                              m_copy);
  TransferSummary summary = engine.run(files, plan, progress);

  for (const auto& failure : summary.failed) {
    IOManager::log(std::format("Skipped {}: {}",
                               safe_path_to_string(failure.source.filename()),
                               failure.reason));
  }
  return summary;
}
