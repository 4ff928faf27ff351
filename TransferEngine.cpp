#include "TransferEngine.hpp"

#include <algorithm>
#include <atomic>
#include <format>
#include <map>
#include <mutex>
#include <system_error>
#include <thread>

#include "FileClassifier.hpp"
#include "IOManager.hpp"
#include "utils.hpp"

namespace {
// The only state the workers share. Everything else a worker touches is
// either immutable (files, plan) or local to the task.
class SummaryAggregator {
 public:
  SummaryAggregator(std::size_t total, const ProgressCallback& progress)
      : m_total(total), m_progress(progress) {}

  void record(TransferOutcome outcome) {
    std::scoped_lock lock(m_mutex);
    ++m_done;
    if (m_progress) {
      m_progress(outcome, m_done, m_total);
    }
    if (outcome.success) {
      ++m_summary.succeeded;
    } else {
      m_summary.failed.push_back(std::move(outcome));
    }
  }

  TransferSummary take() {
    std::scoped_lock lock(m_mutex);
    std::sort(m_summary.failed.begin(), m_summary.failed.end(),
              [](const TransferOutcome& a, const TransferOutcome& b) {
                return a.source < b.source;
              });
    return std::move(m_summary);
  }

 private:
  std::mutex m_mutex;
  TransferSummary m_summary;
  std::size_t m_done = 0;
  const std::size_t m_total;
  const ProgressCallback& m_progress;
};

// For each file, the earlier file that already claims its destination.
// Cards that roll over folders (100CANON, 101CANON) repeat file names, and
// without this the later copy would silently replace the earlier one.
std::vector<const fs::path*> find_destination_clashes(
    const std::vector<MediaFile>& files, const DestinationPlan& plan) {
  std::vector<const fs::path*> clashes(files.size(), nullptr);
  std::map<fs::path, const fs::path*> claimed;
  for (std::size_t i = 0; i < files.size(); ++i) {
    const auto target = TransferEngine::destination_for(files[i], plan);
    if (!target) continue;
    auto [it, inserted] = claimed.try_emplace(*target, &files[i].source);
    if (!inserted) {
      clashes[i] = it->second;
      IOManager::log(std::format(
          "Warning: {} and {} share the destination {}",
          safe_path_to_string(*it->second),
          safe_path_to_string(files[i].source), safe_path_to_string(*target)));
    }
  }
  return clashes;
}
}  // namespace

void copy_preserving_metadata(const fs::path& from, const fs::path& to) {
  fs::copy_file(from, to, fs::copy_options::overwrite_existing);

  std::error_code ec;
  const auto mtime = fs::last_write_time(from, ec);
  if (!ec) fs::last_write_time(to, mtime, ec);
  if (ec) {
    IOManager::log(std::format("Could not preserve modification time on '{}': {}",
                               safe_path_to_string(to), ec.message()));
    ec.clear();
  }

  const auto perms = fs::status(from, ec).permissions();
  if (!ec) fs::permissions(to, perms, ec);
  if (ec) {
    IOManager::log(std::format("Could not preserve permissions on '{}': {}",
                               safe_path_to_string(to), ec.message()));
  }
}

TransferEngine::TransferEngine(unsigned worker_count, CopyFunction copy)
    : m_worker_count(std::max(1u, worker_count)), m_copy(std::move(copy)) {}

std::optional<fs::path> TransferEngine::destination_for(
    const MediaFile& file, const DestinationPlan& plan) {
  fs::path root;
  switch (file.kind) {
    case MediaKind::PHOTO:
      root = plan.photo_root;
      break;
    case MediaKind::VIDEO:
      root = plan.video_root;
      break;
    case MediaKind::UNSUPPORTED:
      return std::nullopt;
  }
  return root / FileClassifier::subfolder_for(file.extension) /
         file.source.filename();
}

TransferOutcome TransferEngine::transfer_one(const MediaFile& file,
                                             const DestinationPlan& plan) const {
  TransferOutcome outcome{file.source, false, {}};

  const auto target = destination_for(file, plan);
  if (!target) {
    outcome.reason = "Unsupported file type";
    return outcome;
  }

  try {
    fs::create_directories(target->parent_path());
    m_copy(file.source, *target);
  } catch (const fs::filesystem_error& e) {
    outcome.reason = std::format("Copy failed: {}", e.what());
    IOManager::log(std::format("ERROR copying {}: {}",
                               safe_path_to_string(file.source), e.what()));
    return outcome;
  } catch (const std::exception& e) {
    outcome.reason = std::format("Copy failed: {}", e.what());
    IOManager::log(std::format("ERROR copying {}: {}",
                               safe_path_to_string(file.source), e.what()));
    return outcome;
  }

  std::error_code source_ec;
  std::error_code target_ec;
  const auto source_size = fs::file_size(file.source, source_ec);
  const auto target_size = fs::file_size(*target, target_ec);
  if (source_ec || target_ec) {
    outcome.reason = std::format(
        "Verification failed: {}",
        (source_ec ? source_ec : target_ec).message());
    IOManager::log(std::format("ERROR verifying {}: {}",
                               safe_path_to_string(file.source),
                               outcome.reason));
    return outcome;
  }
  if (source_size != target_size) {
    outcome.reason =
        std::format("Size mismatch: source {} bytes, destination {} bytes",
                    source_size, target_size);
    IOManager::log(std::format("Warning: Size mismatch for {}",
                               safe_path_to_string(file.source.filename())));
    return outcome;
  }

  outcome.success = true;
  return outcome;
}

TransferSummary TransferEngine::run(const std::vector<MediaFile>& files,
                                    const DestinationPlan& plan,
                                    const ProgressCallback& progress) const {
  SummaryAggregator aggregator(files.size(), progress);
  if (files.empty()) {
    IOManager::log("Nothing to transfer.");
    return aggregator.take();
  }

  const std::size_t worker_count =
      std::min<std::size_t>(m_worker_count, files.size());
  IOManager::log(std::format("Transferring {} files on {} threads...",
                             files.size(), worker_count));

  const auto clashes = find_destination_clashes(files, plan);

  std::atomic<std::size_t> next{0};
  {
    std::vector<std::jthread> workers;
    workers.reserve(worker_count);
    for (std::size_t w = 0; w < worker_count; ++w) {
      workers.emplace_back([&] {
        for (std::size_t i = next.fetch_add(1); i < files.size();
             i = next.fetch_add(1)) {
          if (clashes[i]) {
            aggregator.record(TransferOutcome{
                files[i].source, false,
                std::format("Duplicate destination: already written from {}",
                            safe_path_to_string(*clashes[i]))});
            continue;
          }
          aggregator.record(transfer_one(files[i], plan));
        }
      });
    }
  }

  TransferSummary summary = aggregator.take();
  IOManager::log(std::format(
      "Successfully transferred {} files, skipped {} files.",
      summary.succeeded, summary.failed.size()));
  return summary;
}
