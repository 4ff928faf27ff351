#include "CameraIdentityResolver.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <format>
#include <functional>
#include <mutex>
#include <set>
#include <thread>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {
// Shared between the caller and the probe threads. The threads are
// detached, so whichever side finishes last releases it.
struct ProbeRace {
  ProbeRace(std::vector<fs::path> paths,
            std::shared_ptr<const MetadataProbe> metadata_probe,
            bool first_wins)
      : candidates(std::move(paths)),
        probe(std::move(metadata_probe)),
        stop_at_first(first_wins) {}

  const std::vector<fs::path> candidates;
  const std::shared_ptr<const MetadataProbe> probe;
  const bool stop_at_first;

  std::atomic<std::size_t> next{0};
  std::stop_source stop;

  std::mutex mutex;
  std::condition_variable changed;
  std::optional<std::string> winner;
  std::set<std::string> found;
  std::size_t workers_done = 0;
};

void run_probe_worker(const std::shared_ptr<ProbeRace>& race) {
  const std::stop_token stoken = race->stop.get_token();

  while (!stoken.stop_requested()) {
    const std::size_t i = race->next.fetch_add(1);
    if (i >= race->candidates.size()) break;

    auto identity = race->probe->probe(race->candidates[i]).identity;
    if (!identity) continue;
    std::string trimmed = trim_ascii(*identity);
    if (trimmed.empty()) continue;

    std::scoped_lock lock(race->mutex);
    if (stoken.stop_requested()) break;
    if (race->stop_at_first) {
      race->winner = std::move(trimmed);
      race->stop.request_stop();
      break;
    }
    race->found.insert(std::move(trimmed));
  }

  {
    std::scoped_lock lock(race->mutex);
    ++race->workers_done;
  }
  race->changed.notify_all();
}

std::shared_ptr<ProbeRace> start_race(
    const std::vector<fs::path>& candidates,
    const std::shared_ptr<const MetadataProbe>& probe, bool first_wins,
    std::size_t worker_count) {
  auto race = std::make_shared<ProbeRace>(candidates, probe, first_wins);
  for (std::size_t i = 0; i < worker_count; ++i) {
    std::thread([race] { run_probe_worker(race); }).detach();
  }
  return race;
}

// Forwards an external stop request into the race and wakes the waiter.
std::function<void()> stop_forwarder(const std::shared_ptr<ProbeRace>& race) {
  return [race] {
    {
      std::scoped_lock lock(race->mutex);
      race->stop.request_stop();
    }
    race->changed.notify_all();
  };
}
}  // namespace

CameraIdentityResolver::CameraIdentityResolver(
    std::shared_ptr<const MetadataProbe> probe, unsigned max_concurrency)
    : m_probe(std::move(probe)),
      m_max_concurrency(std::max(1u, max_concurrency)) {}

std::optional<std::string> CameraIdentityResolver::resolve_first(
    const std::vector<fs::path>& candidates,
    std::optional<std::stop_token> stoken) const {
  if (candidates.empty()) {
    IOManager::log("No photo files to read a camera model from.");
    return std::nullopt;
  }

  const std::size_t worker_count =
      std::min<std::size_t>(m_max_concurrency, candidates.size());
  IOManager::log(
      std::format("Scanning {} photo files for a camera model on {} threads...",
                  candidates.size(), worker_count));

  auto race = start_race(candidates, m_probe, true, worker_count);
  std::optional<std::stop_callback<std::function<void()>>> stop_link;
  if (stoken) stop_link.emplace(*stoken, stop_forwarder(race));

  std::optional<std::string> result;
  {
    std::unique_lock lock(race->mutex);
    race->changed.wait(lock, [&] {
      return race->winner || race->workers_done == worker_count ||
             race->stop.stop_requested();
    });
    result = race->winner;
    race->stop.request_stop();
  }

  if (result) {
    IOManager::log(std::format("Found camera model: {}", *result));
  } else if (stoken && stoken->stop_requested()) {
    IOManager::log("Camera model scan cancelled.");
  } else {
    IOManager::log("No camera model found in any photo file.");
  }
  return result;
}

std::vector<std::string> CameraIdentityResolver::collect_all(
    const std::vector<fs::path>& candidates,
    std::optional<std::stop_token> stoken) const {
  if (candidates.empty()) return {};

  const std::size_t worker_count =
      std::min<std::size_t>(m_max_concurrency, candidates.size());
  auto race = start_race(candidates, m_probe, false, worker_count);
  std::optional<std::stop_callback<std::function<void()>>> stop_link;
  if (stoken) stop_link.emplace(*stoken, stop_forwarder(race));

  std::vector<std::string> identities;
  {
    std::unique_lock lock(race->mutex);
    race->changed.wait(lock, [&] {
      return race->workers_done == worker_count ||
             race->stop.stop_requested();
    });
    identities.assign(race->found.begin(), race->found.end());
    race->stop.request_stop();
  }

  IOManager::log(std::format("Found {} distinct camera models.",
                             identities.size()));
  return identities;
}
