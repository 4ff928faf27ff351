#pragma once

#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "MetadataProbe.hpp"

// Discovers the camera identity shared by a batch of photos.
//
// resolve_first() races one probe per candidate on up to max_concurrency
// threads and returns whichever non-empty identity is observed first. The
// winner depends on completion order, not on candidate order. Once a winner
// is chosen no further probe is started; probes already running are left to
// finish on their own and their results are discarded, so the call never
// waits for a slow or hung probe after a winner exists.
//
// collect_all() probes every candidate and returns the distinct identities,
// sorted, for callers that want to let the user choose.
class CameraIdentityResolver {
 public:
  CameraIdentityResolver(std::shared_ptr<const MetadataProbe> probe,
                         unsigned max_concurrency);

  std::optional<std::string> resolve_first(
      const std::vector<fs::path>& candidates,
      std::optional<std::stop_token> stoken = std::nullopt) const;

  std::vector<std::string> collect_all(
      const std::vector<fs::path>& candidates,
      std::optional<std::stop_token> stoken = std::nullopt) const;

 private:
  std::shared_ptr<const MetadataProbe> m_probe;
  unsigned m_max_concurrency;
};
