#pragma once

#include "discovery/camera_types.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace camscout::discovery {

// Published camera set. Readers take a shared pointer to an immutable vector,
// so a snapshot is always one complete generation. Replace() is the only
// mutation and is called by the coordinator when a scan completes.
class CameraRegistry {
public:
  using Snapshot = std::shared_ptr<const std::vector<DiscoveredCamera>>;

  CameraRegistry();

  // Ordered by discovered_at, then host, then port.
  Snapshot Get() const;
  std::vector<DiscoveredCamera> SnapshotCopy() const;

  void Replace(std::vector<DiscoveredCamera> cameras);

  // Number of Replace() calls so far.
  std::uint64_t Generation() const;

  std::optional<DiscoveredCamera> Find(std::string_view host, std::uint16_t port) const;

private:
  mutable std::mutex mutex_;
  Snapshot current_;
  std::uint64_t generation_ = 0;
};

} // namespace camscout::discovery
