#include "discovery/camera_registry.hpp"

#include <algorithm>
#include <tuple>
#include <utility>

namespace camscout::discovery {

CameraRegistry::CameraRegistry()
    : current_(std::make_shared<const std::vector<DiscoveredCamera>>()) {}

CameraRegistry::Snapshot CameraRegistry::Get() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

std::vector<DiscoveredCamera> CameraRegistry::SnapshotCopy() const {
  return *Get();
}

void CameraRegistry::Replace(std::vector<DiscoveredCamera> cameras) {
  std::sort(cameras.begin(), cameras.end(),
            [](const DiscoveredCamera& lhs, const DiscoveredCamera& rhs) {
              return std::tie(lhs.discovered_at, lhs.host, lhs.port) <
                     std::tie(rhs.discovered_at, rhs.host, rhs.port);
            });
  // Built outside the lock; the swap is the only critical section.
  Snapshot next = std::make_shared<const std::vector<DiscoveredCamera>>(std::move(cameras));
  std::lock_guard<std::mutex> lock(mutex_);
  current_.swap(next);
  ++generation_;
}

std::uint64_t CameraRegistry::Generation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation_;
}

std::optional<DiscoveredCamera> CameraRegistry::Find(std::string_view host,
                                                     const std::uint16_t port) const {
  const Snapshot snapshot = Get();
  const auto it = std::find_if(snapshot->begin(), snapshot->end(),
                               [host, port](const DiscoveredCamera& camera) {
                                 return camera.host == host && camera.port == port;
                               });
  if (it == snapshot->end()) {
    return std::nullopt;
  }
  return *it;
}

} // namespace camscout::discovery
