#pragma once

#include "discovery/camera_types.hpp"
#include "discovery/target_spec.hpp"

#include <cstdint>
#include <limits>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace camscout::discovery {

inline constexpr std::string_view kAutoTargets = "auto";
inline constexpr std::uint64_t kDefaultMaxHosts = 4096U;

// Resolves `auto` to the local scan network, then parses. Everything else is
// forwarded to ParseTargetSpec unchanged.
bool ResolveTargetSpec(std::string_view text, HostSet& hosts, std::string& error);

// Finite candidate space hosts x ports x paths. Candidates are produced by
// index, so iteration is restartable and the space is never materialized.
class CandidateSpace {
public:
  // Sequential cursor; cheap to copy, independent of other cursors.
  class Cursor {
  public:
    explicit Cursor(const CandidateSpace* space) : space_(space) {}

    bool Next(CameraCandidate& candidate);
    void Reset() {
      next_index_ = 0;
    }
    std::uint64_t Position() const {
      return next_index_;
    }

  private:
    const CandidateSpace* space_ = nullptr;
    std::uint64_t next_index_ = 0;
  };

  CandidateSpace() = default;
  CandidateSpace(HostSet hosts, std::vector<std::uint16_t> ports, std::vector<std::string> paths);

  std::uint64_t Size() const;
  bool Empty() const;

  // Host-major, then ascending port, then path in set order.
  bool At(std::uint64_t index, CameraCandidate& candidate) const;

  Cursor Begin() const {
    return Cursor(this);
  }

  std::vector<CameraCandidate> Materialize(
      std::uint64_t limit = std::numeric_limits<std::uint64_t>::max()) const;

  const HostSet& Hosts() const {
    return hosts_;
  }
  const std::vector<std::uint16_t>& Ports() const {
    return ports_;
  }
  const std::vector<std::string>& Paths() const {
    return paths_;
  }

private:
  HostSet hosts_;
  std::vector<std::uint16_t> ports_;
  std::vector<std::string> paths_;
};

// Leading `/` added where missing; an empty set becomes {"/"}.
std::vector<std::string> NormalizePaths(const std::set<std::string>& paths);

// Builds the candidate space for one scan. Empty targets or an empty port set
// give an empty space (not an error). Unparseable targets, port 0, more than
// `max_hosts` hosts, or a host name that does not resolve fail. Names are
// resolved here, so candidates always carry a numeric address.
bool BuildCandidateSpace(std::string_view targets, const std::set<std::uint16_t>& ports,
                         const std::set<std::string>& paths, std::uint64_t max_hosts,
                         CandidateSpace& space, std::string& error);

} // namespace camscout::discovery
