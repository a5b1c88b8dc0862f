#include "discovery/candidate_generator.hpp"

#include "discovery/local_network.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace camscout::discovery {

namespace {

bool IsAutoKeyword(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  if (text.size() != kAutoTargets.size()) {
    return false;
  }
  return std::equal(text.begin(), text.end(), kAutoTargets.begin(), [](char lhs, char rhs) {
    return std::tolower(static_cast<unsigned char>(lhs)) == rhs;
  });
}

} // namespace

bool ResolveTargetSpec(std::string_view text, HostSet& hosts, std::string& error) {
  if (!IsAutoKeyword(text)) {
    return ParseTargetSpec(text, hosts, error);
  }

  LocalIpv4Network network;
  if (!DetectLocalIpv4Network(network, error)) {
    return false;
  }
  return ParseTargetSpec(network.cidr, hosts, error);
}

bool CandidateSpace::Cursor::Next(CameraCandidate& candidate) {
  if (space_ == nullptr || !space_->At(next_index_, candidate)) {
    return false;
  }
  ++next_index_;
  return true;
}

CandidateSpace::CandidateSpace(HostSet hosts, std::vector<std::uint16_t> ports,
                               std::vector<std::string> paths)
    : hosts_(std::move(hosts)), ports_(std::move(ports)), paths_(std::move(paths)) {}

std::uint64_t CandidateSpace::Size() const {
  return hosts_.Size() * static_cast<std::uint64_t>(ports_.size()) *
         static_cast<std::uint64_t>(paths_.size());
}

bool CandidateSpace::Empty() const {
  return Size() == 0U;
}

bool CandidateSpace::At(const std::uint64_t index, CameraCandidate& candidate) const {
  if (index >= Size()) {
    return false;
  }
  const auto per_host = static_cast<std::uint64_t>(ports_.size() * paths_.size());
  const std::uint64_t host_index = index / per_host;
  const std::uint64_t within_host = index % per_host;
  const std::uint64_t port_index = within_host / paths_.size();
  const std::uint64_t path_index = within_host % paths_.size();

  std::string host;
  std::string address;
  if (!hosts_.HostAt(host_index, host, address)) {
    return false;
  }
  candidate.host = std::move(host);
  candidate.address = std::move(address);
  candidate.port = ports_[static_cast<std::size_t>(port_index)];
  candidate.path = paths_[static_cast<std::size_t>(path_index)];
  candidate.index = index;
  return true;
}

std::vector<CameraCandidate> CandidateSpace::Materialize(const std::uint64_t limit) const {
  std::vector<CameraCandidate> candidates;
  const std::uint64_t count = std::min(limit, Size());
  candidates.reserve(static_cast<std::size_t>(count));
  Cursor cursor = Begin();
  CameraCandidate candidate;
  while (candidates.size() < count && cursor.Next(candidate)) {
    candidates.push_back(candidate);
  }
  return candidates;
}

std::vector<std::string> NormalizePaths(const std::set<std::string>& paths) {
  std::set<std::string> normalized;
  for (const auto& path : paths) {
    if (path.empty() || path.front() != '/') {
      normalized.insert("/" + path);
    } else {
      normalized.insert(path);
    }
  }
  if (normalized.empty()) {
    normalized.insert("/");
  }
  return {normalized.begin(), normalized.end()};
}

bool BuildCandidateSpace(std::string_view targets, const std::set<std::uint16_t>& ports,
                         const std::set<std::string>& paths, const std::uint64_t max_hosts,
                         CandidateSpace& space, std::string& error) {
  if (ports.count(0U) != 0U) {
    error = "port 0 is not a valid probe port";
    return false;
  }

  HostSet hosts;
  if (!ResolveTargetSpec(targets, hosts, error)) {
    return false;
  }
  if (hosts.Size() > max_hosts) {
    error = "target set has " + std::to_string(hosts.Size()) + " hosts, more than max_hosts (" +
            std::to_string(max_hosts) + ")";
    return false;
  }
  if (!hosts.ResolveNames(error)) {
    return false;
  }

  space = CandidateSpace(std::move(hosts), std::vector<std::uint16_t>(ports.begin(), ports.end()),
                         NormalizePaths(paths));
  return true;
}

} // namespace camscout::discovery
