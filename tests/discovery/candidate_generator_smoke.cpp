#include "discovery/candidate_generator.hpp"
#include "discovery/local_network.hpp"
#include "discovery/target_spec.hpp"

#include "../common/assertions.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace {

using camscout::discovery::CameraCandidate;
using camscout::discovery::CandidateSpace;
using camscout::tests::common::AssertContains;
using camscout::tests::common::AssertEq;
using camscout::tests::common::AssertTrue;
using camscout::tests::common::Fail;

CandidateSpace BuildOrFail(const std::string& targets, const std::set<std::uint16_t>& ports,
                           const std::set<std::string>& paths) {
  CandidateSpace space;
  std::string error;
  if (!camscout::discovery::BuildCandidateSpace(targets, ports, paths,
                                                camscout::discovery::kDefaultMaxHosts, space,
                                                error)) {
    Fail("BuildCandidateSpace failed for '" + targets + "': " + error);
  }
  return space;
}

void AssertCandidate(const CameraCandidate& candidate, const std::string& host, std::uint16_t port,
                     const std::string& path) {
  if (candidate.host != host || candidate.port != port || candidate.path != path) {
    Fail("unexpected candidate " + candidate.host + ":" + std::to_string(candidate.port) +
         candidate.path + ", wanted " + host + ":" + std::to_string(port) + path);
  }
}

} // namespace

int main() {
  // Host-major, then ascending port, then path in set order.
  {
    const CandidateSpace space =
        BuildOrFail("10.0.0.5,10.0.0.6", {554, 80}, {"/stream", "/mjpeg"});
    AssertEq(space.Size(), 8U, "space size");
    const std::vector<CameraCandidate> all = space.Materialize();
    AssertEq(all.size(), 8U, "materialized size");
    AssertCandidate(all[0], "10.0.0.5", 80, "/mjpeg");
    AssertCandidate(all[1], "10.0.0.5", 80, "/stream");
    AssertCandidate(all[2], "10.0.0.5", 554, "/mjpeg");
    AssertCandidate(all[3], "10.0.0.5", 554, "/stream");
    AssertCandidate(all[4], "10.0.0.6", 80, "/mjpeg");
    AssertCandidate(all[7], "10.0.0.6", 554, "/stream");
    for (std::size_t i = 0; i < all.size(); ++i) {
      AssertEq(all[i].index, static_cast<std::uint64_t>(i), "candidate index");
    }

    // Restartable and idempotent: two cursors and random access agree.
    CandidateSpace::Cursor first = space.Begin();
    CandidateSpace::Cursor second = space.Begin();
    CameraCandidate lhs;
    CameraCandidate rhs;
    std::uint64_t count = 0;
    while (first.Next(lhs)) {
      AssertTrue(second.Next(rhs), "second cursor ended early");
      AssertTrue(lhs == rhs, "cursors disagree");
      CameraCandidate direct;
      AssertTrue(space.At(count, direct) && direct == lhs, "At() disagrees with cursor");
      ++count;
    }
    AssertEq(count, space.Size(), "cursor visit count");
    AssertTrue(!second.Next(rhs), "second cursor should be exhausted");
    first.Reset();
    AssertTrue(first.Next(lhs) && lhs == all[0], "Reset() restarts at the first candidate");
    AssertEq(first.Position(), 1U, "cursor position after one Next()");

    AssertEq(space.Materialize(3).size(), 3U, "limited materialize");
  }

  // A /16 is lazy: size is known without expanding it, and the last host
  // is reachable by index.
  {
    CandidateSpace space;
    std::string error;
    if (!camscout::discovery::BuildCandidateSpace("10.20.0.0/16", {80}, {"/"}, 70000U, space,
                                                  error)) {
      Fail("large space should build: " + error);
    }
    AssertEq(space.Size(), 65534U, "/16 candidate count");
    CameraCandidate last;
    AssertTrue(space.At(space.Size() - 1U, last), "last /16 candidate");
    AssertCandidate(last, "10.20.255.254", 80, "/");
  }

  // Paths gain a leading slash; an empty path set probes "/".
  {
    const CandidateSpace space = BuildOrFail("10.0.0.1", {80}, {"video", "/mjpeg"});
    AssertEq(space.Paths().size(), 2U, "normalized path count");
    AssertEq(space.Paths()[0], std::string("/mjpeg"), "normalized first path");
    AssertEq(space.Paths()[1], std::string("/video"), "normalized second path");

    const CandidateSpace root_only = BuildOrFail("10.0.0.1", {80}, {});
    AssertEq(root_only.Size(), 1U, "empty path set size");
    AssertEq(root_only.Paths()[0], std::string("/"), "empty path set becomes root");
  }

  // Empty targets or ports yield an empty space, not an error.
  AssertTrue(BuildOrFail("", {80}, {"/"}).Empty(), "empty targets");
  AssertTrue(BuildOrFail("10.0.0.1", {}, {"/"}).Empty(), "empty ports");
  {
    CandidateSpace empty = BuildOrFail("", {80}, {"/"});
    CameraCandidate candidate;
    AssertTrue(!empty.Begin().Next(candidate), "empty space yields nothing");
  }

  // Host names resolve once while the space is built; candidates keep the
  // name and carry the numeric address.
  {
    const CandidateSpace space = BuildOrFail("localhost,10.0.0.9", {80}, {"/"});
    const std::vector<CameraCandidate> all = space.Materialize();
    AssertEq(all.size(), 2U, "named space size");
    AssertCandidate(all[0], "localhost", 80, "/");
    AssertEq(all[0].address, std::string("127.0.0.1"), "resolved loopback address");
    AssertCandidate(all[1], "10.0.0.9", 80, "/");
    AssertTrue(all[1].address.empty(), "numeric host needs no address");
  }

  // Failures.
  {
    CandidateSpace space;
    std::string error;
    AssertTrue(!camscout::discovery::BuildCandidateSpace("10.0.0.0/24", {0, 80}, {"/"}, 4096U,
                                                         space, error),
               "port 0 must fail");
    AssertContains(error, "port 0");

    AssertTrue(!camscout::discovery::BuildCandidateSpace("10.0.0.0/20", {80}, {"/"}, 1000U, space,
                                                         error),
               "max_hosts must be enforced");
    AssertContains(error, "max_hosts");

    AssertTrue(!camscout::discovery::BuildCandidateSpace("not a target!", {80}, {"/"}, 4096U,
                                                         space, error),
               "garbage targets must fail");
    AssertContains(error, "not a target!");
  }

  // `auto` scan network: wide masks are clamped to the /24 holding the host.
  {
    std::uint32_t address = 0;
    std::uint32_t netmask = 0;
    AssertTrue(camscout::discovery::ParseIpv4("172.16.40.23", address), "parse address");
    AssertTrue(camscout::discovery::ParseIpv4("255.255.0.0", netmask), "parse netmask");
    const auto wide = camscout::discovery::ComputeScanNetwork(address, netmask);
    AssertEq(wide.cidr, std::string("172.16.40.0/24"), "clamped /16");
    AssertEq(wide.prefix_length, 24U, "clamped prefix");

    AssertTrue(camscout::discovery::ParseIpv4("255.255.255.240", netmask), "parse /28 netmask");
    const auto narrow = camscout::discovery::ComputeScanNetwork(address, netmask);
    AssertEq(narrow.cidr, std::string("172.16.40.16/28"), "narrow network kept");
  }

  return 0;
}
