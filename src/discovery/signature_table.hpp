#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace camscout::discovery {

// Name of the catch-all signature that closes the built-in table. A match on
// it classifies the protocol without naming a vendor.
inline constexpr std::string_view kGenericSignatureName = "generic";

// Manufacturer fingerprint. Fingerprints are matched as ASCII
// case-insensitive substrings of the response prefix (status line, headers and
// whatever body bytes were read).
struct ManufacturerSignature {
  std::string name;
  std::set<std::uint16_t> candidate_ports;
  std::set<std::string> candidate_paths;
  std::set<std::string> http_fingerprints;
  std::set<std::string> rtsp_fingerprints;
};

struct SignatureMatch {
  std::size_t index = 0;
  std::string name;
};

// Ordered, immutable fingerprint table. Declaration order is the match
// precedence: the earliest signature with any matching fingerprint wins.
// Safe to share across probe threads once constructed.
class SignatureTable {
public:
  SignatureTable() = default;
  explicit SignatureTable(std::vector<ManufacturerSignature> signatures);

  // Vendor entries first, `generic` last.
  static SignatureTable BuiltIn();

  const std::vector<ManufacturerSignature>& Signatures() const;
  bool Empty() const;

  std::optional<SignatureMatch> MatchHttp(std::string_view response_prefix) const;
  std::optional<SignatureMatch> MatchRtsp(std::string_view response_prefix) const;

  // Unions over every signature; the default scan port/path sets.
  std::set<std::uint16_t> CandidatePorts() const;
  std::set<std::string> CandidatePaths() const;

private:
  struct LoweredFingerprints {
    std::vector<std::string> http;
    std::vector<std::string> rtsp;
  };

  std::vector<ManufacturerSignature> signatures_;
  std::vector<LoweredFingerprints> lowered_;
};

// Structural checks used by the config loader for user-supplied tables.
bool ValidateSignature(const ManufacturerSignature& signature, std::string& error);

} // namespace camscout::discovery
