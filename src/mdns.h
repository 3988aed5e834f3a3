#pragma once

#include "yeelight/discovery.h"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace yeelight {
namespace internal {

constexpr uint16_t kDnsTypeA = 1;
constexpr uint16_t kDnsTypePtr = 12;
constexpr uint16_t kDnsTypeTxt = 16;
constexpr uint16_t kDnsTypeSrv = 33;
constexpr uint16_t kDnsClassIn = 1;
/// Unicast-response bit of the question class.
constexpr uint16_t kDnsClassQu = 0x8000;
/// Cache-flush bit of the record class.
constexpr uint16_t kDnsClassFlush = 0x8000;
constexpr size_t kDnsHeaderSize = 12;

/// Lowercase and strip trailing dots.
std::string CanonicalName(const std::string& name);

/// Encode a dotted name as DNS labels. Empty on a label longer than 63 bytes.
std::vector<uint8_t> EncodeName(const std::string& name);

std::vector<uint8_t> BuildQuery(const std::string& name, uint16_t type, bool unicast_response);

/**
 * Joins PTR -> SRV -> A records across packets.
 */
class MdnsCache {
 public:
  /// Merge every record of one packet. Returns false if it cannot be parsed;
  /// records read before the error are kept.
  bool AddPacket(const uint8_t* data, size_t length);

  /// Instances of `service` whose SRV target has an IPv4 address.
  std::vector<DiscoveryResult> Resolve(const std::string& service) const;

  /// SRV targets of `service` still lacking an address.
  std::vector<std::string> UnresolvedHosts(const std::string& service) const;

 private:
  struct Service {
    uint16_t port = 0;
    std::string target;
  };

  bool ParseRecord(const uint8_t* data, size_t length, size_t* offset);

  std::map<std::string, std::set<std::string>> pointers_;
  std::map<std::string, Service> services_;
  std::map<std::string, std::vector<std::string>> addresses_;
  std::map<std::string, std::string> display_names_;
};

}  // namespace internal
}  // namespace yeelight
