#pragma once

// chaosmagnet/node.hpp: Node identity used as sender_id on the wire.
//
// DESIGN:
//   Each Engine resolves one NodeIdentity at construction and never changes it.
//   node_id is what peers and the collector see in NetworkFrame.sender_id and
//   what the mint ledger records. It is not a secret and not authenticated.
//
// Sources (in priority order):
//   1. EngineConfig::node_id (if non-empty).
//   2. Environment: CHAOSMAGNET_NODE_ID.
//   3. Hostname ("unknown-host" if gethostname fails).

#include <cstdint>
#include <string>

namespace chaosmagnet {

struct NodeIdentity {
  std::string node_id;
  std::string hostname;
  std::int64_t pid{0};
  std::string engine_semver;
};

NodeIdentity init_node_identity(const std::string& node_id = "");

std::string node_identity_to_json(const NodeIdentity& n);

}  // namespace chaosmagnet
