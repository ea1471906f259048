#pragma once

// chaosmagnet/types.hpp: Core data structures for the ChaosMagnet entropy engine.
//
// OWNERSHIP NOTES:
//   - RawSample is produced by exactly one harvester, moved through the hand-off
//     queue, and destroyed by the conditioning consumer. It is never retained.
//   - EngineSnapshot is a value copy. Readers (GUI, minter, distributor) own
//     their copy and may hold it for as long as they like; it never aliases
//     live engine state.
//   - PqcBundle is immutable once persisted. bundle_to_json() is the only
//     on-disk representation.
//
// BYTE STRINGS:
//   Raw payloads and digests are carried in std::string (binary-safe), the
//   same convention hash.hpp uses for raw BLAKE3 output. Key material coming
//   out of liboqs uses std::vector<uint8_t> (see pqc.hpp).
//
// INVARIANTS:
//   - EntropyMetrics: 0 <= min_entropy <= collision_entropy <= shannon <= 8.
//   - PoolState.bytes is always exactly kPoolSize bytes.
//   - PoolState.fill_fraction is in [0, 1].

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "chaosmagnet/jsonlite.hpp"

namespace chaosmagnet {

enum class ErrorCode {
  none,
  config_invalid,
  unknown_source,
  invalid_state,
  device_unavailable,
  permission_denied,
  device_io_failed,
  queue_full,
  pool_below_threshold,
  pool_stale,
  keygen_failed,
  sign_failed,
  persist_failed,
  network_failed,
  json_parse_error,
  json_duplicate_key,
};

std::string to_string(ErrorCode code);

// Harvester lifecycle. Error is reachable from starting/running only; the
// single exit from error is stop() followed by start().
enum class HarvesterState {
  disabled,
  starting,
  running,
  stopping,
  error,
};

std::string to_string(HarvesterState state);

enum class HealthResult {
  pass,
  fail,
};

std::string to_string(HealthResult result);

constexpr std::size_t kPoolSize = 32;
using PoolBytes = std::array<std::uint8_t, kPoolSize>;

struct RawSample {
  std::string   source_id;
  std::uint64_t timestamp_ns{0};   // CLOCK_REALTIME at capture
  std::string   payload;           // binary-safe
  std::uint64_t sequence{0};       // per-harvester, starts at 1
};

struct EntropyMetrics {
  double        shannon_bits_per_byte{0.0};
  double        min_entropy_bits_per_byte{0.0};
  double        collision_entropy_bits_per_byte{0.0};
  double        accumulated_true_entropy_bits{0.0};  // never decreases
  std::uint64_t sample_count{0};
};

struct SourceState {
  std::string    source_id;
  bool           enabled{false};
  HarvesterState lifecycle{HarvesterState::disabled};
  HealthResult   last_health_result{HealthResult::pass};
  EntropyMetrics metrics;
  std::uint64_t  bytes_received{0};
  std::uint64_t  health_failures{0};
  std::string    last_error;
};

struct PoolState {
  PoolBytes     bytes{};
  double        fill_fraction{0.0};
  std::uint64_t accumulated_raw_byte_count{0};
  double        extraction_ratio{0.0};
  std::uint64_t last_mix_timestamp_ms{0};
  std::uint64_t mix_cycle_count{0};
};

// Consistent copy of pool + per-source state, taken under the shared read
// section of the engine. Network fields are informational only.
struct EngineSnapshot {
  PoolState                pool;
  std::vector<SourceState> sources;
  std::vector<double>      history_min_entropy;   // raw input, per mix cycle
  std::vector<double>      history_whitened;      // pool output, per mix cycle
  std::uint64_t            total_bytes_harvested{0};
  std::uint64_t            taken_at_ms{0};

  bool          uplink_enabled{false};
  std::string   uplink_target;
  bool          p2p_enabled{false};
  std::uint16_t p2p_port{0};
  std::size_t   p2p_peer_count{0};
  std::uint64_t p2p_received_count{0};
};

// Sum of accumulated conservative entropy over sources that are enabled and
// currently passing health checks.
double aggregate_conservative_entropy(const EngineSnapshot& snapshot);

// Sum of accumulated conservative entropy over every source (fill fraction).
double total_conservative_entropy(const std::vector<SourceState>& sources);

jsonlite::Value metrics_to_value(const EntropyMetrics& m);
bool metrics_from_value(const jsonlite::Value& v, EntropyMetrics* out);
std::string snapshot_to_json(const EngineSnapshot& snapshot);
// One-line status: pool fill and cycles plus state, health and min-entropy of
// each enabled source.
std::string snapshot_summary_json(const EngineSnapshot& snapshot);

bool health_result_from_string(const std::string& s, HealthResult* out);

struct PqcBundle {
  std::string   bundle_id;
  std::uint64_t timestamp_unix_ms{0};
  std::string   requester;
  std::string   kem_algorithm;
  std::string   signature_algorithm;
  std::string   kem_public_key_hex;
  std::string   kem_secret_key_hex;   // empty in a MintResult; see the bundle file
  std::string   signature_hex;
  std::string   signature_public_key_hex;
  std::string   pool_snapshot_hex;
  std::string   snapshot_digest;   // hex digest that signature_hex covers
  double        aggregate_entropy_bits{0.0};
  std::map<std::string, EntropyMetrics> per_source_metrics;
  std::map<std::string, HealthResult>   health_state;
  std::uint32_t format_version{0};
  std::string   file_path;         // not serialized; set by the bundle store
};

struct MintResult {
  bool        ok{false};
  ErrorCode   error_code{ErrorCode::none};
  std::string message;
  PqcBundle   bundle;
};

struct NetworkFrame {
  std::string   sender_id;
  std::uint64_t sequence{0};
  std::uint64_t timestamp_unix_ms{0};
  std::string   whitened_payload_hex;
  std::string   metrics_digest;
  std::uint32_t frame_version{0};
};

}  // namespace chaosmagnet
