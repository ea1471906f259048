#pragma once

// chaosmagnet/config.hpp: Engine configuration, JSON loading and validation.
//
// DESIGN:
//   All configuration arrives as JSON (config file, C API, GUI) and goes
//   through jsonlite's strict parser. Parsing overlays the keys present onto a
//   base value; absent keys keep their current value. Validation runs on the
//   merged result and reports EVERY problem, not just the first.
//
// INVARIANT: a configuration that fails validation is never applied. Callers
// receive ConfigValidationResult{ok=false, errors=[...]} and the engine's
// current configuration stays exactly as it was.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chaosmagnet {

// Built-in source ids.
inline constexpr const char* kSourceOsRng  = "OS_RNG";
inline constexpr const char* kSourceSystem = "SYSTEM";
inline constexpr const char* kSourceAudio  = "AUDIO";
inline constexpr const char* kSourceVideo  = "VIDEO";
inline constexpr const char* kSourceHid    = "HID";
inline constexpr const char* kSourceTrng   = "TRNG";

const std::vector<std::string>& builtin_source_ids();

// Maps GUI labels and legacy names ("SYSTEM/CPU", "HID (MOUSE)", "TRNG (HARDWARE)",
// lower case...) to the canonical id. Returns the input unchanged when no
// alias matches.
std::string normalize_source_id(const std::string& name);

struct SourceConfig {
  std::string id;
  double      claimed_min_entropy{1.0};   // bits per byte, (0, 8]
  uint32_t    poll_interval_ms{1000};
  std::string device_path;                // empty for device-less sources
  bool        enabled{false};
};

struct PeerAddress {
  std::string host;
  uint16_t    port{0};
};

std::optional<PeerAddress> parse_peer_address(const std::string& text);
std::string peer_to_string(const PeerAddress& peer);

struct UplinkConfig {
  bool        enabled{false};
  std::string host{"127.0.0.1"};
  uint16_t    port{8000};
  std::string path{"/ingest"};
  uint32_t    interval_ms{1000};
  uint32_t    max_attempts{4};
  uint32_t    backoff_base_ms{100};
  uint32_t    timeout_ms{500};
};

std::string uplink_target(const UplinkConfig& u);

struct P2pConfig {
  bool        enabled{false};
  uint16_t    listen_port{9000};   // 0 = ephemeral (tests)
  std::vector<PeerAddress> peers;
  uint32_t    interval_ms{2000};
  uint32_t    max_attempts{3};      // per peer per round
  uint32_t    backoff_base_ms{100};
  uint32_t    timeout_ms{500};
};

// Mints from the conditioning path every N mix cycles whose raw batch
// min-entropy (bits per byte) exceeds min_entropy.
struct AutoMintConfig {
  bool        enabled{false};
  uint32_t    every_cycles{10};
  double      min_entropy{6.5};
};

struct EngineConfig {
  std::string bundles_dir{"keys"};
  uint32_t    queue_capacity{1000};
  uint32_t    health_window{512};
  uint32_t    estimator_window{1024};
  double      alpha_log2{20.0};
  double      target_pool_bits{256.0};
  double      mint_floor_bits{256.0};
  uint32_t    mix_interval_ms{100};
  std::string event_log_path;
  std::string node_id;
  std::map<std::string, SourceConfig> sources;
  UplinkConfig uplink;
  P2pConfig    p2p;
  AutoMintConfig auto_mint;
};

// Defaults, including one SourceConfig per built-in source.
EngineConfig default_engine_config();

struct ConfigValidationResult {
  bool ok{true};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

ConfigValidationResult validate_config(const EngineConfig& cfg);
ConfigValidationResult validate_uplink_config(const UplinkConfig& u);
ConfigValidationResult validate_p2p_config(const P2pConfig& p);

// Overlay JSON onto *inout. On failure *inout is left untouched.
ConfigValidationResult parse_engine_config(const std::string& json_text, EngineConfig* inout);
ConfigValidationResult parse_uplink_config(const std::string& json_text, UplinkConfig* inout);
ConfigValidationResult parse_p2p_config(const std::string& json_text, P2pConfig* inout);

// Reads and parses a config file onto default_engine_config().
ConfigValidationResult load_engine_config_file(const std::string& path, EngineConfig* out);

std::string validation_to_json(const ConfigValidationResult& r);

}  // namespace chaosmagnet
