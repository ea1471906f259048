#pragma once

// chaosmagnet/version.hpp: Explicit version manifest for every format surface.
//
// PURPOSE:
//   Prevent silent format drift across the C ABI, bundle files, network frames
//   and the mint ledger. Every component that reads or writes a versioned
//   format stamps or checks its constant here.
//
// INVARIANT:
//   All version constants are compile-time. chaosmagnet_init() calls
//   check_compatibility() and refuses to create an engine on ABI mismatch.
//   Readers never accept a bundle or frame with a newer format version than
//   this build knows.

#include <cstdint>
#include <string>

namespace chaosmagnet {
namespace version {

// ---------------------------------------------------------------------------
// ENGINE_ABI_VERSION
// Increment when the C API (c_api.h) binary interface changes.
// ---------------------------------------------------------------------------
constexpr uint32_t ENGINE_ABI_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256 pool compression, "cm:" digest prefixes and the
// "chaosmagnet 2024 ... v1" derive-key contexts.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// BUNDLE_FORMAT_VERSION
// Version 1 = JSON object, hex-encoded key material, signed snapshot_digest.
// Adding or removing a field covered by the digest requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t BUNDLE_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// FRAME_FORMAT_VERSION
// Version 1 = {sender_id, sequence, timestamp, whitened_payload_hex,
// metrics_digest, frame_version}.
// ---------------------------------------------------------------------------
constexpr uint32_t FRAME_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// MINT_LEDGER_VERSION
// Version 1 = NDJSON, one hash-chained line per successful mint.
// ---------------------------------------------------------------------------
constexpr uint32_t MINT_LEDGER_VERSION = 1;

struct VersionManifest {
  uint32_t engine_abi{ENGINE_ABI_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t bundle_format{BUNDLE_FORMAT_VERSION};
  uint32_t frame_format{FRAME_FORMAT_VERSION};
  uint32_t mint_ledger{MINT_LEDGER_VERSION};
  std::string engine_semver;      // from the CMake project version
  std::string hash_primitive;     // "blake3"
  std::string kem_algorithm;
  std::string signature_algorithm;
  std::string build_timestamp;    // __DATE__ "T" __TIME__
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

struct CompatibilityResult {
  bool ok{true};
  std::string error_code;    // Empty if ok
  std::string description;
  uint32_t required_abi{ENGINE_ABI_VERSION};
  uint32_t actual_abi{ENGINE_ABI_VERSION};
};

CompatibilityResult check_compatibility(uint32_t caller_abi_version = ENGINE_ABI_VERSION);

}  // namespace version
}  // namespace chaosmagnet
