#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "chaosmagnet/types.hpp"

namespace chaosmagnet {

struct HashRuntimeInfo {
  std::string primitive;
  std::string backend;
  std::string version;
};

// Derive-key contexts. Changing any of these changes every derived value;
// bump HASH_ALGORITHM_VERSION alongside.
inline constexpr const char* kKemSeedContext = "chaosmagnet 2024 kem-seed v1";
inline constexpr const char* kSigSeedContext = "chaosmagnet 2024 sig-seed v1";
inline constexpr const char* kFrameWhiteningContext = "chaosmagnet 2024 frame-whitening v1";

// Core BLAKE3 hashing
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Binary digest (32 bytes)
std::string hash_bytes_blake3(std::string_view payload);

// Domain-separated hashing for different contexts. Returns hex.
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string mint_digest_hash(std::string_view canonical_json);
std::string metrics_digest_hash(std::string_view canonical_json);

// BLAKE3 derive-key mode. Output length is arbitrary (XOF); the same
// (context, key_material) pair always yields the same prefix.
std::string derive_key_bytes(const char* context, std::string_view key_material, std::size_t out_len);

// One conditioning step: BLAKE3-256(prior || input).
PoolBytes mix_pool_state(const PoolBytes& prior, std::string_view input);

// Deterministic byte stream expanded from a 32-byte seed with BLAKE3 keyed
// mode + XOF seek. Not thread-safe; one owner at a time.
class SeededStream {
 public:
  explicit SeededStream(const std::array<std::uint8_t, 32>& seed);
  ~SeededStream();

  SeededStream(const SeededStream&) = delete;
  SeededStream& operator=(const SeededStream&) = delete;

  void generate(std::uint8_t* out, std::size_t len);
  std::uint64_t position() const { return position_; }

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
  std::uint64_t position_{0};
};

// Hex helpers. from_hex() rejects odd length and non-hex characters.
std::string to_hex(std::string_view bytes);
std::string to_hex(const std::uint8_t* data, std::size_t len);
bool from_hex(std::string_view hex, std::string* out);

}  // namespace chaosmagnet
