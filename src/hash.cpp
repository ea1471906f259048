#include "chaosmagnet/hash.hpp"

// Hash authority.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the SOLE hash primitive: pool compression, digests, key
//      derivation and the seeded keygen stream all go through it.
//   2. Domain separation: "cm:mint:", "cm:metrics:", "cm:bundle-id:" prefixes
//      for digests; derive-key contexts (hash.hpp) for secret derivation.
//      These prefixes and contexts are part of the on-disk/on-wire contract.
//   3. HASH_ALGORITHM_VERSION (version.hpp) is bumped whenever a prefix, a
//      context string or the primitive changes. NEVER change silently.
//
// MICRO_DOCUMENTED: to_hex() uses a lookup table (kHexChars) for O(1) nibble
// encoding instead of snprintf("%02x"). Pool and digest hex is produced on
// every snapshot publish, so this stays on the hot path.

#include <array>
#include <cstring>
#include <utility>

#include <string.h>  // explicit_bzero

extern "C" {
#include <blake3.h>
}

namespace chaosmagnet {
namespace {

// MICRO_OPT: Lookup table for hex encoding. Avoids per-nibble branching.
constexpr char kHexChars[] = "0123456789abcdef";

// Decode a single hex character to its nibble value.
// Returns 0xFF on invalid character.
inline std::uint8_t hex_nibble(char c) {
  if (c >= '0' && c <= '9') return static_cast<std::uint8_t>(c - '0');
  if (c >= 'a' && c <= 'f') return static_cast<std::uint8_t>(c - 'a' + 10);
  if (c >= 'A' && c <= 'F') return static_cast<std::uint8_t>(c - 'A' + 10);
  return 0xFF;
}

}  // namespace

std::string to_hex(const std::uint8_t* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

std::string to_hex(std::string_view bytes) {
  return to_hex(reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size());
}

bool from_hex(std::string_view hex, std::string* out) {
  if (hex.size() % 2 != 0) return false;
  std::string decoded;
  decoded.resize(hex.size() / 2);
  for (std::size_t i = 0; i < decoded.size(); ++i) {
    const std::uint8_t hi = hex_nibble(hex[i * 2]);
    const std::uint8_t lo = hex_nibble(hex[i * 2 + 1]);
    if (hi == 0xFF || lo == 0xFF) return false;
    decoded[i] = static_cast<char>((hi << 4) | lo);
  }
  if (out) *out = std::move(decoded);
  return true;
}

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.version = blake3_version();
  info.primitive = "blake3";
  info.backend = "libblake3";
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<std::uint8_t, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_bytes_blake3(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return std::string(reinterpret_cast<char*>(out.data()), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<std::uint8_t, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string mint_digest_hash(std::string_view canonical_json) {
  return hash_domain("cm:mint:", canonical_json);
}

std::string metrics_digest_hash(std::string_view canonical_json) {
  return hash_domain("cm:metrics:", canonical_json);
}

std::string derive_key_bytes(const char* context, std::string_view key_material, std::size_t out_len) {
  blake3_hasher hasher;
  blake3_hasher_init_derive_key(&hasher, context);
  blake3_hasher_update(&hasher, key_material.data(), key_material.size());
  std::string out(out_len, '\0');
  blake3_hasher_finalize(&hasher, reinterpret_cast<std::uint8_t*>(out.data()), out.size());
  explicit_bzero(&hasher, sizeof(hasher));
  return out;
}

PoolBytes mix_pool_state(const PoolBytes& prior, std::string_view input) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, prior.data(), prior.size());
  blake3_hasher_update(&hasher, input.data(), input.size());
  PoolBytes next{};
  blake3_hasher_finalize(&hasher, next.data(), next.size());
  return next;
}

// ---------------------------------------------------------------------------
// SeededStream
// ---------------------------------------------------------------------------

struct SeededStream::Impl {
  blake3_hasher hasher;
};

SeededStream::SeededStream(const std::array<std::uint8_t, 32>& seed) : impl_(std::make_unique<Impl>()) {
  blake3_hasher_init_keyed(&impl_->hasher, seed.data());
}

SeededStream::~SeededStream() {
  explicit_bzero(&impl_->hasher, sizeof(impl_->hasher));
}

void SeededStream::generate(std::uint8_t* out, std::size_t len) {
  // Keyed hash of the empty message, read as an XOF from the current offset.
  blake3_hasher_finalize_seek(&impl_->hasher, position_, out, len);
  position_ += len;
}

}  // namespace chaosmagnet
