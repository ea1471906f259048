#pragma once

// chaosmagnet/pqc.hpp: liboqs wrappers for pool-seeded key generation.
//
// SEEDING:
//   liboqs draws all randomness through OQS_randombytes(). We install one
//   process-wide custom callback that reads from the active SeededStream when
//   keygen runs under a seed, and from the kernel CSPRNG otherwise (Falcon
//   signing). Every liboqs call in this module serializes on one mutex, so
//   only one seed is ever active.
//
// INVARIANTS:
//   - Same seed => same key pair, for both algorithms.
//   - Sub-seeds never leave this module's callers unwiped: SubSeeds::wipe()
//     and KeyPair::wipe() cleanse with OQS_MEM_cleanse.
//   - A randomness failure surfaces as keygen_failed / sign_failed, never as
//     a key built from zero bytes.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "chaosmagnet/types.hpp"

namespace chaosmagnet::pqc {

inline constexpr const char* kKemAlgorithm       = "ML-KEM-512";
inline constexpr const char* kSignatureAlgorithm = "Falcon-512";

using Seed = std::array<std::uint8_t, 32>;

struct SubSeeds {
  Seed kem{};
  Seed sig{};
  void wipe();
};

// BLAKE3 derive-key of the pool under the KEM and signature contexts.
SubSeeds derive_subseeds(const PoolBytes& pool);

struct KeyPair {
  std::vector<std::uint8_t> public_key;
  std::vector<std::uint8_t> secret_key;
  void wipe();
};

// OQS_MEM_cleanse over the characters, then clear().
void cleanse_string(std::string& s);

ErrorCode generate_kem_keypair(const Seed& seed, KeyPair* out);
ErrorCode generate_signature_keypair(const Seed& seed, KeyPair* out);

ErrorCode sign_message(const std::vector<std::uint8_t>& secret_key,
                       std::string_view message,
                       std::vector<std::uint8_t>* signature);

bool verify_signature(const std::vector<std::uint8_t>& public_key,
                      std::string_view message,
                      const std::vector<std::uint8_t>& signature);

// True when liboqs was built with both algorithms enabled.
bool algorithms_available();

std::string liboqs_version();

}  // namespace chaosmagnet::pqc
