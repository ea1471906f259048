#pragma once

// chaosmagnet/pool.hpp: The 32-byte extraction pool.
//
// DESIGN:
//   One ExtractionPool per engine, written only by the conditioning consumer.
//   Each conditioning cycle with eligible input computes
//     pool' = BLAKE3-256(pool || raw)
//   Cycles with no eligible bytes leave the pool and every counter untouched.
//
// INVARIANTS:
//   - bytes.size() == 32 after any number of cycles.
//   - mixing is deterministic: same prior state and same input, same output.
//   - extraction_ratio = accumulated_raw_byte_count / (32 * mix_cycle_count).
//   - fill_fraction = min(1, total accumulated conservative entropy / target).

#include <cstdint>
#include <string_view>

#include "chaosmagnet/types.hpp"

namespace chaosmagnet {

class ExtractionPool {
 public:
  explicit ExtractionPool(double target_pool_bits = 256.0) : target_bits_(target_pool_bits) {}

  // One conditioning cycle. Returns false (and changes nothing) for empty input.
  bool mix(std::string_view raw, uint64_t now_unix_ms);

  void update_fill(double accumulated_entropy_bits);

  const PoolState& state() const { return state_; }
  double target_bits() const { return target_bits_; }

 private:
  PoolState state_;
  double    target_bits_;
};

}  // namespace chaosmagnet
