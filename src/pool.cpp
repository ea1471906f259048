#include "chaosmagnet/pool.hpp"

#include <algorithm>

#include "chaosmagnet/hash.hpp"

namespace chaosmagnet {

bool ExtractionPool::mix(std::string_view raw, uint64_t now_unix_ms) {
  if (raw.empty()) return false;
  state_.bytes = mix_pool_state(state_.bytes, raw);
  state_.accumulated_raw_byte_count += raw.size();
  ++state_.mix_cycle_count;
  state_.extraction_ratio = static_cast<double>(state_.accumulated_raw_byte_count) /
                            (static_cast<double>(kPoolSize) * static_cast<double>(state_.mix_cycle_count));
  state_.last_mix_timestamp_ms = now_unix_ms;
  return true;
}

void ExtractionPool::update_fill(double accumulated_entropy_bits) {
  if (target_bits_ <= 0.0) {
    state_.fill_fraction = 1.0;
    return;
  }
  state_.fill_fraction = std::clamp(accumulated_entropy_bits / target_bits_, 0.0, 1.0);
}

}  // namespace chaosmagnet
