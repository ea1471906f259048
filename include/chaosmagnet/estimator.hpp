#pragma once

// chaosmagnet/estimator.hpp: Per-source entropy estimation.
//
// Estimates are computed over the empirical byte distribution of one completed
// window (non-overlapping, estimator_window bytes). They are recomputed once
// per completed window, never per sample.
//
//   shannon   = -sum p log2 p
//   min       = -log2 max p
//   collision = -log2 sum p^2
//
// INVARIANT: 0 <= min <= collision <= shannon <= 8 holds for every published
// EntropyMetrics, including under floating-point rounding (clamped).
// accumulated_true_entropy_bits grows by min * window_bytes per window and
// only reset() brings it back to zero.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "chaosmagnet/types.hpp"

namespace chaosmagnet {

// Byte-distribution estimates over an arbitrary buffer.
double shannon_entropy(std::string_view bytes);
double min_entropy(std::string_view bytes);
double collision_entropy(std::string_view bytes);

// Fills the three per-byte estimates of *out; leaves accumulation fields alone.
void estimate_distribution(std::string_view bytes, EntropyMetrics* out);

// Fixed-capacity ring of the most recent payload bytes, oldest overwritten first.
class SourceWindow {
 public:
  explicit SourceWindow(std::size_t capacity);

  void push(uint8_t byte);
  std::size_t size() const { return size_; }
  std::size_t capacity() const { return buffer_.size(); }
  std::string contents() const;   // oldest first
  void clear();

 private:
  std::vector<uint8_t> buffer_;
  std::size_t head_{0};   // next write slot
  std::size_t size_{0};
};

class EntropyEstimator {
 public:
  explicit EntropyEstimator(std::size_t window_size);

  // Returns the number of windows completed by this payload.
  std::size_t feed(std::string_view payload);

  const EntropyMetrics& metrics() const { return metrics_; }
  const SourceWindow& window() const { return window_; }
  void reset();

 private:
  void evaluate_window();

  SourceWindow   window_;
  std::size_t    filled_since_eval_{0};
  EntropyMetrics metrics_;
};

}  // namespace chaosmagnet
