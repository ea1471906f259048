#pragma once

// chaosmagnet/health.hpp: Continuous health tests over raw source symbols.
//
// DESIGN:
//   Each source gets one HealthChecker, owned by the conditioning consumer.
//   Symbols are bytes. Both tests look only at the source's own data and never
//   read or write the pool.
//
//   Repetition Count Test (RCT):
//     cutoff C = ceil(1 + alpha_log2 / H), alpha = 2^-alpha_log2.
//     A run of exactly C identical symbols passes; C+1 fails.
//
//   Adaptive Proportion Test (APT):
//     Non-overlapping windows of W symbols. The first symbol of a window is the
//     reference; the test fails when the reference occurs more than cutoff
//     times in the window. cutoff is the (1 - alpha) quantile of
//     Binomial(W, 2^-H). The window restarts after every evaluation.
//
// RECOVERY:
//   A source is Fail while its current RCT run exceeds C or while its most
//   recently completed APT window failed. A new distinct symbol ends the run;
//   a passing APT window clears the APT failure. No manual reset.
//
//   A sample is judged as a whole: if any of its symbols failed, feed()
//   returns Fail for it, so a stuck run followed by one fresh byte is still
//   excluded.

#include <cstdint>
#include <string_view>

#include "chaosmagnet/types.hpp"

namespace chaosmagnet {

uint32_t rct_cutoff(double claimed_min_entropy, double alpha_log2 = 20.0);
uint32_t apt_cutoff(uint32_t window_size, double claimed_min_entropy, double alpha_log2 = 20.0);

class RepetitionCountTest {
 public:
  explicit RepetitionCountTest(uint32_t cutoff) : cutoff_(cutoff) {}

  // Returns false while the current run is longer than the cutoff.
  bool feed(uint8_t symbol);

  bool failing() const { return run_length_ > cutoff_; }
  uint32_t run_length() const { return run_length_; }
  uint32_t cutoff() const { return cutoff_; }

 private:
  uint32_t cutoff_;
  uint32_t run_length_{0};
  uint8_t  last_symbol_{0};
};

class AdaptiveProportionTest {
 public:
  AdaptiveProportionTest(uint32_t window_size, uint32_t cutoff)
      : window_size_(window_size), cutoff_(cutoff) {}

  // Returns true when this symbol completed a window.
  bool feed(uint8_t symbol);

  bool failing() const { return last_window_failed_; }
  uint32_t cutoff() const { return cutoff_; }
  uint32_t window_size() const { return window_size_; }
  uint64_t windows_evaluated() const { return windows_evaluated_; }

 private:
  uint32_t window_size_;
  uint32_t cutoff_;
  uint32_t position_{0};
  uint32_t reference_count_{0};
  uint8_t  reference_{0};
  bool     last_window_failed_{false};
  uint64_t windows_evaluated_{0};
};

class HealthChecker {
 public:
  HealthChecker(double claimed_min_entropy, uint32_t apt_window, double alpha_log2 = 20.0);

  HealthResult feed_symbol(uint8_t symbol);
  // Fail if any symbol of the payload failed RCT or APT, even when the tests
  // pass again by its last byte. result() reports the state after the payload.
  HealthResult feed(std::string_view payload);

  HealthResult result() const;
  uint32_t longest_run_in_sample() const { return longest_run_in_sample_; }
  uint64_t failure_count() const { return failure_count_; }
  const RepetitionCountTest& rct() const { return rct_; }
  const AdaptiveProportionTest& apt() const { return apt_; }

 private:
  RepetitionCountTest    rct_;
  AdaptiveProportionTest apt_;
  bool                   was_failing_{false};
  uint32_t               longest_run_in_sample_{0};
  uint64_t               failure_count_{0};  // pass -> fail transitions
};

}  // namespace chaosmagnet
