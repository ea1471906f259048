#include "chaosmagnet/health.hpp"

#include <algorithm>
#include <cmath>

namespace chaosmagnet {

namespace {

// log(C(n, k) p^k (1-p)^(n-k)) via lgamma; exact enough for n up to 2^20.
double log_binomial_pmf(uint32_t n, uint32_t k, double p) {
  const double dn = static_cast<double>(n);
  const double dk = static_cast<double>(k);
  return std::lgamma(dn + 1.0) - std::lgamma(dk + 1.0) - std::lgamma(dn - dk + 1.0) +
         dk * std::log(p) + (dn - dk) * std::log1p(-p);
}

}  // namespace

uint32_t rct_cutoff(double claimed_min_entropy, double alpha_log2) {
  const double c = std::ceil(1.0 + alpha_log2 / claimed_min_entropy);
  return static_cast<uint32_t>(std::max(2.0, c));
}

uint32_t apt_cutoff(uint32_t window_size, double claimed_min_entropy, double alpha_log2) {
  const double p = std::exp2(-claimed_min_entropy);
  if (p >= 1.0) return window_size;
  const double log_alpha = -alpha_log2 * std::log(2.0);

  // Upper tail P[X >= k] accumulated from k = W downwards in log space; the
  // cutoff is the largest count whose tail still exceeds alpha, i.e. counts
  // strictly above it occur with probability <= alpha.
  double log_tail = -INFINITY;
  for (uint32_t k = window_size; k >= 1; --k) {
    const double lp = log_binomial_pmf(window_size, k, p);
    const double hi = std::max(log_tail, lp);
    log_tail = hi + std::log(std::exp(log_tail - hi) + std::exp(lp - hi));
    if (log_tail > log_alpha) {
      // P[X >= k] > alpha, P[X >= k+1] <= alpha: fail on count > k.
      return k;
    }
  }
  return 1;
}

bool RepetitionCountTest::feed(uint8_t symbol) {
  if (run_length_ > 0 && symbol == last_symbol_) {
    ++run_length_;
  } else {
    last_symbol_ = symbol;
    run_length_ = 1;
  }
  return !failing();
}

bool AdaptiveProportionTest::feed(uint8_t symbol) {
  if (position_ == 0) {
    reference_ = symbol;
    reference_count_ = 1;
  } else if (symbol == reference_) {
    ++reference_count_;
  }
  ++position_;
  if (position_ < window_size_) return false;

  last_window_failed_ = reference_count_ > cutoff_;
  ++windows_evaluated_;
  position_ = 0;
  reference_count_ = 0;
  return true;
}

HealthChecker::HealthChecker(double claimed_min_entropy, uint32_t apt_window, double alpha_log2)
    : rct_(rct_cutoff(claimed_min_entropy, alpha_log2)),
      apt_(apt_window, apt_cutoff(apt_window, claimed_min_entropy, alpha_log2)) {}

HealthResult HealthChecker::result() const {
  return (rct_.failing() || apt_.failing()) ? HealthResult::fail : HealthResult::pass;
}

HealthResult HealthChecker::feed_symbol(uint8_t symbol) {
  rct_.feed(symbol);
  apt_.feed(symbol);
  const bool failing = rct_.failing() || apt_.failing();
  if (failing && !was_failing_) ++failure_count_;
  was_failing_ = failing;
  return failing ? HealthResult::fail : HealthResult::pass;
}

HealthResult HealthChecker::feed(std::string_view payload) {
  // A failure anywhere in the payload taints the whole sample, even when
  // later bytes already recovered the tests.
  bool tainted = false;
  longest_run_in_sample_ = 0;
  for (char c : payload) {
    if (feed_symbol(static_cast<uint8_t>(c)) == HealthResult::fail) tainted = true;
    longest_run_in_sample_ = std::max(longest_run_in_sample_, rct_.run_length());
  }
  return tainted ? HealthResult::fail : HealthResult::pass;
}

}  // namespace chaosmagnet
