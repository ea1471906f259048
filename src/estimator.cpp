#include "chaosmagnet/estimator.hpp"

#include <algorithm>
#include <cmath>

namespace chaosmagnet {

namespace {

using Histogram = std::array<uint32_t, 256>;

Histogram histogram_of(std::string_view bytes) {
  Histogram counts{};
  for (char c : bytes) ++counts[static_cast<uint8_t>(c)];
  return counts;
}

double shannon_from(const Histogram& counts, double n) {
  double h = 0.0;
  for (uint32_t c : counts) {
    if (c == 0) continue;
    const double p = static_cast<double>(c) / n;
    h -= p * std::log2(p);
  }
  return h;
}

double min_from(const Histogram& counts, double n) {
  const uint32_t max_count = *std::max_element(counts.begin(), counts.end());
  return -std::log2(static_cast<double>(max_count) / n);
}

double collision_from(const Histogram& counts, double n) {
  double sum_sq = 0.0;
  for (uint32_t c : counts) {
    const double p = static_cast<double>(c) / n;
    sum_sq += p * p;
  }
  return -std::log2(sum_sq);
}

double clamp_bits(double v) { return std::clamp(v, 0.0, 8.0); }

}  // namespace

double shannon_entropy(std::string_view bytes) {
  if (bytes.empty()) return 0.0;
  return clamp_bits(shannon_from(histogram_of(bytes), static_cast<double>(bytes.size())));
}

double min_entropy(std::string_view bytes) {
  if (bytes.empty()) return 0.0;
  return clamp_bits(min_from(histogram_of(bytes), static_cast<double>(bytes.size())));
}

double collision_entropy(std::string_view bytes) {
  if (bytes.empty()) return 0.0;
  return clamp_bits(collision_from(histogram_of(bytes), static_cast<double>(bytes.size())));
}

void estimate_distribution(std::string_view bytes, EntropyMetrics* out) {
  if (bytes.empty()) {
    out->shannon_bits_per_byte = 0.0;
    out->min_entropy_bits_per_byte = 0.0;
    out->collision_entropy_bits_per_byte = 0.0;
    return;
  }
  const Histogram counts = histogram_of(bytes);
  const double n = static_cast<double>(bytes.size());
  // Mathematically ordered; the min() chain absorbs rounding in the last ulp.
  const double shannon = clamp_bits(shannon_from(counts, n));
  const double collision = std::min(clamp_bits(collision_from(counts, n)), shannon);
  const double minimum = std::min(clamp_bits(min_from(counts, n)), collision);
  out->shannon_bits_per_byte = shannon;
  out->collision_entropy_bits_per_byte = collision;
  out->min_entropy_bits_per_byte = minimum;
}

// ---------------------------------------------------------------------------
// SourceWindow
// ---------------------------------------------------------------------------

SourceWindow::SourceWindow(std::size_t capacity) : buffer_(std::max<std::size_t>(capacity, 1), 0) {}

void SourceWindow::push(uint8_t byte) {
  buffer_[head_] = byte;
  head_ = (head_ + 1) % buffer_.size();
  if (size_ < buffer_.size()) ++size_;
}

std::string SourceWindow::contents() const {
  std::string out;
  out.reserve(size_);
  const std::size_t start = (size_ < buffer_.size()) ? 0 : head_;
  for (std::size_t i = 0; i < size_; ++i) {
    out.push_back(static_cast<char>(buffer_[(start + i) % buffer_.size()]));
  }
  return out;
}

void SourceWindow::clear() {
  head_ = 0;
  size_ = 0;
}

// ---------------------------------------------------------------------------
// EntropyEstimator
// ---------------------------------------------------------------------------

EntropyEstimator::EntropyEstimator(std::size_t window_size) : window_(window_size) {}

std::size_t EntropyEstimator::feed(std::string_view payload) {
  ++metrics_.sample_count;
  std::size_t completed = 0;
  for (char c : payload) {
    window_.push(static_cast<uint8_t>(c));
    if (++filled_since_eval_ == window_.capacity()) {
      evaluate_window();
      filled_since_eval_ = 0;
      ++completed;
    }
  }
  return completed;
}

void EntropyEstimator::evaluate_window() {
  // The ring holds exactly the bytes of the window that just completed.
  const std::string bytes = window_.contents();
  estimate_distribution(bytes, &metrics_);
  metrics_.accumulated_true_entropy_bits +=
      metrics_.min_entropy_bits_per_byte * static_cast<double>(bytes.size());
}

void EntropyEstimator::reset() {
  window_.clear();
  filled_since_eval_ = 0;
  metrics_ = EntropyMetrics{};
}

}  // namespace chaosmagnet
