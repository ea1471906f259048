#include "chaosmagnet/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>
#include <utility>

#include "chaosmagnet/jsonlite.hpp"

namespace chaosmagnet {

namespace {

// MICRO_OPT: bit_width gives the bucket index in O(1) using hardware BSR/CLZ.
inline std::size_t bucket_for_us(std::uint64_t duration_us) {
  if (duration_us == 0) return 0;
  std::size_t b = static_cast<std::size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

}  // namespace

std::uint64_t unix_time_ms() {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

std::string to_string(EventKind kind) {
  switch (kind) {
    case EventKind::engine_started:    return "engine_started";
    case EventKind::engine_stopped:    return "engine_stopped";
    case EventKind::source_enabled:    return "source_enabled";
    case EventKind::source_disabled:   return "source_disabled";
    case EventKind::harvester_error:   return "harvester_error";
    case EventKind::health_fail:       return "health_fail";
    case EventKind::health_recovered:  return "health_recovered";
    case EventKind::mix_cycle:         return "mix_cycle";
    case EventKind::mint_ok:           return "mint_ok";
    case EventKind::mint_failed:       return "mint_failed";
    case EventKind::uplink_sent:       return "uplink_sent";
    case EventKind::uplink_retry:      return "uplink_retry";
    case EventKind::uplink_dropped:    return "uplink_dropped";
    case EventKind::p2p_listening:     return "p2p_listening";
    case EventKind::p2p_listen_failed: return "p2p_listen_failed";
    case EventKind::p2p_sent:          return "p2p_sent";
    case EventKind::p2p_retry:         return "p2p_retry";
    case EventKind::p2p_dropped:       return "p2p_dropped";
    case EventKind::p2p_received:      return "p2p_received";
    case EventKind::config_applied:    return "config_applied";
    case EventKind::config_rejected:   return "config_rejected";
  }
  return "unknown";
}

std::string event_to_json(const EngineEvent& ev) {
  // Compact, no pretty-print. Keys are emitted in a fixed order.
  std::string line;
  line.reserve(160 + ev.message.size());
  line += "{\"seq\":";
  line += std::to_string(ev.seq);
  line += ",\"ts_ms\":";
  line += std::to_string(ev.timestamp_unix_ms);
  line += ",\"kind\":\"";
  line += to_string(ev.kind);
  line += "\",\"source\":\"";
  line += jsonlite::escape(ev.source_id);
  line += "\",\"ok\":";
  line += ev.ok ? "true" : "false";
  line += ",\"message\":\"";
  line += jsonlite::escape(ev.message);
  line += "\"}";
  return line;
}

// ---------------------------------------------------------------------------
// EventLog
// ---------------------------------------------------------------------------

EventLog::EventLog(std::string jsonl_path) : sink_path_(std::move(jsonl_path)) {
  if (sink_path_.empty()) {
    // Activation: set CHAOSMAGNET_EVENT_LOG=/path/to/events.jsonl
    const char* env = std::getenv("CHAOSMAGNET_EVENT_LOG");
    if (env && env[0]) sink_path_ = env;
  }
  ring_buffer_.reserve(kMaxRecentEvents);
}

void EventLog::emit(EventKind kind, const std::string& source_id, bool ok, const std::string& message) {
  EngineEvent ev;
  ev.seq = next_seq_.fetch_add(1, std::memory_order_relaxed) + 1;
  ev.timestamp_unix_ms = unix_time_ms();
  ev.kind = kind;
  ev.source_id = source_id;
  ev.ok = ok;
  ev.message = message;

  kind_counts_[static_cast<std::size_t>(kind)].fetch_add(1, std::memory_order_relaxed);

  {
    std::lock_guard<std::mutex> lk(ring_mu_);
    if (ring_buffer_.size() < kMaxRecentEvents) {
      ring_buffer_.push_back(ev);
    } else {
      ring_buffer_[ring_head_] = ev;
      ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
    }
  }

  EngineEventHook hook = hook_.load(std::memory_order_acquire);
  if (hook) hook(ev);

  if (!sink_path_.empty()) append_to_sink(ev);
}

void EventLog::append_to_sink(const EngineEvent& ev) {
  std::string line = event_to_json(ev);
  line += '\n';
  std::lock_guard<std::mutex> lk(sink_mu_);
  // Append mode; a sink that cannot be opened is skipped, the ring still has the event.
  if (FILE* f = std::fopen(sink_path_.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

std::vector<EngineEvent> EventLog::recent(std::size_t max_events) const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  std::vector<EngineEvent> ordered;
  ordered.reserve(ring_buffer_.size());
  // Once full, ring_head_ points at the oldest entry.
  for (std::size_t i = 0; i < ring_buffer_.size(); ++i) {
    ordered.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  if (ordered.size() > max_events) {
    ordered.erase(ordered.begin(), ordered.end() - static_cast<std::ptrdiff_t>(max_events));
  }
  return ordered;
}

std::string EventLog::recent_json(std::size_t max_events) const {
  const auto events = recent(max_events);
  std::string out = "[";
  for (std::size_t i = 0; i < events.size(); ++i) {
    if (i) out += ',';
    out += event_to_json(events[i]);
  }
  out += ']';
  return out;
}

std::uint64_t EventLog::count(EventKind kind) const {
  return kind_counts_[static_cast<std::size_t>(kind)].load(std::memory_order_relaxed);
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(std::uint64_t duration_ns) {
  const std::uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const std::uint64_t target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      // Midpoint of bucket i. Bucket 0 covers [0,1)us.
      const double bucket_lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double bucket_hi = static_cast<double>(1ULL << i);
      return (bucket_lo + bucket_hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count_.load(std::memory_order_relaxed));
  out += ",\"mean_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_us());
  out += buf;
  out += ",\"p50_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.50));
  out += buf;
  out += ",\"p95_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.95));
  out += buf;
  out += ",\"p99_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.99));
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

std::string EngineStats::to_json() const {
  auto load = [](const std::atomic<std::uint64_t>& a) {
    return std::to_string(a.load(std::memory_order_relaxed));
  };

  std::string out;
  out.reserve(768);
  out += "{\"queue\":{\"accepted\":";
  out += load(samples_accepted);
  out += ",\"rejected\":";
  out += load(samples_rejected);
  out += ",\"full\":";
  out += load(samples_queue_full);
  out += "}";

  out += ",\"conditioning\":{\"samples\":";
  out += load(samples_conditioned);
  out += ",\"bytes\":";
  out += load(bytes_conditioned);
  out += ",\"bytes_excluded\":";
  out += load(bytes_excluded);
  out += ",\"mix_cycles\":";
  out += load(mix_cycles);
  out += ",\"health_failures\":";
  out += load(health_failures);
  out += ",\"latency\":";
  out += mix_latency.to_json();
  out += "}";

  out += ",\"mint\":{\"ok\":";
  out += load(mints_ok);
  out += ",\"failed\":";
  out += load(mints_failed);
  out += ",\"auto\":";
  out += load(mints_auto);
  out += ",\"latency\":";
  out += mint_latency.to_json();
  out += "}";

  out += ",\"uplink\":{\"sent\":";
  out += load(uplink_sent);
  out += ",\"failed_attempts\":";
  out += load(uplink_failed_attempts);
  out += ",\"dropped\":";
  out += load(uplink_dropped);
  out += "}";

  out += ",\"p2p\":{\"sent\":";
  out += load(p2p_sent);
  out += ",\"failed_attempts\":";
  out += load(p2p_failed_attempts);
  out += ",\"dropped\":";
  out += load(p2p_dropped);
  out += ",\"received\":";
  out += load(p2p_received);
  out += "}}";
  return out;
}

}  // namespace chaosmagnet
