#pragma once

// chaosmagnet/observability.hpp: Structured engine event stream and stats.
//
// DESIGN:
//   EngineEvent is the canonical observable unit. Health transitions, harvester
//   faults, mint outcomes and network outcomes each emit one EngineEvent, which is:
//     - kept in a bounded ring buffer (the GUI log panel reads it),
//     - appended as one JSONL line to a configurable sink (event_log_path in
//       the engine config, or CHAOSMAGNET_EVENT_LOG),
//     - forwarded to an optional hook.
//   Each Engine owns its own EventLog and EngineStats. There is no global.
//
// INVARIANT: event emission must NEVER block harvesting. The ring lock is held
// only for the slot write; the file sink has its own lock and is only taken by
// the emitting thread.
//
// EXTENSION_POINT: remote_log_exporter
//   Current: JSONL file + in-memory ring.
//   Upgrade: register a hook that forwards events to a collector. Events carry
//   no key material and no raw pool bytes; keep it that way.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "chaosmagnet/types.hpp"

namespace chaosmagnet {

enum class EventKind : std::uint8_t {
  engine_started,
  engine_stopped,
  source_enabled,
  source_disabled,
  harvester_error,
  health_fail,
  health_recovered,
  mix_cycle,
  mint_ok,
  mint_failed,
  uplink_sent,
  uplink_retry,
  uplink_dropped,
  p2p_listening,
  p2p_listen_failed,
  p2p_sent,
  p2p_retry,
  p2p_dropped,
  p2p_received,
  config_applied,
  config_rejected,
};

inline constexpr std::size_t kEventKindCount = 21;

std::string to_string(EventKind kind);

struct EngineEvent {
  std::uint64_t seq{0};
  std::uint64_t timestamp_unix_ms{0};
  EventKind     kind{EventKind::engine_started};
  std::string   source_id;   // source, peer or requester; may be empty
  bool          ok{true};
  std::string   message;
};

std::string event_to_json(const EngineEvent& ev);

using EngineEventHook = void (*)(const EngineEvent&);

// ---------------------------------------------------------------------------
// EventLog: bounded ring + JSONL sink + hook
// ---------------------------------------------------------------------------
class EventLog {
 public:
  static constexpr std::size_t kMaxRecentEvents = 1000;

  // Empty path: fall back to CHAOSMAGNET_EVENT_LOG, else no file sink.
  explicit EventLog(std::string jsonl_path = "");

  void emit(EventKind kind, const std::string& source_id, bool ok, const std::string& message);

  // Oldest first, at most max_events of the most recent entries.
  std::vector<EngineEvent> recent(std::size_t max_events = kMaxRecentEvents) const;
  std::string recent_json(std::size_t max_events = kMaxRecentEvents) const;

  std::uint64_t count(EventKind kind) const;
  std::uint64_t total() const { return next_seq_.load(std::memory_order_relaxed); }

  void set_hook(EngineEventHook hook) { hook_.store(hook, std::memory_order_release); }
  const std::string& sink_path() const { return sink_path_; }

 private:
  void append_to_sink(const EngineEvent& ev);

  std::string sink_path_;
  std::atomic<EngineEventHook> hook_{nullptr};
  std::atomic<std::uint64_t> next_seq_{0};
  std::array<std::atomic<std::uint64_t>, kEventKindCount> kind_counts_{};

  mutable std::mutex ring_mu_;
  std::vector<EngineEvent> ring_buffer_;
  std::size_t ring_head_{0};  // next slot to overwrite once full

  std::mutex sink_mu_;
};

// ---------------------------------------------------------------------------
// LatencyHistogram: power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 32;

  void record(std::uint64_t duration_ns);

  // Approximate percentile, p in [0.0, 1.0]. Microseconds; 0.0 when empty.
  double percentile(double p) const;

  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<std::uint64_t> count_{0};
  alignas(64) std::atomic<std::uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats: aggregated counters
// ---------------------------------------------------------------------------
// Thread-safe. All counters are atomic; each is written by few threads so no
// per-counter cache-line padding.
class EngineStats {
 public:
  std::string to_json() const;

  // --- Hand-off queue ---
  std::atomic<std::uint64_t> samples_accepted{0};
  std::atomic<std::uint64_t> samples_rejected{0};   // unknown source
  std::atomic<std::uint64_t> samples_queue_full{0};

  // --- Conditioning ---
  std::atomic<std::uint64_t> samples_conditioned{0};
  std::atomic<std::uint64_t> bytes_conditioned{0};
  std::atomic<std::uint64_t> bytes_excluded{0};     // from failing sources
  std::atomic<std::uint64_t> mix_cycles{0};
  std::atomic<std::uint64_t> health_failures{0};

  // --- Minting ---
  std::atomic<std::uint64_t> mints_ok{0};
  std::atomic<std::uint64_t> mints_failed{0};
  std::atomic<std::uint64_t> mints_auto{0};         // triggered, ok or not

  // --- Network ---
  std::atomic<std::uint64_t> uplink_sent{0};
  std::atomic<std::uint64_t> uplink_failed_attempts{0};
  std::atomic<std::uint64_t> uplink_dropped{0};
  std::atomic<std::uint64_t> p2p_sent{0};
  std::atomic<std::uint64_t> p2p_failed_attempts{0};
  std::atomic<std::uint64_t> p2p_dropped{0};
  std::atomic<std::uint64_t> p2p_received{0};

  LatencyHistogram mix_latency;
  LatencyHistogram mint_latency;
};

// ---------------------------------------------------------------------------
// ScopeTimer: RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

std::uint64_t unix_time_ms();

}  // namespace chaosmagnet
