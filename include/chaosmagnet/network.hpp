#pragma once

// chaosmagnet/network.hpp: Uplink and P2P distribution of whitened frames.
//
// DESIGN:
//   Both distributors run on their own threads and only ever READ engine state,
//   through a SnapshotProvider returning a value copy. They share no lock with
//   harvesting or conditioning; a dead collector or peer can slow nothing but
//   its own thread.
//
//   Frames never carry raw pool bytes. whitened_payload is
//     BLAKE3-derive-key("chaosmagnet 2024 frame-whitening v1", pool || seq_le64)
//   so a frame reveals nothing usable about pool state or minted keys.
//
// WIRE:
//   HTTP/1.1 POST, Content-Type: application/json, body = frame_to_json().
//   Any 2xx is success. Connect, send and receive are each bounded by the
//   configured timeout_ms.
//
// INVARIANTS:
//   - Uplink retries a frame at most max_attempts times, sleeping
//     backoff_base_ms * 2^n between attempts, then drops it and logs
//     uplink_dropped. Every wait is cancellable by configure()/stop().
//   - Each P2P peer gets the same bounded retry with backoff; a peer that
//     exhausts its attempts is skipped for that round and logged p2p_dropped.
//   - Received P2P frames are counted and logged; they are NEVER mixed into
//     the local pool. Senders are not authenticated.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "chaosmagnet/config.hpp"
#include "chaosmagnet/observability.hpp"
#include "chaosmagnet/types.hpp"
#include "chaosmagnet/unique_fd.hpp"

namespace chaosmagnet {

std::string frame_to_json(const NetworkFrame& f);
bool frame_from_json(const std::string& text, NetworkFrame* out, std::string* error);

NetworkFrame build_frame(const std::string& sender_id, std::uint64_t sequence, const EngineSnapshot& snapshot);

struct HttpResult {
  bool        ok{false};
  int         status{0};
  std::string error;
};

HttpResult http_post_json(const std::string& host, std::uint16_t port, const std::string& path,
                          const std::string& body, std::chrono::milliseconds timeout);

using SnapshotProvider = std::function<EngineSnapshot()>;

// ---------------------------------------------------------------------------
// UplinkClient: timer- and mint-driven POSTs to one collector
// ---------------------------------------------------------------------------
class UplinkClient {
 public:
  UplinkClient(std::string sender_id, SnapshotProvider provider, EventLog& events, EngineStats& stats);
  ~UplinkClient();

  UplinkClient(const UplinkClient&) = delete;
  UplinkClient& operator=(const UplinkClient&) = delete;

  // Applies a validated config. Interrupts any in-flight backoff; the worker
  // runs iff cfg.enabled.
  void configure(const UplinkConfig& cfg);

  // Sends one frame as soon as possible (no-op when disabled).
  void trigger();

  void stop();

  UplinkConfig config() const;
  bool enabled() const;

 private:
  void loop();
  // Returns false once the frame is dropped or the worker was interrupted.
  bool send_with_retry(const NetworkFrame& frame, const UplinkConfig& cfg);
  bool wait_interruptible(std::chrono::milliseconds d);
  void stop_worker();

  const std::string sender_id_;
  SnapshotProvider  provider_;
  EventLog&         events_;
  EngineStats&      stats_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  UplinkConfig cfg_;
  bool triggered_{false};
  bool stopping_{false};
  std::uint64_t sequence_{0};
  std::thread thread_;
};

// ---------------------------------------------------------------------------
// P2pNode: listener + periodic sender
// ---------------------------------------------------------------------------
class P2pNode {
 public:
  static constexpr std::size_t kRecentFrames = 64;

  P2pNode(std::string sender_id, SnapshotProvider provider, EventLog& events, EngineStats& stats);
  ~P2pNode();

  P2pNode(const P2pNode&) = delete;
  P2pNode& operator=(const P2pNode&) = delete;

  // Applies a validated config: the listener is (re)bound when the port or
  // enabled flag changes. network_failed if the port cannot be bound; the
  // node then stays disabled.
  ErrorCode configure(const P2pConfig& cfg);

  void stop();

  P2pConfig config() const;
  bool enabled() const;
  std::uint16_t bound_port() const { return bound_port_.load(std::memory_order_acquire); }
  std::uint64_t received_count() const { return received_.load(std::memory_order_acquire); }
  std::vector<NetworkFrame> recent_frames() const;

 private:
  void stop_threads(std::unique_lock<std::mutex>& lock);
  void listen_loop(int fd);
  void handle_connection(int client_fd, const std::string& peer);
  void send_loop();
  bool wait_interruptible(std::chrono::milliseconds d);

  const std::string sender_id_;
  SnapshotProvider  provider_;
  EventLog&         events_;
  EngineStats&      stats_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  P2pConfig cfg_;
  bool stopping_{false};
  std::uint64_t sequence_{0};
  UniqueFd listen_fd_;
  std::thread listener_;
  std::thread sender_;

  std::atomic<bool> listening_{false};
  std::atomic<std::uint16_t> bound_port_{0};
  std::atomic<std::uint64_t> received_{0};

  mutable std::mutex frames_mu_;
  std::deque<NetworkFrame> recent_;
};

}  // namespace chaosmagnet
