#pragma once

// chaosmagnet/engine.hpp: The engine orchestrator: one owned handle per process
// (or per test), never a singleton.
//
// THREADS:
//   - one HarvesterWorker per enabled source (producers)
//   - one conditioning consumer (the ONLY writer of pool, health and metrics)
//   - uplink worker, P2P listener and P2P sender (readers, via get_snapshot())
//   - auto-minter (only with auto_mint.enabled); woken by the consumer,
//     mints from get_snapshot() so conditioning never waits on key generation
//
// LOCKS (never nested in the opposite order):
//   control_mu_    serializes control operations (enable/disable/configure).
//                  May be held while joining a worker thread.
//   consumer_mu_   the conditioning path; condition_once() and reset.
//   slots_mu_      shared: source table structure. Never held while joining.
//   snapshot_mu_   shared: the published snapshot. Exclusive only for the copy.
//   get_snapshot() takes slots_mu_ and snapshot_mu_ shared, nothing else, so a
//   network thread blocked in it can never deadlock a control operation.
//
// CONDITIONING CYCLE (condition_once):
//   Drain the queue in FIFO order. Each sample runs through its source's
//   HealthChecker. A sample is mixed iff none of its symbols failed RCT or
//   APT; excluded samples are still counted and still drive recovery. Mixed bytes feed the source's EntropyEstimator, the
//   concatenation of mixed bytes is compressed into the pool, and the new
//   state is published.
//
// AUTO-MINT:
//   After a mix cycle whose number is a multiple of auto_mint.every_cycles and
//   whose raw batch min-entropy exceeds auto_mint.min_entropy, the consumer
//   flags the auto-minter. Requests arriving while a mint runs coalesce into
//   one. The mint is reported like any other, with requester "auto".
//
// DISABLE:
//   disable_source() halts the worker after its in-flight sample and stops
//   the harvester. Samples already queued stay queued and are conditioned.

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>

#include "chaosmagnet/bounded_queue.hpp"
#include "chaosmagnet/config.hpp"
#include "chaosmagnet/estimator.hpp"
#include "chaosmagnet/harvester.hpp"
#include "chaosmagnet/health.hpp"
#include "chaosmagnet/minter.hpp"
#include "chaosmagnet/network.hpp"
#include "chaosmagnet/node.hpp"
#include "chaosmagnet/observability.hpp"
#include "chaosmagnet/pool.hpp"
#include "chaosmagnet/types.hpp"

namespace chaosmagnet {

class Engine {
 public:
  static constexpr std::size_t kHistoryLength = 300;

  // Validates cfg; nullptr (and result->ok == false) on any error.
  static std::unique_ptr<Engine> create(const EngineConfig& cfg, ConfigValidationResult* result = nullptr);

  // cfg must already have passed validate_config().
  explicit Engine(const EngineConfig& cfg);
  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  // Starts the conditioning consumer, applies the network config and enables
  // every source configured with enabled=true. Source failures are reported
  // as events, not as a start failure.
  ErrorCode start();
  void shutdown();
  bool running() const { return running_.load(std::memory_order_acquire); }

  ErrorCode enable_source(const std::string& id);
  ErrorCode disable_source(const std::string& id);

  EngineSnapshot get_snapshot() const;
  MintResult request_mint(const std::string& requester = "local");

  ConfigValidationResult configure_uplink(const std::string& json_text);
  ConfigValidationResult configure_p2p(const std::string& json_text);

  // Installs h for cfg.id (built-in or new), replacing a disabled slot.
  // invalid_state if the existing slot is enabled.
  ErrorCode register_harvester(std::unique_ptr<Harvester> h, const SourceConfig& cfg);

  // Producer side of the hand-off queue. queue_full after a bounded wait.
  ErrorCode submit_sample(RawSample sample);

  // One conditioning cycle; returns the number of samples consumed.
  std::size_t condition_once();

  // Zeroes every estimator's accumulated entropy. Not a normal operation.
  void reset_accumulators();

  EventLog& events() { return events_; }
  const EventLog& events() const { return events_; }
  EngineStats& stats() { return stats_; }
  const EngineStats& stats() const { return stats_; }
  const NodeIdentity& identity() const { return identity_; }
  const EngineConfig& config() const { return config_; }
  std::size_t queue_depth() const { return queue_.size(); }
  std::uint16_t p2p_bound_port() const { return p2p_.bound_port(); }
  const P2pNode& p2p() const { return p2p_; }

 private:
  struct SourceSlot {
    SourceConfig cfg;
    std::unique_ptr<Harvester> harvester;
    std::unique_ptr<HarvesterWorker> worker;
    std::atomic<bool> enabled{false};
  };

  // Consumer-only state for one source.
  struct Pipeline {
    Pipeline(const SourceConfig& cfg, const EngineConfig& engine);
    HealthChecker    health;
    EntropyEstimator estimator;
    HealthResult     last_result{HealthResult::pass};
    std::uint64_t    bytes_received{0};
  };

  SourceSlot* find_slot(const std::string& id) const;
  void consumer_loop();
  void publish_locked(std::uint64_t now_ms);   // caller holds consumer_mu_
  void on_harvester_fault(const Harvester& h);
  void auto_mint_loop();
  void stop_auto_minter();

  EngineConfig  config_;
  NodeIdentity  identity_;
  EventLog      events_;
  EngineStats   stats_;
  BoundedQueue<RawSample> queue_;

  std::mutex control_mu_;
  mutable std::shared_mutex slots_mu_;
  std::map<std::string, std::unique_ptr<SourceSlot>> slots_;

  std::mutex consumer_mu_;
  std::map<std::string, std::unique_ptr<Pipeline>> pipelines_;
  ExtractionPool pool_;
  std::deque<double> history_min_entropy_;
  std::deque<double> history_whitened_;
  std::uint64_t total_bytes_harvested_{0};

  mutable std::shared_mutex snapshot_mu_;
  EngineSnapshot published_;

  KeyMinter    minter_;
  UplinkClient uplink_;
  P2pNode      p2p_;

  std::atomic<bool> running_{false};
  std::atomic<bool> shut_down_{false};
  std::mutex consumer_wait_mu_;
  std::condition_variable consumer_cv_;
  bool consumer_stop_{false};
  std::thread consumer_;

  std::mutex auto_mint_mu_;
  std::condition_variable auto_mint_cv_;
  bool auto_mint_pending_{false};
  bool auto_mint_stop_{false};
  std::thread auto_minter_;
};

}  // namespace chaosmagnet
