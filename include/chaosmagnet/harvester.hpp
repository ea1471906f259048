#pragma once

// chaosmagnet/harvester.hpp: Source harvester contract and its worker thread.
//
// STATE MACHINE:
//   disabled --start()--> starting --(device ok)--> running --stop()--> stopping --> disabled
//                              \--(device fault)--> error <--(read fault)--/
//   error --stop()--> disabled. Nothing else leaves error.
//
// DEVICE HANDLES:
//   Subclasses hold their handles in RAII members (UniqueFd). close_device()
//   is called on every path out of starting/running, including error, and
//   must be idempotent.
//
// CONCURRENCY:
//   start(), stop() and sample() serialize on one mutex, so stop() waits for an
//   in-flight sample() to finish. That sample still reaches the queue: disable
//   drains, it does not discard.
//
// EXTENSION_POINT: new_source_variant
//   Derive from Harvester, implement open_device/close_device/read_noise, and
//   add the id to builtin_source_ids() + make_harvester(). read_noise() must
//   never block longer than one poll interval.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include "chaosmagnet/types.hpp"

namespace chaosmagnet {

// errno -> ErrorCode: EACCES/EPERM -> permission_denied,
// ENOENT/ENODEV/ENXIO/ENOTTY -> device_unavailable, else device_io_failed.
ErrorCode errno_to_error(int err);

uint64_t realtime_ns();
uint64_t monotonic_ns();

class Harvester {
 public:
  Harvester(std::string id, std::chrono::milliseconds poll_interval);
  virtual ~Harvester() = default;

  Harvester(const Harvester&) = delete;
  Harvester& operator=(const Harvester&) = delete;

  ErrorCode start();
  void stop();
  std::optional<RawSample> sample();

  const std::string& id() const { return id_; }
  std::chrono::milliseconds poll_interval() const { return poll_interval_; }
  HarvesterState state() const { return state_.load(std::memory_order_acquire); }
  std::string last_error() const;
  uint64_t error_count() const { return error_count_.load(std::memory_order_acquire); }

 protected:
  virtual ErrorCode open_device() = 0;
  virtual void close_device() = 0;
  // Appends noise to *out. ErrorCode::none with nothing appended means no data yet.
  virtual ErrorCode read_noise(std::string* out) = 0;

  // Detail for the next error transition ("open /dev/video0: No such file").
  void note(std::string detail) { detail_ = std::move(detail); }

 private:
  void enter_error(ErrorCode code);

  const std::string id_;
  const std::chrono::milliseconds poll_interval_;
  std::atomic<HarvesterState> state_{HarvesterState::disabled};
  std::atomic<uint64_t> error_count_{0};

  mutable std::mutex mu_;
  std::string detail_;
  std::string last_error_;
  uint64_t sequence_{0};
};

// ---------------------------------------------------------------------------
// HarvesterWorker: one thread per harvester.
// ---------------------------------------------------------------------------
class HarvesterWorker {
 public:
  using Sink = std::function<void(RawSample&&)>;
  using FaultHandler = std::function<void(const Harvester&)>;

  HarvesterWorker(Harvester& harvester, Sink sink, FaultHandler on_fault);
  ~HarvesterWorker();

  HarvesterWorker(const HarvesterWorker&) = delete;
  HarvesterWorker& operator=(const HarvesterWorker&) = delete;

  void run();    // no-op if already running
  void halt();   // finishes the in-flight iteration, then joins
  bool running() const;

 private:
  void loop();

  Harvester&   harvester_;
  Sink         sink_;
  FaultHandler on_fault_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool stopping_{false};
  std::thread thread_;
};

}  // namespace chaosmagnet
