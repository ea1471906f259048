#include "chaosmagnet/harvester.hpp"

#include <cerrno>

namespace chaosmagnet {

ErrorCode errno_to_error(int err) {
  switch (err) {
    case EACCES:
    case EPERM:
      return ErrorCode::permission_denied;
    case ENOENT:
    case ENODEV:
    case ENXIO:
    case ENOTTY:
      return ErrorCode::device_unavailable;
    default:
      return ErrorCode::device_io_failed;
  }
}

uint64_t realtime_ns() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count());
}

uint64_t monotonic_ns() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count());
}

// ---------------------------------------------------------------------------
// Harvester
// ---------------------------------------------------------------------------

Harvester::Harvester(std::string id, std::chrono::milliseconds poll_interval)
    : id_(std::move(id)), poll_interval_(poll_interval) {}

std::string Harvester::last_error() const {
  std::lock_guard<std::mutex> lk(mu_);
  return last_error_;
}

void Harvester::enter_error(ErrorCode code) {
  // Caller holds mu_.
  close_device();
  last_error_ = to_string(code);
  if (!detail_.empty()) last_error_ += ": " + detail_;
  detail_.clear();
  state_.store(HarvesterState::error, std::memory_order_release);
  error_count_.fetch_add(1, std::memory_order_acq_rel);
}

ErrorCode Harvester::start() {
  std::lock_guard<std::mutex> lk(mu_);
  if (state_.load(std::memory_order_acquire) != HarvesterState::disabled) {
    return ErrorCode::invalid_state;
  }
  state_.store(HarvesterState::starting, std::memory_order_release);
  const ErrorCode ec = open_device();
  if (ec != ErrorCode::none) {
    enter_error(ec);
    return ec;
  }
  last_error_.clear();
  sequence_ = 0;
  state_.store(HarvesterState::running, std::memory_order_release);
  return ErrorCode::none;
}

void Harvester::stop() {
  std::lock_guard<std::mutex> lk(mu_);
  if (state_.load(std::memory_order_acquire) == HarvesterState::disabled) return;
  state_.store(HarvesterState::stopping, std::memory_order_release);
  close_device();
  state_.store(HarvesterState::disabled, std::memory_order_release);
}

std::optional<RawSample> Harvester::sample() {
  std::lock_guard<std::mutex> lk(mu_);
  if (state_.load(std::memory_order_acquire) != HarvesterState::running) return std::nullopt;

  std::string payload;
  const ErrorCode ec = read_noise(&payload);
  if (ec != ErrorCode::none) {
    enter_error(ec);
    return std::nullopt;
  }
  if (payload.empty()) return std::nullopt;

  RawSample s;
  s.source_id = id_;
  s.timestamp_ns = realtime_ns();
  s.payload = std::move(payload);
  s.sequence = ++sequence_;
  return s;
}

// ---------------------------------------------------------------------------
// HarvesterWorker
// ---------------------------------------------------------------------------

HarvesterWorker::HarvesterWorker(Harvester& harvester, Sink sink, FaultHandler on_fault)
    : harvester_(harvester), sink_(std::move(sink)), on_fault_(std::move(on_fault)) {}

HarvesterWorker::~HarvesterWorker() { halt(); }

void HarvesterWorker::run() {
  std::lock_guard<std::mutex> lk(mu_);
  if (thread_.joinable()) return;
  stopping_ = false;
  thread_ = std::thread([this] { loop(); });
}

void HarvesterWorker::halt() {
  std::thread joining;
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = true;
    joining = std::move(thread_);
  }
  cv_.notify_all();
  if (joining.joinable()) joining.join();
}

bool HarvesterWorker::running() const {
  std::lock_guard<std::mutex> lk(mu_);
  return thread_.joinable();
}

void HarvesterWorker::loop() {
  uint64_t errors_seen = harvester_.error_count();
  while (true) {
    auto sample = harvester_.sample();
    const uint64_t errors_now = harvester_.error_count();
    if (errors_now != errors_seen) {
      errors_seen = errors_now;
      if (on_fault_) on_fault_(harvester_);
    }
    if (sample) sink_(std::move(*sample));

    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait_for(lock, harvester_.poll_interval(), [this] { return stopping_; });
    if (stopping_) return;
  }
}

}  // namespace chaosmagnet
