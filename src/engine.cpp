#include "chaosmagnet/engine.hpp"

#include <algorithm>
#include <vector>

#include <string.h>  // explicit_bzero

#include "chaosmagnet/harvesters.hpp"

namespace chaosmagnet {

namespace {

constexpr std::chrono::milliseconds kSubmitTimeout{50};
// One mix_cycle event per this many cycles keeps the event ring readable.
constexpr std::uint64_t kMixEventEvery = 100;

}  // namespace

Engine::Pipeline::Pipeline(const SourceConfig& cfg, const EngineConfig& engine)
    : health(cfg.claimed_min_entropy, engine.health_window, engine.alpha_log2),
      estimator(engine.estimator_window) {}

std::unique_ptr<Engine> Engine::create(const EngineConfig& cfg, ConfigValidationResult* result) {
  ConfigValidationResult r = validate_config(cfg);
  if (result) *result = r;
  if (!r.ok) return nullptr;
  return std::make_unique<Engine>(cfg);
}

Engine::Engine(const EngineConfig& cfg)
    : config_(cfg),
      identity_(init_node_identity(cfg.node_id)),
      events_(cfg.event_log_path),
      queue_(cfg.queue_capacity),
      pool_(cfg.target_pool_bits),
      minter_(cfg.bundles_dir, cfg.mint_floor_bits),
      uplink_(identity_.node_id, [this] { return get_snapshot(); }, events_, stats_),
      p2p_(identity_.node_id, [this] { return get_snapshot(); }, events_, stats_) {
  for (const auto& [id, scfg] : config_.sources) {
    auto slot = std::make_unique<SourceSlot>();
    slot->cfg = scfg;
    slot->harvester = make_harvester(scfg);
    if (!slot->harvester) continue;  // validate_config() only admits built-in ids
    slots_[id] = std::move(slot);
    pipelines_[id] = std::make_unique<Pipeline>(scfg, config_);
  }
  std::lock_guard<std::mutex> lk(consumer_mu_);
  publish_locked(unix_time_ms());
}

Engine::~Engine() { shutdown(); }

ErrorCode Engine::start() {
  if (shut_down_.load(std::memory_order_acquire)) return ErrorCode::invalid_state;
  if (running_.exchange(true, std::memory_order_acq_rel)) return ErrorCode::invalid_state;

  {
    std::lock_guard<std::mutex> lk(consumer_wait_mu_);
    consumer_stop_ = false;
  }
  consumer_ = std::thread([this] { consumer_loop(); });
  if (config_.auto_mint.enabled) auto_minter_ = std::thread([this] { auto_mint_loop(); });

  {
    std::lock_guard<std::mutex> lk(control_mu_);
    if (config_.uplink.enabled) uplink_.configure(config_.uplink);
    if (config_.p2p.enabled && p2p_.configure(config_.p2p) != ErrorCode::none) {
      config_.p2p.enabled = false;
    }
  }

  std::vector<std::string> autostart;
  for (const auto& [id, scfg] : config_.sources) {
    if (scfg.enabled) autostart.push_back(id);
  }
  std::size_t failed = 0;
  for (const auto& id : autostart) {
    // Each failure has already been reported as a harvester_error event.
    if (enable_source(id) != ErrorCode::none) ++failed;
  }
  events_.emit(EventKind::engine_started, "", failed == 0,
               "node " + identity_.node_id + ", " + std::to_string(autostart.size() - failed) + "/" +
                   std::to_string(autostart.size()) + " sources started");
  return ErrorCode::none;
}

void Engine::shutdown() {
  if (shut_down_.exchange(true, std::memory_order_acq_rel)) return;

  {
    std::lock_guard<std::mutex> lk(control_mu_);
    std::shared_lock<std::shared_mutex> slots_lock(slots_mu_);
    for (auto& [id, slot] : slots_) {
      if (slot->worker) slot->worker->halt();
      slot->harvester->stop();
      slot->enabled.store(false, std::memory_order_release);
    }
  }
  uplink_.stop();
  p2p_.stop();

  if (running_.load(std::memory_order_acquire)) {
    {
      std::lock_guard<std::mutex> lk(consumer_wait_mu_);
      consumer_stop_ = true;
    }
    consumer_cv_.notify_all();
    if (consumer_.joinable()) consumer_.join();
    stop_auto_minter();
    running_.store(false, std::memory_order_release);
    events_.emit(EventKind::engine_stopped, "", true, "");
  }
  queue_.close();
}

// ---------------------------------------------------------------------------
// Source control
// ---------------------------------------------------------------------------

Engine::SourceSlot* Engine::find_slot(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lk(slots_mu_);
  auto it = slots_.find(normalize_source_id(id));
  return it == slots_.end() ? nullptr : it->second.get();
}

ErrorCode Engine::enable_source(const std::string& id) {
  if (shut_down_.load(std::memory_order_acquire)) return ErrorCode::invalid_state;
  std::lock_guard<std::mutex> lk(control_mu_);
  SourceSlot* slot = find_slot(id);
  if (!slot) return ErrorCode::unknown_source;
  if (slot->enabled.load(std::memory_order_acquire) &&
      slot->harvester->state() == HarvesterState::running) {
    return ErrorCode::none;
  }

  // Error (or a stale worker) is left through stop() + start().
  if (slot->worker) slot->worker->halt();
  slot->harvester->stop();

  const ErrorCode ec = slot->harvester->start();
  if (ec != ErrorCode::none) {
    slot->enabled.store(false, std::memory_order_release);
    events_.emit(EventKind::harvester_error, slot->cfg.id, false, slot->harvester->last_error());
    return ec;
  }
  if (!slot->worker) {
    slot->worker = std::make_unique<HarvesterWorker>(
        *slot->harvester,
        [this](RawSample&& s) {
          // Rejections are counted by submit_sample().
          if (submit_sample(std::move(s)) != ErrorCode::none) return;
        },
        [this](const Harvester& h) { on_harvester_fault(h); });
  }
  slot->enabled.store(true, std::memory_order_release);
  slot->worker->run();
  events_.emit(EventKind::source_enabled, slot->cfg.id, true, "");
  return ErrorCode::none;
}

ErrorCode Engine::disable_source(const std::string& id) {
  std::lock_guard<std::mutex> lk(control_mu_);
  SourceSlot* slot = find_slot(id);
  if (!slot) return ErrorCode::unknown_source;

  slot->enabled.store(false, std::memory_order_release);
  if (slot->worker) slot->worker->halt();
  slot->harvester->stop();
  events_.emit(EventKind::source_disabled, slot->cfg.id, true,
               std::to_string(queue_.size()) + " samples still queued");
  return ErrorCode::none;
}

void Engine::on_harvester_fault(const Harvester& h) {
  events_.emit(EventKind::harvester_error, h.id(), false, h.last_error());
}

ErrorCode Engine::register_harvester(std::unique_ptr<Harvester> h, const SourceConfig& cfg) {
  if (!h || h->id() != cfg.id || cfg.id.empty()) return ErrorCode::config_invalid;
  if (cfg.claimed_min_entropy <= 0.0 || cfg.claimed_min_entropy > 8.0) return ErrorCode::config_invalid;

  std::lock_guard<std::mutex> control(control_mu_);
  std::lock_guard<std::mutex> consumer(consumer_mu_);
  std::unique_lock<std::shared_mutex> slots_lock(slots_mu_);

  auto it = slots_.find(cfg.id);
  if (it != slots_.end()) {
    if (it->second->enabled.load(std::memory_order_acquire)) return ErrorCode::invalid_state;
    if (it->second->worker) it->second->worker->halt();
    it->second->harvester->stop();
  }
  auto slot = std::make_unique<SourceSlot>();
  slot->cfg = cfg;
  slot->cfg.enabled = false;
  slot->harvester = std::move(h);
  slots_[cfg.id] = std::move(slot);
  pipelines_[cfg.id] = std::make_unique<Pipeline>(cfg, config_);
  config_.sources[cfg.id] = cfg;
  return ErrorCode::none;
}

// ---------------------------------------------------------------------------
// Conditioning
// ---------------------------------------------------------------------------

ErrorCode Engine::submit_sample(RawSample sample) {
  if (!queue_.push_for(std::move(sample), kSubmitTimeout)) {
    stats_.samples_queue_full.fetch_add(1, std::memory_order_relaxed);
    return ErrorCode::queue_full;
  }
  stats_.samples_accepted.fetch_add(1, std::memory_order_relaxed);
  return ErrorCode::none;
}

std::size_t Engine::condition_once() {
  std::lock_guard<std::mutex> lk(consumer_mu_);
  std::vector<RawSample> batch = queue_.drain(queue_.capacity());
  if (batch.empty()) return 0;

  std::uint64_t elapsed_ns = 0;
  bool want_auto_mint = false;
  {
    ScopeTimer timer(elapsed_ns);
    std::string raw;
    for (auto& s : batch) {
      auto it = pipelines_.find(s.source_id);
      if (it == pipelines_.end()) {
        stats_.samples_rejected.fetch_add(1, std::memory_order_relaxed);
        continue;
      }
      Pipeline& p = *it->second;
      p.bytes_received += s.payload.size();
      total_bytes_harvested_ += s.payload.size();

      const HealthResult result = p.health.feed(s.payload);
      if (result != p.last_result) {
        if (result == HealthResult::fail) {
          stats_.health_failures.fetch_add(1, std::memory_order_relaxed);
          events_.emit(EventKind::health_fail, s.source_id, false,
                       "rct run " + std::to_string(p.health.longest_run_in_sample()) + "/" +
                           std::to_string(p.health.rct().cutoff()) + ", apt " +
                           (p.health.apt().failing() ? "fail" : "pass"));
        } else {
          events_.emit(EventKind::health_recovered, s.source_id, true, "");
        }
        p.last_result = result;
      }
      if (result == HealthResult::fail) {
        stats_.bytes_excluded.fetch_add(s.payload.size(), std::memory_order_relaxed);
        continue;
      }
      p.estimator.feed(s.payload);
      raw += s.payload;
      stats_.samples_conditioned.fetch_add(1, std::memory_order_relaxed);
    }

    const std::uint64_t now_ms = unix_time_ms();
    if (pool_.mix(raw, now_ms)) {
      stats_.bytes_conditioned.fetch_add(raw.size(), std::memory_order_relaxed);
      const std::uint64_t cycles = stats_.mix_cycles.fetch_add(1, std::memory_order_relaxed) + 1;

      const PoolBytes& bytes = pool_.state().bytes;
      const double raw_min = min_entropy(raw);
      history_min_entropy_.push_back(raw_min);
      history_whitened_.push_back(
          shannon_entropy(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size())));
      while (history_min_entropy_.size() > kHistoryLength) history_min_entropy_.pop_front();
      while (history_whitened_.size() > kHistoryLength) history_whitened_.pop_front();

      want_auto_mint = config_.auto_mint.enabled && cycles % config_.auto_mint.every_cycles == 0 &&
                       raw_min > config_.auto_mint.min_entropy;
      if (cycles % kMixEventEvery == 0) {
        events_.emit(EventKind::mix_cycle, "", true,
                     std::to_string(cycles) + " cycles, ratio " + jsonlite::format_double(pool_.state().extraction_ratio));
      }
    }
    explicit_bzero(raw.data(), raw.size());
    publish_locked(now_ms);
  }
  // Only after publishing, so the auto-minter sees this cycle's pool.
  if (want_auto_mint) {
    {
      std::lock_guard<std::mutex> am(auto_mint_mu_);
      auto_mint_pending_ = true;
    }
    auto_mint_cv_.notify_one();
  }
  stats_.mix_latency.record(elapsed_ns);
  return batch.size();
}

void Engine::publish_locked(std::uint64_t now_ms) {
  std::vector<SourceState> sources;
  sources.reserve(pipelines_.size());
  for (const auto& [id, p] : pipelines_) {
    SourceState s;
    s.source_id = id;
    s.last_health_result = p->last_result;
    s.metrics = p->estimator.metrics();
    s.bytes_received = p->bytes_received;
    s.health_failures = p->health.failure_count();
    sources.push_back(std::move(s));
  }
  pool_.update_fill(total_conservative_entropy(sources));

  EngineSnapshot next;
  next.pool = pool_.state();
  next.sources = std::move(sources);
  next.history_min_entropy.assign(history_min_entropy_.begin(), history_min_entropy_.end());
  next.history_whitened.assign(history_whitened_.begin(), history_whitened_.end());
  next.total_bytes_harvested = total_bytes_harvested_;
  next.taken_at_ms = now_ms;

  std::unique_lock<std::shared_mutex> lk(snapshot_mu_);
  published_ = std::move(next);
}

void Engine::reset_accumulators() {
  std::lock_guard<std::mutex> lk(consumer_mu_);
  for (auto& [id, p] : pipelines_) p->estimator.reset();
  publish_locked(unix_time_ms());
}

void Engine::consumer_loop() {
  const auto interval = std::chrono::milliseconds(config_.mix_interval_ms);
  while (true) {
    {
      std::unique_lock<std::mutex> lock(consumer_wait_mu_);
      consumer_cv_.wait_for(lock, interval, [this] { return consumer_stop_; });
      if (consumer_stop_) break;
    }
    condition_once();
  }
  // Samples queued before shutdown are still conditioned.
  condition_once();
}

void Engine::auto_mint_loop() {
  std::unique_lock<std::mutex> lock(auto_mint_mu_);
  while (true) {
    auto_mint_cv_.wait(lock, [this] { return auto_mint_stop_ || auto_mint_pending_; });
    if (auto_mint_stop_) return;
    auto_mint_pending_ = false;
    lock.unlock();
    stats_.mints_auto.fetch_add(1, std::memory_order_relaxed);
    // request_mint() counts and logs the outcome.
    request_mint("auto");
    lock.lock();
  }
}

void Engine::stop_auto_minter() {
  {
    std::lock_guard<std::mutex> lk(auto_mint_mu_);
    auto_mint_stop_ = true;
  }
  auto_mint_cv_.notify_all();
  if (auto_minter_.joinable()) auto_minter_.join();
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

EngineSnapshot Engine::get_snapshot() const {
  EngineSnapshot snap;
  {
    std::shared_lock<std::shared_mutex> lk(snapshot_mu_);
    snap = published_;
  }
  {
    std::shared_lock<std::shared_mutex> lk(slots_mu_);
    for (auto& s : snap.sources) {
      auto it = slots_.find(s.source_id);
      if (it == slots_.end()) continue;
      s.enabled = it->second->enabled.load(std::memory_order_acquire);
      s.lifecycle = it->second->harvester->state();
      s.last_error = it->second->harvester->last_error();
    }
  }
  const UplinkConfig up = uplink_.config();
  snap.uplink_enabled = up.enabled;
  snap.uplink_target = uplink_target(up);
  const P2pConfig p2p = p2p_.config();
  snap.p2p_enabled = p2p.enabled;
  snap.p2p_port = p2p_.bound_port() != 0 ? p2p_.bound_port() : p2p.listen_port;
  snap.p2p_peer_count = p2p.peers.size();
  snap.p2p_received_count = p2p_.received_count();
  snap.taken_at_ms = unix_time_ms();
  return snap;
}

MintResult Engine::request_mint(const std::string& requester) {
  const EngineSnapshot snap = get_snapshot();
  MintResult r;
  std::uint64_t elapsed_ns = 0;
  {
    ScopeTimer timer(elapsed_ns);
    r = minter_.mint(snap, requester);
  }
  stats_.mint_latency.record(elapsed_ns);
  if (r.ok) {
    stats_.mints_ok.fetch_add(1, std::memory_order_relaxed);
    events_.emit(EventKind::mint_ok, requester, true, r.bundle.bundle_id + " -> " + r.bundle.file_path);
    uplink_.trigger();
  } else {
    stats_.mints_failed.fetch_add(1, std::memory_order_relaxed);
    events_.emit(EventKind::mint_failed, requester, false, to_string(r.error_code) + ": " + r.message);
  }
  return r;
}

// ---------------------------------------------------------------------------
// Network configuration
// ---------------------------------------------------------------------------

ConfigValidationResult Engine::configure_uplink(const std::string& json_text) {
  std::lock_guard<std::mutex> lk(control_mu_);
  UplinkConfig next = config_.uplink;
  ConfigValidationResult r = parse_uplink_config(json_text, &next);
  if (!r.ok) {
    events_.emit(EventKind::config_rejected, "uplink", false, r.errors.empty() ? "" : r.errors.front());
    return r;
  }
  uplink_.configure(next);
  config_.uplink = next;
  events_.emit(EventKind::config_applied, "uplink", true,
               std::string(next.enabled ? "enabled " : "disabled ") + uplink_target(next));
  return r;
}

ConfigValidationResult Engine::configure_p2p(const std::string& json_text) {
  std::lock_guard<std::mutex> lk(control_mu_);
  P2pConfig next = config_.p2p;
  ConfigValidationResult r = parse_p2p_config(json_text, &next);
  if (!r.ok) {
    events_.emit(EventKind::config_rejected, "p2p", false, r.errors.empty() ? "" : r.errors.front());
    return r;
  }
  if (p2p_.configure(next) != ErrorCode::none) {
    r.ok = false;
    r.errors.push_back("p2p: cannot listen on port " + std::to_string(next.listen_port));
    // Put the previous listener back; if that fails too the node stays off.
    if (p2p_.configure(config_.p2p) != ErrorCode::none) config_.p2p.enabled = false;
    events_.emit(EventKind::config_rejected, "p2p", false, r.errors.back());
    return r;
  }
  config_.p2p = next;
  events_.emit(EventKind::config_applied, "p2p", true,
               std::string(next.enabled ? "enabled" : "disabled") + ", port " +
                   std::to_string(p2p_.bound_port()) + ", " + std::to_string(next.peers.size()) + " peers");
  return r;
}

}  // namespace chaosmagnet
