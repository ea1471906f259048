#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "chaosmagnet/bounded_queue.hpp"
#include "chaosmagnet/c_api.h"
#include "chaosmagnet/config.hpp"
#include "chaosmagnet/engine.hpp"
#include "chaosmagnet/estimator.hpp"
#include "chaosmagnet/harvester.hpp"
#include "chaosmagnet/harvesters.hpp"
#include "chaosmagnet/hash.hpp"
#include "chaosmagnet/health.hpp"
#include "chaosmagnet/jsonlite.hpp"
#include "chaosmagnet/mint_ledger.hpp"
#include "chaosmagnet/minter.hpp"
#include "chaosmagnet/network.hpp"
#include "chaosmagnet/observability.hpp"
#include "chaosmagnet/pool.hpp"
#include "chaosmagnet/pqc.hpp"
#include "chaosmagnet/version.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

fs::path fresh_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / ("chaosmagnet_" + name + "_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

std::size_t count_bundle_files(const fs::path& dir) {
  if (!fs::exists(dir)) return 0;
  std::size_t n = 0;
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (entry.path().filename().string().rfind("bundle_", 0) == 0) ++n;
  }
  return n;
}

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds limit) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(10ms);
  }
  return pred();
}

// A port nothing listens on: bind an ephemeral port, then release it.
std::uint16_t closed_local_port() {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  expect(fd >= 0, "socket()");
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  expect(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0, "bind ephemeral");
  socklen_t len = sizeof(addr);
  expect(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0, "getsockname");
  ::close(fd);
  return ntohs(addr.sin_port);
}

chaosmagnet::EngineConfig test_engine_config(const fs::path& dir) {
  chaosmagnet::EngineConfig cfg = chaosmagnet::default_engine_config();
  cfg.bundles_dir = (dir / "keys").string();
  cfg.mix_interval_ms = 10;
  cfg.mint_floor_bits = 0.0;
  cfg.node_id = "test-node";
  return cfg;
}

const chaosmagnet::SourceState* find_source(const chaosmagnet::EngineSnapshot& snap, const std::string& id) {
  for (const auto& s : snap.sources) {
    if (s.source_id == id) return &s;
  }
  return nullptr;
}

chaosmagnet::RawSample make_sample(const std::string& id, const std::string& payload, std::uint64_t seq) {
  chaosmagnet::RawSample s;
  s.source_id = id;
  s.timestamp_ns = chaosmagnet::realtime_ns();
  s.payload = payload;
  s.sequence = seq;
  return s;
}

// Harvester driven entirely by the test: no device, scripted faults.
class ScriptedHarvester : public chaosmagnet::Harvester {
 public:
  explicit ScriptedHarvester(std::string id, std::chrono::milliseconds poll = 5ms)
      : Harvester(std::move(id), poll) {}

  void set_fail_open(bool v) { fail_open_ = v; }
  void set_fail_read(bool v) { fail_read_ = v; }
  int closes() const { return closes_.load(); }

 protected:
  chaosmagnet::ErrorCode open_device() override {
    if (fail_open_) {
      note("scripted open failure");
      return chaosmagnet::ErrorCode::device_unavailable;
    }
    return chaosmagnet::ErrorCode::none;
  }
  void close_device() override { closes_.fetch_add(1); }
  chaosmagnet::ErrorCode read_noise(std::string* out) override {
    if (fail_read_) return chaosmagnet::ErrorCode::device_io_failed;
    // Odd multiplier: 256 consecutive bytes are pairwise distinct.
    for (int i = 0; i < 32; ++i) out->push_back(static_cast<char>((counter_++ * 73 + 11) & 0xFF));
    return chaosmagnet::ErrorCode::none;
  }

 private:
  std::atomic<bool> fail_open_{false};
  std::atomic<bool> fail_read_{false};
  std::atomic<int> closes_{0};
  unsigned counter_{0};
};

chaosmagnet::EngineSnapshot mintable_snapshot(std::uint8_t fill, double bits) {
  chaosmagnet::EngineSnapshot snap;
  for (std::size_t i = 0; i < chaosmagnet::kPoolSize; ++i) {
    snap.pool.bytes[i] = static_cast<std::uint8_t>(fill + i * 7);
  }
  chaosmagnet::SourceState s;
  s.source_id = chaosmagnet::kSourceOsRng;
  s.enabled = true;
  s.lifecycle = chaosmagnet::HarvesterState::running;
  s.last_health_result = chaosmagnet::HealthResult::pass;
  s.metrics.shannon_bits_per_byte = 7.9;
  s.metrics.collision_entropy_bits_per_byte = 7.8;
  s.metrics.min_entropy_bits_per_byte = 7.5;
  s.metrics.accumulated_true_entropy_bits = bits;
  snap.sources.push_back(s);
  return snap;
}

// ============================================================================
// Phase 1: Hashing
// ============================================================================

void test_blake3_known_vectors() {
  expect(chaosmagnet::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(chaosmagnet::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
  const auto info = chaosmagnet::hash_runtime_info();
  expect(info.primitive == "blake3", "primitive must be blake3");
  expect(!info.version.empty(), "blake3 version must be reported");
}

void test_hex_helpers() {
  expect(chaosmagnet::to_hex(std::string("\x01\xab\xff", 3)) == "01abff", "to_hex");
  std::string out;
  expect(chaosmagnet::from_hex("01abff", &out) && out == std::string("\x01\xab\xff", 3), "from_hex");
  expect(!chaosmagnet::from_hex("abc", &out), "odd-length hex rejected");
  expect(!chaosmagnet::from_hex("zz", &out), "non-hex rejected");
}

void test_domain_separation() {
  const std::string k = chaosmagnet::derive_key_bytes(chaosmagnet::kKemSeedContext, "pool", 32);
  const std::string s = chaosmagnet::derive_key_bytes(chaosmagnet::kSigSeedContext, "pool", 32);
  const std::string w = chaosmagnet::derive_key_bytes(chaosmagnet::kFrameWhiteningContext, "pool", 32);
  expect(k.size() == 32, "derived key length");
  expect(k != s && k != w && s != w, "contexts must separate outputs");
  expect(chaosmagnet::derive_key_bytes(chaosmagnet::kKemSeedContext, "pool", 64).substr(0, 32) == k,
         "XOF output is prefix-stable");
  expect(chaosmagnet::hash_domain("cm:a:", "x") != chaosmagnet::hash_domain("cm:b:", "x"),
         "hash_domain separates prefixes");
}

void test_seeded_stream_deterministic() {
  std::array<std::uint8_t, 32> seed{};
  seed[0] = 1;
  chaosmagnet::SeededStream a(seed);
  chaosmagnet::SeededStream b(seed);
  std::vector<std::uint8_t> x(100), y(100);
  a.generate(x.data(), 40);
  a.generate(x.data() + 40, 60);
  b.generate(y.data(), 100);
  expect(x == y, "chunking must not change the stream");
  expect(a.position() == 100, "position tracks bytes generated");

  seed[0] = 2;
  chaosmagnet::SeededStream c(seed);
  std::vector<std::uint8_t> z(100);
  c.generate(z.data(), z.size());
  expect(z != x, "different seeds give different streams");
}

// ============================================================================
// Phase 2: JSON and configuration
// ============================================================================

void test_json_strictness() {
  std::optional<chaosmagnet::jsonlite::JsonError> err;
  chaosmagnet::jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate keys rejected");
  err.reset();
  chaosmagnet::jsonlite::parse("{\"a\":NaN}", &err);
  expect(err.has_value(), "NaN rejected");
  err.reset();
  chaosmagnet::jsonlite::parse("{\"a\":1} x", &err);
  expect(err && err->code == "json_parse_error", "trailing data rejected");
  err.reset();
  const auto canon = chaosmagnet::jsonlite::canonicalize_json("{ \"b\": 1, \"a\": [true, null] }", &err);
  expect(!err && canon == "{\"a\":[true,null],\"b\":1}", "canonical form sorts keys");
}

void test_config_defaults_valid() {
  const auto cfg = chaosmagnet::default_engine_config();
  const auto r = chaosmagnet::validate_config(cfg);
  expect(r.ok, "default config must validate");
  expect(cfg.sources.size() == chaosmagnet::builtin_source_ids().size(), "one source config per built-in");
  expect(cfg.p2p.listen_port == 9000, "default p2p port");
  expect(chaosmagnet::uplink_target(cfg.uplink) == "http://127.0.0.1:8000/ingest", "default uplink target");
}

void test_config_overlay_and_aliases() {
  auto cfg = chaosmagnet::default_engine_config();
  const auto r = chaosmagnet::parse_engine_config(
      R"json({"mint_floor_bits":128,"sources":{"HID (Mouse)":{"enabled":true,"device_path":"/dev/input/event3"}},
          "p2p":{"peers":["10.0.0.2:9000","[::1]:9001"]}})json",
      &cfg);
  expect(r.ok, "valid overlay accepted");
  expect(cfg.mint_floor_bits == 128.0, "scalar overlay");
  expect(cfg.sources.at("HID").enabled, "GUI alias resolves to HID");
  expect(cfg.sources.at("HID").device_path == "/dev/input/event3", "device path overlay");
  expect(cfg.sources.at("HID").poll_interval_ms == 50, "absent keys keep their value");
  expect(cfg.p2p.peers.size() == 2 && cfg.p2p.peers[1].host == "::1", "peer list parsed");
  expect(chaosmagnet::normalize_source_id("system/cpu") == "SYSTEM", "case-insensitive alias");
}

void test_config_rejects_and_reports_all() {
  auto cfg = chaosmagnet::default_engine_config();
  const auto before = cfg.queue_capacity;
  const auto r = chaosmagnet::parse_engine_config(
      R"({"queue_capacity":0,"sources":{"OS_RNG":{"claimed_min_entropy":-1}},"uplink":{"port":0}})", &cfg);
  expect(!r.ok, "invalid config rejected");
  expect(r.errors.size() >= 3, "every error is reported");
  expect(cfg.queue_capacity == before, "rejected config leaves target untouched");

  expect(!chaosmagnet::parse_engine_config(R"({"sources":{"RADIO":{}}})", &cfg).ok, "unknown source rejected");
  expect(!chaosmagnet::parse_engine_config(R"({"p2p":{"peers":["nohost"]}})", &cfg).ok, "malformed peer rejected");
  expect(!chaosmagnet::parse_engine_config("{not json", &cfg).ok, "malformed JSON rejected");

  const auto w = chaosmagnet::parse_engine_config(R"({"colour":"blue"})", &cfg);
  expect(w.ok && !w.warnings.empty(), "unknown keys warn, not fail");
}

void test_peer_address_parsing() {
  expect(chaosmagnet::parse_peer_address("127.0.0.1:9000").has_value(), "v4 peer");
  expect(chaosmagnet::parse_peer_address("[fe80::1]:80").has_value(), "bracketed v6 peer");
  expect(!chaosmagnet::parse_peer_address("fe80::1:80").has_value(), "bare v6 rejected");
  expect(!chaosmagnet::parse_peer_address("host:0").has_value(), "port 0 rejected");
  expect(!chaosmagnet::parse_peer_address("host:70000").has_value(), "port overflow rejected");
  expect(!chaosmagnet::parse_peer_address("host").has_value(), "missing port rejected");
}

// ============================================================================
// Phase 3: Health tests and estimators
// ============================================================================

void test_rct_boundary() {
  expect(chaosmagnet::rct_cutoff(1.08, 20.0) == 20, "C = ceil(1 + 20/1.08) = 20");
  chaosmagnet::RepetitionCountTest rct(chaosmagnet::rct_cutoff(1.08, 20.0));
  for (int i = 0; i < 20; ++i) rct.feed(0x5a);
  expect(!rct.failing(), "run of exactly C passes");
  rct.feed(0x5a);
  expect(rct.failing(), "run of C+1 fails");
  rct.feed(0x11);
  expect(!rct.failing() && rct.run_length() == 1, "distinct symbol recovers");
}

void test_apt_window() {
  const auto cutoff = chaosmagnet::apt_cutoff(16, 8.0, 20.0);
  expect(cutoff >= 2 && cutoff < 8, "APT cutoff for W=16, H=8");
  chaosmagnet::AdaptiveProportionTest apt(16, cutoff);
  // Reference symbol on every other position: RCT never sees a run.
  for (int i = 0; i < 16; ++i) apt.feed(i % 2 == 0 ? 0xAA : static_cast<std::uint8_t>(i));
  expect(apt.failing() && apt.windows_evaluated() == 1, "over-represented reference fails");
  for (int i = 0; i < 16; ++i) apt.feed(static_cast<std::uint8_t>(i));
  expect(!apt.failing(), "passing window clears failure");
}

void test_health_checker_recovery() {
  chaosmagnet::HealthChecker hc(1.08, 512, 20.0);
  expect(hc.feed(std::string(20, 'x')) == chaosmagnet::HealthResult::pass, "20 repeats pass");
  expect(hc.feed("x") == chaosmagnet::HealthResult::fail, "21st repeat fails");
  expect(hc.failure_count() == 1, "one pass->fail transition");
  expect(hc.feed("y") == chaosmagnet::HealthResult::pass, "automatic recovery");
  hc.feed(std::string(25, 'z'));
  expect(hc.failure_count() == 2, "second transition counted");
}

void test_health_checker_judges_whole_sample() {
  chaosmagnet::HealthChecker hc(1.08, 512, 20.0);
  // Stuck run, then one fresh byte: the tests have recovered by the end, the
  // sample has not.
  const std::string stuck = std::string(256, '\0') + '\x37';
  expect(hc.feed(stuck) == chaosmagnet::HealthResult::fail, "mid-sample RCT failure taints the sample");
  expect(hc.result() == chaosmagnet::HealthResult::pass, "state after the last byte is pass");
  expect(hc.longest_run_in_sample() == 256, "longest run reported");
  expect(hc.failure_count() == 1, "one transition");
  expect(hc.feed("\x01\x02\x03") == chaosmagnet::HealthResult::pass, "next clean sample passes");
}

void test_entropy_ordering_property() {
  std::mt19937 rng(0xC4A05);
  for (int trial = 0; trial < 300; ++trial) {
    const std::size_t len = 1 + rng() % 2048;
    const unsigned alphabet = 1 + rng() % 256;
    const unsigned skew = rng() % 4;
    std::string bytes;
    for (std::size_t i = 0; i < len; ++i) {
      unsigned v = rng() % alphabet;
      for (unsigned k = 0; k < skew; ++k) v = std::min(v, static_cast<unsigned>(rng() % alphabet));
      bytes.push_back(static_cast<char>(v));
    }
    chaosmagnet::EntropyMetrics m;
    chaosmagnet::estimate_distribution(bytes, &m);
    expect(m.min_entropy_bits_per_byte >= 0.0, "min >= 0");
    expect(m.min_entropy_bits_per_byte <= m.collision_entropy_bits_per_byte, "min <= collision");
    expect(m.collision_entropy_bits_per_byte <= m.shannon_bits_per_byte, "collision <= shannon");
    expect(m.shannon_bits_per_byte <= 8.0, "shannon <= 8");
  }

  std::string uniform;
  for (int i = 0; i < 256; ++i) uniform.push_back(static_cast<char>(i));
  chaosmagnet::EntropyMetrics u;
  chaosmagnet::estimate_distribution(uniform, &u);
  expect(std::fabs(u.shannon_bits_per_byte - 8.0) < 1e-9, "uniform shannon = 8");
  expect(std::fabs(u.min_entropy_bits_per_byte - 8.0) < 1e-9, "uniform min = 8");

  chaosmagnet::EntropyMetrics c;
  chaosmagnet::estimate_distribution(std::string(100, 'a'), &c);
  expect(c.shannon_bits_per_byte == 0.0 && c.min_entropy_bits_per_byte == 0.0, "constant input has no entropy");
}

void test_estimator_windows() {
  chaosmagnet::EntropyEstimator est(16);
  std::string first;
  for (int i = 0; i < 15; ++i) first.push_back(static_cast<char>(i));
  expect(est.feed(first) == 0, "no window before 16 bytes");
  expect(est.metrics().accumulated_true_entropy_bits == 0.0, "nothing accumulated yet");
  expect(est.feed(std::string(1, '\x0f')) == 1, "16th byte completes a window");
  expect(std::fabs(est.metrics().min_entropy_bits_per_byte - 4.0) < 1e-9, "16 distinct bytes = 4 bits");
  expect(std::fabs(est.metrics().accumulated_true_entropy_bits - 64.0) < 1e-9, "accumulates min * window");
  const double before = est.metrics().accumulated_true_entropy_bits;
  est.feed(std::string(16, 'q'));
  expect(est.metrics().accumulated_true_entropy_bits >= before, "accumulation never decreases");
  expect(est.metrics().sample_count == 3, "samples counted");
  est.reset();
  expect(est.metrics().accumulated_true_entropy_bits == 0.0, "reset clears accumulation");
}

// ============================================================================
// Phase 4: Pool and hand-off queue
// ============================================================================

void test_pool_mixing_deterministic() {
  chaosmagnet::ExtractionPool a(256.0);
  chaosmagnet::ExtractionPool b(256.0);
  expect(a.mix(std::string(64, 'r'), 1) && b.mix(std::string(64, 'r'), 2), "mix accepts input");
  expect(a.state().bytes == b.state().bytes, "same prior + input => same pool");
  expect(a.state().bytes.size() == 32, "pool is 32 bytes");
  expect(std::fabs(a.state().extraction_ratio - 2.0) < 1e-12, "64 raw bytes per 32-byte cycle");

  const auto before = a.state();
  expect(!a.mix("", 3), "empty input is not a cycle");
  expect(a.state().bytes == before.bytes && a.state().mix_cycle_count == 1, "empty input changes nothing");

  b.mix("other", 4);
  a.mix("input", 4);
  expect(a.state().bytes != b.state().bytes, "different input diverges");

  a.update_fill(1000.0);
  expect(a.state().fill_fraction == 1.0, "fill clamps at 1");
}

void test_bounded_queue() {
  chaosmagnet::BoundedQueue<int> q(2);
  expect(q.push_for(1, 10ms) && q.push_for(2, 10ms), "room for two");
  expect(!q.push_for(3, 10ms), "full queue times out");
  auto items = q.drain(10);
  expect(items.size() == 2 && items[0] == 1 && items[1] == 2, "FIFO drain");
  q.push_for(4, 10ms);
  q.close();
  expect(!q.push_for(5, 10ms), "push after close fails");
  auto left = q.pop_for(10ms);
  expect(left && *left == 4, "pop drains after close");
}

// ============================================================================
// Phase 5: Harvesters
// ============================================================================

void test_harvester_state_machine() {
  ScriptedHarvester h("SCRIPTED");
  h.set_fail_open(true);
  expect(h.start() == chaosmagnet::ErrorCode::device_unavailable, "open failure reported");
  expect(h.state() == chaosmagnet::HarvesterState::error, "open failure => error");
  expect(h.last_error().find("scripted open failure") != std::string::npos, "detail kept");
  expect(h.start() == chaosmagnet::ErrorCode::invalid_state, "error is left only through stop()");
  h.stop();
  expect(h.state() == chaosmagnet::HarvesterState::disabled, "stop() leaves error");

  h.set_fail_open(false);
  expect(h.start() == chaosmagnet::ErrorCode::none, "restart after stop");
  expect(h.state() == chaosmagnet::HarvesterState::running, "running");
  auto s = h.sample();
  expect(s && s->sequence == 1 && s->payload.size() == 32, "first sample");

  h.set_fail_read(true);
  expect(!h.sample().has_value(), "read fault yields no sample");
  expect(h.state() == chaosmagnet::HarvesterState::error, "read fault => error");
  expect(h.error_count() == 2, "errors counted");
  expect(h.closes() >= 2, "device closed on every path into error");
  h.stop();
  expect(h.state() == chaosmagnet::HarvesterState::disabled, "stopped");
}

void test_os_rng_sample() {
  const auto cfg = chaosmagnet::default_engine_config().sources.at(chaosmagnet::kSourceOsRng);
  chaosmagnet::OsRngHarvester h(cfg);
  expect(h.start() == chaosmagnet::ErrorCode::none, "OS RNG always opens");
  auto a = h.sample();
  auto b = h.sample();
  expect(a && b, "OS RNG yields samples");
  expect(a->payload.size() == 1024, "OS RNG poll size");
  expect(a->payload != b->payload, "samples differ");
  expect(a->source_id == "OS_RNG" && b->sequence == 2, "sample identity");
  h.stop();
}

void test_system_jitter_sample() {
  const auto cfg = chaosmagnet::default_engine_config().sources.at(chaosmagnet::kSourceSystem);
  chaosmagnet::SystemJitterHarvester h(cfg);
  expect(h.start() == chaosmagnet::ErrorCode::none, "system jitter opens");
  auto s = h.sample();
  expect(s && !s->payload.empty(), "system jitter yields bytes");
  h.stop();
}

void test_missing_device_errors() {
  auto cfg = chaosmagnet::default_engine_config().sources.at(chaosmagnet::kSourceVideo);
  cfg.device_path = "/nonexistent/chaosmagnet/video99";
  auto h = chaosmagnet::make_harvester(cfg);
  expect(h != nullptr, "factory builds VIDEO");
  expect(h->start() == chaosmagnet::ErrorCode::device_unavailable, "missing node => device_unavailable");
  expect(h->state() == chaosmagnet::HarvesterState::error, "error state");
  h->stop();

  chaosmagnet::SourceConfig unknown;
  unknown.id = "RADIO";
  expect(chaosmagnet::make_harvester(unknown) == nullptr, "unknown id => nullptr");
  for (const auto& id : chaosmagnet::builtin_source_ids()) {
    expect(chaosmagnet::make_harvester(chaosmagnet::default_engine_config().sources.at(id)) != nullptr,
           "factory covers " + id);
  }
}

// ============================================================================
// Phase 6: Post-quantum keys and bundles
// ============================================================================

void test_pqc_deterministic_keygen() {
  expect(chaosmagnet::pqc::algorithms_available(), "ML-KEM-512 and Falcon-512 enabled in liboqs");
  chaosmagnet::PoolBytes pool{};
  pool[0] = 9;
  auto seeds = chaosmagnet::pqc::derive_subseeds(pool);
  expect(seeds.kem != seeds.sig, "KEM and signature sub-seeds differ");

  chaosmagnet::pqc::KeyPair k1, k2;
  expect(chaosmagnet::pqc::generate_kem_keypair(seeds.kem, &k1) == chaosmagnet::ErrorCode::none, "kem keygen");
  expect(chaosmagnet::pqc::generate_kem_keypair(seeds.kem, &k2) == chaosmagnet::ErrorCode::none, "kem keygen again");
  expect(k1.public_key == k2.public_key && k1.secret_key == k2.secret_key, "same seed => same KEM keys");

  chaosmagnet::pqc::KeyPair s1, s2;
  expect(chaosmagnet::pqc::generate_signature_keypair(seeds.sig, &s1) == chaosmagnet::ErrorCode::none, "sig keygen");
  expect(chaosmagnet::pqc::generate_signature_keypair(seeds.sig, &s2) == chaosmagnet::ErrorCode::none, "sig keygen again");
  expect(s1.public_key == s2.public_key, "same seed => same Falcon keys");

  pool[0] = 10;
  auto other = chaosmagnet::pqc::derive_subseeds(pool);
  chaosmagnet::pqc::KeyPair k3;
  chaosmagnet::pqc::generate_kem_keypair(other.kem, &k3);
  expect(k3.public_key != k1.public_key, "distinct pools => distinct keys");

  std::vector<std::uint8_t> sig;
  expect(chaosmagnet::pqc::sign_message(s1.secret_key, "digest", &sig) == chaosmagnet::ErrorCode::none, "sign");
  expect(chaosmagnet::pqc::verify_signature(s1.public_key, "digest", sig), "verify");
  expect(!chaosmagnet::pqc::verify_signature(s1.public_key, "digesT", sig), "tampered message fails");

  seeds.wipe();
  expect(seeds.kem == chaosmagnet::pqc::Seed{}, "wipe zeroes sub-seeds");
  k1.wipe();
  expect(k1.secret_key.empty() ||
             std::all_of(k1.secret_key.begin(), k1.secret_key.end(), [](std::uint8_t b) { return b == 0; }),
         "wipe cleanses secret key");
}

void test_mint_below_threshold_writes_nothing() {
  const auto dir = fresh_dir("mint_floor");
  chaosmagnet::KeyMinter minter((dir / "keys").string(), 256.0);
  const auto r = minter.mint(mintable_snapshot(1, 100.0), "test");
  expect(!r.ok && r.error_code == chaosmagnet::ErrorCode::pool_below_threshold, "below floor rejected");
  expect(count_bundle_files(dir / "keys") == 0, "no bundle file on rejection");

  auto snap = mintable_snapshot(1, 1000.0);
  snap.sources[0].last_health_result = chaosmagnet::HealthResult::fail;
  expect(minter.mint(snap, "test").error_code == chaosmagnet::ErrorCode::pool_below_threshold,
         "failing sources do not count");
  fs::remove_all(dir);
}

void test_mint_bundle_roundtrip_and_verify() {
  const auto dir = fresh_dir("mint_ok");
  chaosmagnet::KeyMinter minter((dir / "keys").string(), 256.0);
  const auto r = minter.mint(mintable_snapshot(3, 300.0), "alice");
  expect(r.ok, "mint succeeds: " + r.message);
  expect(r.bundle.bundle_id.size() == 32, "bundle id is 32 hex");
  expect(fs::exists(r.bundle.file_path), "bundle file written");
  expect(r.bundle.kem_algorithm == "ML-KEM-512" && r.bundle.signature_algorithm == "Falcon-512", "algorithms");

  chaosmagnet::PqcBundle loaded;
  std::string error;
  expect(chaosmagnet::read_bundle_file(r.bundle.file_path, &loaded, &error), "bundle reads back: " + error);
  expect(loaded.bundle_id == r.bundle.bundle_id && loaded.requester == "alice", "fields survive");
  expect(chaosmagnet::verify_bundle(loaded, &error), "bundle verifies: " + error);
  loaded.aggregate_entropy_bits += 1.0;
  expect(!chaosmagnet::verify_bundle(loaded, &error), "tampered bundle fails verification");

  expect(r.bundle.kem_secret_key_hex.empty(), "mint result carries no secret key");
  chaosmagnet::PqcBundle on_disk;
  expect(chaosmagnet::read_bundle_file(r.bundle.file_path, &on_disk, &error), "bundle rereads: " + error);
  expect(on_disk.kem_secret_key_hex.size() == 2 * 1632, "ML-KEM-512 secret key persisted");
  const auto summary = chaosmagnet::mint_result_to_json(r);
  expect(summary.find(on_disk.kem_secret_key_hex) == std::string::npos, "summary never carries the secret key");
  fs::remove_all(dir);
}

void test_cleanse_string_clears_secret() {
  std::string secret(64, 'k');
  chaosmagnet::pqc::cleanse_string(secret);
  expect(secret.empty(), "cleansed string is empty");
  std::string empty;
  chaosmagnet::pqc::cleanse_string(empty);
  expect(empty.empty(), "empty string is a no-op");
}

void test_sequential_mints_distinct() {
  const auto dir = fresh_dir("mint_seq");
  chaosmagnet::KeyMinter minter((dir / "keys").string(), 256.0);
  auto snap = mintable_snapshot(5, 300.0);
  const auto a = minter.mint(snap, "local");
  expect(a.ok, "first mint");
  const auto stale = minter.mint(snap, "local");
  expect(!stale.ok && stale.error_code == chaosmagnet::ErrorCode::pool_stale, "unmixed pool rejected");
  snap.pool.bytes[0] ^= 0x80;
  const auto b = minter.mint(snap, "local");
  expect(b.ok, "second mint after re-mix");
  expect(a.bundle.bundle_id != b.bundle.bundle_id, "distinct bundle ids");
  expect(a.bundle.kem_public_key_hex != b.bundle.kem_public_key_hex, "distinct KEM keys");
  expect(a.bundle.file_path != b.bundle.file_path, "distinct files");
  expect(count_bundle_files(dir / "keys") == 2, "two bundle files");
  expect(minter.mint_count() == 2 && minter.ledger().entry_count() == 2, "counted and ledgered");
  fs::remove_all(dir);
}

void test_mint_ledger_chain() {
  const auto dir = fresh_dir("ledger");
  const auto path = (dir / "ledger.ndjson").string();
  {
    chaosmagnet::MintLedger ledger(path);
    chaosmagnet::MintLedgerEntry e1;
    e1.bundle_id = "b1";
    chaosmagnet::MintLedgerEntry e2;
    e2.bundle_id = "b2";
    expect(ledger.append(e1) && ledger.append(e2), "appends succeed");
    expect(e1.sequence == 1 && e2.sequence == 2, "sequence assigned");
    expect(e1.previous_digest == std::string(64, '0'), "first line chains to zeros");
  }
  std::ifstream in(path);
  std::string l1, l2;
  std::getline(in, l1);
  std::getline(in, l2);
  const auto o2 = chaosmagnet::jsonlite::parse(l2, nullptr);
  expect(chaosmagnet::jsonlite::get_string(o2, "prev") == chaosmagnet::blake3_hex(l1), "line 2 chains to line 1");
  expect(chaosmagnet::jsonlite::get_u64(o2, "seq") == 2, "seq on disk");

  chaosmagnet::MintLedger disabled("");
  chaosmagnet::MintLedgerEntry e;
  expect(disabled.append(e) && disabled.entry_count() == 0, "empty path is a no-op");
  fs::remove_all(dir);
}

// ============================================================================
// Phase 7: Engine
// ============================================================================

void test_engine_repeated_byte_scenario() {
  const auto dir = fresh_dir("engine_rct");
  auto cfg = test_engine_config(dir);
  cfg.sources[chaosmagnet::kSourceSystem].claimed_min_entropy = 1.08;
  auto engine = chaosmagnet::Engine::create(cfg);
  expect(engine != nullptr, "engine created");

  for (std::uint64_t i = 1; i <= 20; ++i) {
    expect(engine->submit_sample(make_sample("SYSTEM", "\x5a", i)) == chaosmagnet::ErrorCode::none, "submit");
  }
  expect(engine->condition_once() == 20, "20 samples conditioned");
  const auto after20 = engine->get_snapshot();
  expect(after20.pool.bytes != chaosmagnet::PoolBytes{}, "pool mixed");
  expect(find_source(after20, "SYSTEM")->last_health_result == chaosmagnet::HealthResult::pass, "run of 20 passes");

  for (std::uint64_t i = 21; i <= 30; ++i) engine->submit_sample(make_sample("SYSTEM", "\x5a", i));
  expect(engine->condition_once() == 10, "10 more consumed");
  const auto after30 = engine->get_snapshot();
  expect(after30.pool.bytes == after20.pool.bytes, "samples 21..30 never reach the pool");
  expect(after30.pool.mix_cycle_count == 1, "no further mix cycle");
  const auto* sys = find_source(after30, "SYSTEM");
  expect(sys->last_health_result == chaosmagnet::HealthResult::fail, "source is failing");
  expect(sys->bytes_received == 30, "excluded bytes still counted as received");
  expect(engine->stats().bytes_excluded.load() == 10, "10 bytes excluded");
  expect(engine->events().count(chaosmagnet::EventKind::health_fail) == 1, "one health_fail event");

  engine->submit_sample(make_sample("SYSTEM", "\x01\x02\x03", 31));
  engine->condition_once();
  const auto recovered = engine->get_snapshot();
  expect(find_source(recovered, "SYSTEM")->last_health_result == chaosmagnet::HealthResult::pass, "recovers");
  expect(recovered.pool.bytes != after30.pool.bytes, "recovered source mixes again");
  expect(engine->events().count(chaosmagnet::EventKind::health_recovered) == 1, "recovery logged");
  engine->shutdown();
  fs::remove_all(dir);
}

void test_engine_stuck_sample_with_fresh_tail() {
  const auto dir = fresh_dir("engine_stuck");
  auto cfg = test_engine_config(dir);
  cfg.sources[chaosmagnet::kSourceAudio].claimed_min_entropy = 1.08;
  auto engine = chaosmagnet::Engine::create(cfg);

  // A muted microphone: 256 zero LSBs, then the timestamp byte.
  engine->submit_sample(make_sample("AUDIO", std::string(256, '\0') + '\x37', 1));
  expect(engine->condition_once() == 1, "sample consumed");
  const auto snap = engine->get_snapshot();
  expect(snap.pool.mix_cycle_count == 0 && snap.pool.bytes == chaosmagnet::PoolBytes{}, "pool untouched");
  const auto* audio = find_source(snap, "AUDIO");
  expect(audio->last_health_result == chaosmagnet::HealthResult::fail, "source marked failing");
  expect(audio->bytes_received == 257, "bytes still counted as received");
  expect(audio->metrics.sample_count == 0, "estimator never saw the sample");
  expect(engine->stats().bytes_excluded.load() == 257, "whole sample excluded");
  expect(engine->events().count(chaosmagnet::EventKind::health_fail) == 1, "health_fail logged");

  engine->submit_sample(make_sample("AUDIO", "\x10\x20\x30\x40", 2));
  engine->condition_once();
  const auto after = engine->get_snapshot();
  expect(find_source(after, "AUDIO")->last_health_result == chaosmagnet::HealthResult::pass, "recovers");
  expect(after.pool.mix_cycle_count == 1, "clean sample mixed");
  expect(engine->events().count(chaosmagnet::EventKind::health_recovered) == 1, "recovery logged");
  engine->shutdown();
  fs::remove_all(dir);
}

void test_engine_disable_drains_queue() {
  const auto dir = fresh_dir("engine_drain");
  auto engine = chaosmagnet::Engine::create(test_engine_config(dir));
  chaosmagnet::SourceConfig sc;
  sc.id = "SCRIPTED";
  sc.claimed_min_entropy = 1.0;
  sc.poll_interval_ms = 5;
  expect(engine->register_harvester(std::make_unique<ScriptedHarvester>("SCRIPTED"), sc) ==
             chaosmagnet::ErrorCode::none,
         "register scripted harvester");
  expect(engine->enable_source("SCRIPTED") == chaosmagnet::ErrorCode::none, "enable");
  expect(engine->register_harvester(std::make_unique<ScriptedHarvester>("SCRIPTED"), sc) ==
             chaosmagnet::ErrorCode::invalid_state,
         "enabled slot cannot be replaced");
  expect(wait_until([&] { return engine->queue_depth() >= 3; }, 5000ms), "samples queued");

  expect(engine->disable_source("SCRIPTED") == chaosmagnet::ErrorCode::none, "disable");
  const std::size_t queued = engine->queue_depth();
  std::this_thread::sleep_for(30ms);
  expect(engine->queue_depth() == queued, "no samples after disable");

  expect(engine->condition_once() == queued, "queued samples still conditioned");
  const auto snap = engine->get_snapshot();
  const auto* src = find_source(snap, "SCRIPTED");
  expect(src && src->bytes_received == queued * 32, "every queued byte counted");
  expect(!src->enabled && src->lifecycle == chaosmagnet::HarvesterState::disabled, "source disabled");
  expect(snap.pool.mix_cycle_count == 1 && snap.pool.accumulated_raw_byte_count == queued * 32, "all mixed");
  engine->shutdown();
  fs::remove_all(dir);
}

void test_engine_enable_failure_state() {
  const auto dir = fresh_dir("engine_fault");
  auto cfg = test_engine_config(dir);
  cfg.sources[chaosmagnet::kSourceVideo].device_path = "/nonexistent/chaosmagnet/video99";
  auto engine = chaosmagnet::Engine::create(cfg);
  expect(engine->enable_source("Video (Cam)") == chaosmagnet::ErrorCode::device_unavailable, "enable fails");
  const auto snap = engine->get_snapshot();
  const auto* v = find_source(snap, "VIDEO");
  expect(v->lifecycle == chaosmagnet::HarvesterState::error && !v->enabled, "error state visible");
  expect(!v->last_error.empty(), "last error visible");
  expect(engine->events().count(chaosmagnet::EventKind::harvester_error) == 1, "fault logged");
  expect(engine->enable_source("VIDEO") == chaosmagnet::ErrorCode::device_unavailable, "retry goes through stop/start");
  expect(engine->enable_source("RADIO") == chaosmagnet::ErrorCode::unknown_source, "unknown source");
  engine->shutdown();
  fs::remove_all(dir);
}

void test_engine_mint_flow() {
  const auto dir = fresh_dir("engine_mint");
  auto cfg = test_engine_config(dir);
  cfg.mint_floor_bits = 256.0;
  auto engine = chaosmagnet::Engine::create(cfg);
  const auto below = engine->request_mint("gui");
  expect(below.error_code == chaosmagnet::ErrorCode::pool_below_threshold, "empty pool below floor");
  expect(count_bundle_files(dir / "keys") == 0, "nothing written");
  expect(engine->stats().mints_failed.load() == 1, "failure counted");
  expect(engine->events().count(chaosmagnet::EventKind::mint_failed) == 1, "failure logged");
  engine->shutdown();

  cfg.mint_floor_bits = 0.0;
  auto open = chaosmagnet::Engine::create(cfg);
  open->submit_sample(make_sample("OS_RNG", "first batch of bytes", 1));
  open->condition_once();
  const auto a = open->request_mint("gui");
  expect(a.ok, "mint after mixing: " + a.message);
  open->submit_sample(make_sample("OS_RNG", "second batch of bytes", 2));
  open->condition_once();
  const auto b = open->request_mint("gui");
  expect(b.ok && b.bundle.bundle_id != a.bundle.bundle_id, "sequential mints are distinct");
  expect(open->events().count(chaosmagnet::EventKind::mint_ok) == 2, "mints logged");
  expect(open->stats().mint_latency.count() == 2, "mint latency recorded");
  open->shutdown();
  fs::remove_all(dir);
}

void test_engine_auto_mint_off_thread() {
  const auto dir = fresh_dir("engine_auto_mint");
  auto cfg = test_engine_config(dir);
  cfg.auto_mint.enabled = true;
  cfg.auto_mint.every_cycles = 1;
  auto engine = chaosmagnet::Engine::create(cfg);
  expect(engine->start() == chaosmagnet::ErrorCode::none, "start");
  std::string ramp;
  for (int i = 0; i < 256; ++i) ramp.push_back(static_cast<char>(i));
  expect(engine->submit_sample(make_sample("OS_RNG", ramp, 1)) == chaosmagnet::ErrorCode::none, "submitted");
  expect(wait_until([&] { return engine->stats().mints_ok.load() == 1; }, 10000ms), "high-entropy cycle minted");
  expect(engine->stats().mints_auto.load() == 1, "auto mint counted");
  expect(count_bundle_files(dir / "keys") == 1, "bundle written");
  bool by_auto = false;
  for (const auto& ev : engine->events().recent()) {
    if (ev.kind == chaosmagnet::EventKind::mint_ok && ev.source_id == "auto") by_auto = true;
  }
  expect(by_auto, "mint logged with requester auto");
  engine->shutdown();
  fs::remove_all(dir);
}

void test_engine_auto_mint_needs_quality() {
  const auto dir = fresh_dir("engine_auto_mint_low");
  auto cfg = test_engine_config(dir);
  cfg.auto_mint.enabled = true;
  cfg.auto_mint.every_cycles = 1;
  cfg.auto_mint.min_entropy = 8.0;  // a uniform batch scores exactly 8
  auto engine = chaosmagnet::Engine::create(cfg);
  expect(engine->start() == chaosmagnet::ErrorCode::none, "start");
  std::string ramp;
  for (int i = 0; i < 256; ++i) ramp.push_back(static_cast<char>(i));
  engine->submit_sample(make_sample("OS_RNG", ramp, 1));
  expect(wait_until([&] { return engine->stats().mix_cycles.load() == 1; }, 10000ms), "cycle mixed");
  engine->shutdown();
  expect(engine->stats().mints_auto.load() == 0, "threshold not exceeded");
  expect(count_bundle_files(dir / "keys") == 0, "nothing minted");

  chaosmagnet::EngineConfig parsed = chaosmagnet::default_engine_config();
  expect(!parsed.auto_mint.enabled && parsed.auto_mint.every_cycles == 10 && parsed.auto_mint.min_entropy == 6.5,
         "auto mint off by default");
  expect(chaosmagnet::parse_engine_config(R"({"auto_mint":{"enabled":true,"every_cycles":3}})", &parsed).ok,
         "auto mint keys accepted");
  expect(parsed.auto_mint.enabled && parsed.auto_mint.every_cycles == 3, "auto mint keys applied");
  expect(!chaosmagnet::parse_engine_config(R"({"auto_mint":{"every_cycles":0}})", &parsed).ok, "zero period rejected");
  expect(!chaosmagnet::parse_engine_config(R"({"auto_mint":{"min_entropy":9}})", &parsed).ok, "threshold over 8 rejected");
  fs::remove_all(dir);
}

void test_engine_reset_accumulators() {
  const auto dir = fresh_dir("engine_reset");
  auto engine = chaosmagnet::Engine::create(test_engine_config(dir));
  std::string ramp;
  for (int i = 0; i < 256; ++i) ramp.push_back(static_cast<char>(i));
  for (std::uint64_t i = 1; i <= 4; ++i) engine->submit_sample(make_sample("OS_RNG", ramp, i));
  expect(engine->condition_once() == 4, "one estimator window of bytes");
  const double accumulated =
      find_source(engine->get_snapshot(), "OS_RNG")->metrics.accumulated_true_entropy_bits;
  expect(std::abs(accumulated - 8.0 * 1024) < 1e-6, "uniform window credits 8 bits per byte");

  engine->reset_accumulators();
  const auto after = engine->get_snapshot();
  expect(find_source(after, "OS_RNG")->metrics.accumulated_true_entropy_bits == 0.0, "accumulator zeroed");
  expect(after.pool.mix_cycle_count == 1, "pool state survives a reset");
  engine->shutdown();
  fs::remove_all(dir);
}

void test_engine_config_rejection_unchanged() {
  const auto dir = fresh_dir("engine_cfg");
  auto engine = chaosmagnet::Engine::create(test_engine_config(dir));
  const auto r = engine->configure_uplink(R"({"port":0,"path":"ingest"})");
  expect(!r.ok && r.errors.size() == 2, "both uplink errors reported");
  expect(engine->config().uplink.port == 8000 && engine->config().uplink.path == "/ingest", "uplink unchanged");
  expect(!engine->configure_uplink("{oops").ok, "malformed JSON rejected");
  expect(!engine->configure_p2p(R"({"peers":["no-port"]})").ok, "bad peer rejected");
  expect(engine->config().p2p.peers.empty(), "p2p unchanged");
  expect(engine->events().count(chaosmagnet::EventKind::config_rejected) == 3, "rejections logged");

  chaosmagnet::EngineConfig bad = test_engine_config(dir);
  bad.health_window = 1;
  chaosmagnet::ConfigValidationResult vr;
  expect(chaosmagnet::Engine::create(bad, &vr) == nullptr && !vr.ok, "invalid engine config refused");
  engine->shutdown();
  fs::remove_all(dir);
}

void test_engine_lifecycle_with_os_rng() {
  const auto dir = fresh_dir("engine_live");
  auto cfg = test_engine_config(dir);
  cfg.sources[chaosmagnet::kSourceOsRng].enabled = true;
  cfg.sources[chaosmagnet::kSourceOsRng].poll_interval_ms = 10;
  auto engine = chaosmagnet::Engine::create(cfg);
  expect(engine->start() == chaosmagnet::ErrorCode::none, "start");
  expect(engine->start() == chaosmagnet::ErrorCode::invalid_state, "double start refused");
  expect(wait_until([&] { return engine->get_snapshot().pool.mix_cycle_count > 0; }, 5000ms), "pool mixes");
  const auto snap = engine->get_snapshot();
  const auto* os = find_source(snap, "OS_RNG");
  expect(os->enabled && os->lifecycle == chaosmagnet::HarvesterState::running, "OS_RNG running");
  expect(snap.total_bytes_harvested > 0 && !snap.history_min_entropy.empty(), "history recorded");
  engine->shutdown();
  engine->shutdown();
  expect(!engine->running(), "stopped");
  expect(engine->events().count(chaosmagnet::EventKind::engine_stopped) == 1, "stop logged once");
  expect(engine->enable_source("OS_RNG") == chaosmagnet::ErrorCode::invalid_state, "no enable after shutdown");
  fs::remove_all(dir);
}

// ============================================================================
// Phase 8: Network
// ============================================================================

void test_frame_codec() {
  auto snap = mintable_snapshot(7, 10.0);
  const auto f = chaosmagnet::build_frame("node-a", 3, snap);
  expect(f.whitened_payload_hex.size() == 64, "32-byte whitened payload");
  expect(f.whitened_payload_hex != chaosmagnet::to_hex(snap.pool.bytes.data(), snap.pool.bytes.size()),
         "frame never carries raw pool bytes");
  expect(chaosmagnet::build_frame("node-a", 4, snap).whitened_payload_hex != f.whitened_payload_hex,
         "sequence changes the payload");

  chaosmagnet::NetworkFrame back;
  std::string error;
  expect(chaosmagnet::frame_from_json(chaosmagnet::frame_to_json(f), &back, &error), "frame parses: " + error);
  expect(back.sender_id == "node-a" && back.sequence == 3 && back.metrics_digest == f.metrics_digest, "fields");

  auto future = f;
  future.frame_version = 99;
  expect(!chaosmagnet::frame_from_json(chaosmagnet::frame_to_json(future), &back, &error), "newer version refused");
  auto bad = f;
  bad.whitened_payload_hex = "not-hex";
  expect(!chaosmagnet::frame_from_json(chaosmagnet::frame_to_json(bad), &back, &error), "non-hex refused");
}

void test_p2p_loopback_does_not_mix() {
  const auto dir = fresh_dir("p2p");
  auto engine = chaosmagnet::Engine::create(test_engine_config(dir));
  expect(engine->start() == chaosmagnet::ErrorCode::none, "start");
  const auto r = engine->configure_p2p(R"({"enabled":true,"listen_port":0})");
  expect(r.ok, "p2p enabled");
  const auto port = engine->p2p_bound_port();
  expect(port != 0, "ephemeral port bound");
  expect(engine->events().count(chaosmagnet::EventKind::p2p_listening) == 1, "listening logged");

  const auto frame = chaosmagnet::build_frame("peer-test", 7, mintable_snapshot(0x42, 1.0));
  const auto post = chaosmagnet::http_post_json("127.0.0.1", port, "/ingest", chaosmagnet::frame_to_json(frame), 2000ms);
  expect(post.ok && post.status == 200, "frame accepted: " + post.error);
  expect(wait_until([&] { return engine->p2p().received_count() == 1; }, 2000ms), "frame counted");
  const auto recent = engine->p2p().recent_frames();
  expect(!recent.empty() && recent.back().sender_id == "peer-test", "frame kept");

  const auto garbage = chaosmagnet::http_post_json("127.0.0.1", port, "/ingest", "{\"x\":1}", 2000ms);
  expect(!garbage.ok && garbage.status == 400, "malformed frame answered 400");

  const auto snap = engine->get_snapshot();
  expect(snap.pool.bytes == chaosmagnet::PoolBytes{} && snap.pool.mix_cycle_count == 0, "pool untouched");
  expect(snap.p2p_received_count == 1 && snap.p2p_port == port, "snapshot reports p2p");
  engine->shutdown();
  fs::remove_all(dir);
}

void test_uplink_drops_after_retries() {
  const auto dir = fresh_dir("uplink");
  auto engine = chaosmagnet::Engine::create(test_engine_config(dir));
  expect(engine->start() == chaosmagnet::ErrorCode::none, "start");
  const std::string cfg = R"({"enabled":true,"host":"127.0.0.1","port":)" + std::to_string(closed_local_port()) +
                          R"(,"max_attempts":2,"backoff_base_ms":5,"interval_ms":50,"timeout_ms":200})";
  expect(engine->configure_uplink(cfg).ok, "uplink configured");
  expect(wait_until([&] { return engine->events().count(chaosmagnet::EventKind::uplink_dropped) >= 1; }, 10000ms),
         "frame dropped after retries");
  expect(engine->stats().uplink_failed_attempts.load() >= 2, "each attempt counted");
  expect(engine->events().count(chaosmagnet::EventKind::uplink_retry) >= 1, "retry logged");
  const auto t0 = std::chrono::steady_clock::now();
  engine->shutdown();
  expect(std::chrono::steady_clock::now() - t0 < 5s, "shutdown interrupts the uplink promptly");
  fs::remove_all(dir);
}

void test_p2p_retries_then_drops_unreachable_peer() {
  const auto dir = fresh_dir("p2p-drop");
  auto engine = chaosmagnet::Engine::create(test_engine_config(dir));
  expect(engine->start() == chaosmagnet::ErrorCode::none, "start");
  const std::string cfg = R"({"enabled":true,"listen_port":0,"peers":["127.0.0.1:)" +
                          std::to_string(closed_local_port()) +
                          R"("],"max_attempts":3,"backoff_base_ms":5,"interval_ms":20,"timeout_ms":200})";
  expect(engine->configure_p2p(cfg).ok, "p2p configured");
  expect(wait_until([&] { return engine->stats().p2p_dropped.load() >= 1; }, 10000ms),
         "peer dropped after retries");
  expect(engine->stats().p2p_failed_attempts.load() >= 3, "each attempt counted");
  expect(engine->events().count(chaosmagnet::EventKind::p2p_retry) >= 2, "both retries logged");
  expect(engine->events().count(chaosmagnet::EventKind::p2p_dropped) >= 1, "drop logged");
  expect(engine->stats().p2p_sent.load() == 0, "nothing delivered");
  expect(engine->stats().to_json().find("\"dropped\":") != std::string::npos, "drop counter exported");
  const auto t0 = std::chrono::steady_clock::now();
  engine->shutdown();
  expect(std::chrono::steady_clock::now() - t0 < 5s, "shutdown interrupts the peer backoff promptly");
  fs::remove_all(dir);
}

void test_p2p_retry_config_validated() {
  chaosmagnet::P2pConfig p;
  expect(p.max_attempts == 3 && p.backoff_base_ms == 100, "p2p retry defaults");
  expect(chaosmagnet::parse_p2p_config(R"({"max_attempts":5,"backoff_base_ms":20})", &p).ok, "retry keys accepted");
  expect(p.max_attempts == 5 && p.backoff_base_ms == 20, "retry keys applied");
  expect(!chaosmagnet::parse_p2p_config(R"({"max_attempts":0})", &p).ok, "zero attempts rejected");
  expect(!chaosmagnet::parse_p2p_config(R"({"backoff_base_ms":0})", &p).ok, "zero backoff rejected");
  expect(p.max_attempts == 5, "rejected overlay leaves config untouched");
}

// ============================================================================
// Phase 9: Observability, versioning and the C ABI
// ============================================================================

void test_snapshot_summary_escapes_ids() {
  chaosmagnet::EngineSnapshot snap;
  snap.pool.mix_cycle_count = 3;
  chaosmagnet::SourceState odd;
  odd.source_id = "MIC\"},\"x\":{\"";
  odd.enabled = true;
  snap.sources.push_back(odd);
  chaosmagnet::SourceState off;
  off.source_id = "HID";
  snap.sources.push_back(off);

  const std::string line = chaosmagnet::snapshot_summary_json(snap);
  expect(!chaosmagnet::jsonlite::validate_strict(line).has_value(), "summary is strict JSON: " + line);
  std::optional<chaosmagnet::jsonlite::JsonError> err;
  const auto o = chaosmagnet::jsonlite::parse(line, &err);
  expect(!err && chaosmagnet::jsonlite::get_u64(o, "mix_cycles") == 3, "cycles reported");
  const auto* sources = chaosmagnet::jsonlite::get_object(o, "sources");
  expect(sources && sources->size() == 1 && sources->count(odd.source_id) == 1, "id survives escaping");
  expect(o.count("x") == 0, "id cannot inject keys");
}

void test_event_log_ring_and_sink() {
  const auto dir = fresh_dir("events");
  const auto path = (dir / "events.jsonl").string();
  chaosmagnet::EventLog log(path);
  log.emit(chaosmagnet::EventKind::source_enabled, "OS_RNG", true, "");
  log.emit(chaosmagnet::EventKind::health_fail, "HID", false, "rct");
  log.emit(chaosmagnet::EventKind::mint_ok, "gui", true, "id");
  const auto last2 = log.recent(2);
  expect(last2.size() == 2 && last2[0].kind == chaosmagnet::EventKind::health_fail, "oldest first");
  expect(last2[0].seq < last2[1].seq, "monotonic seq");
  expect(log.count(chaosmagnet::EventKind::mint_ok) == 1 && log.total() == 3, "counts");

  std::ifstream in(path);
  std::string line;
  int lines = 0;
  while (std::getline(in, line)) {
    expect(!chaosmagnet::jsonlite::validate_strict(line).has_value(), "sink line is strict JSON");
    ++lines;
  }
  expect(lines == 3, "one JSONL line per event");

  for (int i = 0; i < 1005; ++i) log.emit(chaosmagnet::EventKind::mix_cycle, "", true, "");
  const auto all = log.recent();
  expect(all.size() == chaosmagnet::EventLog::kMaxRecentEvents, "ring is bounded");
  expect(all.back().seq == log.total(), "newest retained");
  fs::remove_all(dir);
}

void test_latency_histogram() {
  chaosmagnet::LatencyHistogram h;
  expect(h.percentile(0.5) == 0.0, "empty histogram");
  for (int i = 0; i < 100; ++i) h.record(1000000);  // 1 ms
  expect(h.count() == 100, "count");
  expect(h.percentile(0.5) > 0.0, "percentile populated");
}

void test_version_compatibility() {
  expect(chaosmagnet::version::check_compatibility(chaosmagnet::version::ENGINE_ABI_VERSION).ok, "same ABI ok");
  const auto r = chaosmagnet::version::check_compatibility(99);
  expect(!r.ok && r.error_code == "abi_version_mismatch", "ABI mismatch detected");
  const auto m = chaosmagnet::version::manifest_to_json(chaosmagnet::version::current_manifest());
  expect(!chaosmagnet::jsonlite::validate_strict(m).has_value(), "manifest is strict JSON");
  expect(m.find("ML-KEM-512") != std::string::npos, "manifest names the KEM");
}

void test_c_api_lifecycle() {
  const auto dir = fresh_dir("c_api");
  const std::string cfg = R"({"bundles_dir":")" + (dir / "keys").string() +
                          R"(","mint_floor_bits":1000000000,"mix_interval_ms":20})";
  expect(chaosmagnet_abi_version() == CHAOSMAGNET_ABI_VERSION, "ABI version");
  expect(chaosmagnet_init(cfg.c_str(), CHAOSMAGNET_ABI_VERSION + 1) == nullptr, "ABI mismatch refused");
  expect(chaosmagnet_init(R"({"queue_capacity":0})", CHAOSMAGNET_ABI_VERSION) == nullptr, "bad config refused");

  char* v = chaosmagnet_validate_config(R"({"queue_capacity":0})");
  expect(v && std::string(v).find("\"ok\":false") != std::string::npos, "validate reports errors");
  chaosmagnet_free_string(v);

  chaosmagnet_ctx_t* ctx = chaosmagnet_init(cfg.c_str(), CHAOSMAGNET_ABI_VERSION);
  expect(ctx != nullptr, "init");

  char* s = chaosmagnet_enable_source(ctx, "radio");
  expect(std::string(s).find("unknown_source") != std::string::npos, "unknown source reported");
  chaosmagnet_free_string(s);
  s = chaosmagnet_enable_source(ctx, "os_rng");
  expect(std::string(s).find("\"ok\":true") != std::string::npos, "alias enables OS_RNG");
  chaosmagnet_free_string(s);

  s = chaosmagnet_snapshot(ctx);
  expect(!chaosmagnet::jsonlite::validate_strict(s).has_value(), "snapshot is strict JSON");
  expect(std::string(s).find("\"pool_hex\"") != std::string::npos, "snapshot carries pool");
  chaosmagnet_free_string(s);

  s = chaosmagnet_mint(ctx, nullptr);
  expect(std::string(s).find("pool_below_threshold") != std::string::npos, "mint refused below floor");
  chaosmagnet_free_string(s);

  s = chaosmagnet_configure_uplink(ctx, R"({"port":0})");
  expect(std::string(s).find("\"ok\":false") != std::string::npos, "bad uplink refused");
  chaosmagnet_free_string(s);

  s = chaosmagnet_reset_accumulators(ctx);
  expect(std::string(s).find("\"ok\":true") != std::string::npos, "reset accepted");
  chaosmagnet_free_string(s);

  s = chaosmagnet_events(ctx, 50);
  expect(std::string(s).find("source_enabled") != std::string::npos, "events visible");
  chaosmagnet_free_string(s);

  s = chaosmagnet_stats(ctx);
  expect(!chaosmagnet::jsonlite::validate_strict(s).has_value(), "stats are strict JSON");
  chaosmagnet_free_string(s);

  s = chaosmagnet_disable_source(ctx, "OS_RNG");
  expect(std::string(s).find("\"ok\":true") != std::string::npos, "disable");
  chaosmagnet_free_string(s);

  expect(chaosmagnet_snapshot(nullptr) == nullptr, "null ctx => null");
  chaosmagnet_shutdown(ctx);
  chaosmagnet_shutdown(nullptr);
  fs::remove_all(dir);
}

}  // namespace

int main() {
  std::cout << "=== ChaosMagnet Test Suite ===\n";

  std::cout << "\n[Phase 1] Hashing\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("hex helpers", test_hex_helpers);
  run_test("derive-key domain separation", test_domain_separation);
  run_test("seeded stream determinism", test_seeded_stream_deterministic);

  std::cout << "\n[Phase 2] JSON and configuration\n";
  run_test("JSON strictness", test_json_strictness);
  run_test("default config valid", test_config_defaults_valid);
  run_test("config overlay and aliases", test_config_overlay_and_aliases);
  run_test("config rejection reports every error", test_config_rejects_and_reports_all);
  run_test("peer address parsing", test_peer_address_parsing);

  std::cout << "\n[Phase 3] Health tests and estimators\n";
  run_test("RCT boundary (C = 20)", test_rct_boundary);
  run_test("APT window", test_apt_window);
  run_test("health checker recovery", test_health_checker_recovery);
  run_test("health checker judges the whole sample", test_health_checker_judges_whole_sample);
  run_test("entropy ordering property (300 distributions)", test_entropy_ordering_property);
  run_test("estimator windows", test_estimator_windows);

  std::cout << "\n[Phase 4] Pool and hand-off queue\n";
  run_test("pool mixing determinism", test_pool_mixing_deterministic);
  run_test("bounded queue", test_bounded_queue);

  std::cout << "\n[Phase 5] Harvesters\n";
  run_test("harvester state machine", test_harvester_state_machine);
  run_test("OS RNG sample", test_os_rng_sample);
  run_test("system jitter sample", test_system_jitter_sample);
  run_test("missing device errors", test_missing_device_errors);

  std::cout << "\n[Phase 6] Post-quantum keys and bundles\n";
  run_test("deterministic ML-KEM / Falcon keygen", test_pqc_deterministic_keygen);
  run_test("cleanse string clears secret", test_cleanse_string_clears_secret);
  run_test("below-threshold mint writes nothing", test_mint_below_threshold_writes_nothing);
  run_test("bundle roundtrip and verification", test_mint_bundle_roundtrip_and_verify);
  run_test("sequential mints distinct", test_sequential_mints_distinct);
  run_test("mint ledger chain", test_mint_ledger_chain);

  std::cout << "\n[Phase 7] Engine\n";
  run_test("30 identical bytes, C = 20", test_engine_repeated_byte_scenario);
  run_test("stuck sample with a fresh tail is excluded", test_engine_stuck_sample_with_fresh_tail);
  run_test("disable drains queued samples", test_engine_disable_drains_queue);
  run_test("enable failure state", test_engine_enable_failure_state);
  run_test("mint flow", test_engine_mint_flow);
  run_test("auto mint runs off the conditioning thread", test_engine_auto_mint_off_thread);
  run_test("auto mint needs batch quality", test_engine_auto_mint_needs_quality);
  run_test("reset accumulators", test_engine_reset_accumulators);
  run_test("config rejection leaves engine unchanged", test_engine_config_rejection_unchanged);
  run_test("lifecycle with OS RNG", test_engine_lifecycle_with_os_rng);

  std::cout << "\n[Phase 8] Network\n";
  run_test("frame codec", test_frame_codec);
  run_test("P2P loopback never mixes", test_p2p_loopback_does_not_mix);
  run_test("uplink drops after retries", test_uplink_drops_after_retries);
  run_test("P2P retries then drops unreachable peer", test_p2p_retries_then_drops_unreachable_peer);
  run_test("P2P retry config validated", test_p2p_retry_config_validated);

  std::cout << "\n[Phase 9] Observability, versioning, C ABI\n";
  run_test("snapshot summary escapes source ids", test_snapshot_summary_escapes_ids);
  run_test("event log ring and sink", test_event_log_ring_and_sink);
  run_test("latency histogram", test_latency_histogram);
  run_test("version compatibility", test_version_compatibility);
  run_test("C API lifecycle", test_c_api_lifecycle);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
