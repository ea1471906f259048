#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "chaosmagnet/config.hpp"
#include "chaosmagnet/engine.hpp"
#include "chaosmagnet/hash.hpp"
#include "chaosmagnet/minter.hpp"
#include "chaosmagnet/node.hpp"
#include "chaosmagnet/pqc.hpp"
#include "chaosmagnet/types.hpp"
#include "chaosmagnet/version.hpp"

namespace {

struct CliOptions {
  std::string config_path;
  std::vector<std::string> enable;
  std::string requester{"cli"};
  unsigned seconds{10};
  unsigned timeout_s{60};
  bool seconds_set{false};
};

void print_usage() {
  std::cerr << "usage: chaosmagnet <command> [options]\n"
               "  run       [--config f] [--seconds N] [--enable ID ...]\n"
               "  mint      [--config f] [--timeout N] [--enable ID ...] [--requester R]\n"
               "  snapshot  [--config f] [--seconds N] [--enable ID ...]\n"
               "  version\n";
}

bool parse_unsigned(const char* text, unsigned* out) {
  char* end = nullptr;
  const unsigned long v = std::strtoul(text, &end, 10);
  if (end == text || *end != '\0' || v > 86400) return false;
  *out = static_cast<unsigned>(v);
  return true;
}

bool parse_options(int argc, char** argv, int first, CliOptions* o) {
  for (int i = first; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) {
      o->config_path = argv[++i];
    } else if (a == "--enable" && i + 1 < argc) {
      o->enable.push_back(chaosmagnet::normalize_source_id(argv[++i]));
    } else if (a == "--requester" && i + 1 < argc) {
      o->requester = argv[++i];
    } else if (a == "--seconds" && i + 1 < argc) {
      if (!parse_unsigned(argv[++i], &o->seconds)) return false;
      o->seconds_set = true;
    } else if (a == "--timeout" && i + 1 < argc) {
      if (!parse_unsigned(argv[++i], &o->timeout_s)) return false;
    } else {
      std::cerr << "{\"error\":\"unknown option '" << a << "'\"}\n";
      return false;
    }
  }
  return true;
}

std::unique_ptr<chaosmagnet::Engine> start_engine(const CliOptions& o) {
  chaosmagnet::EngineConfig cfg = chaosmagnet::default_engine_config();
  if (!o.config_path.empty()) {
    const auto r = chaosmagnet::load_engine_config_file(o.config_path, &cfg);
    if (!r.ok) {
      std::cerr << chaosmagnet::validation_to_json(r) << "\n";
      return nullptr;
    }
  }
  chaosmagnet::ConfigValidationResult vr;
  auto engine = chaosmagnet::Engine::create(cfg, &vr);
  if (!engine) {
    std::cerr << chaosmagnet::validation_to_json(vr) << "\n";
    return nullptr;
  }
  if (engine->start() != chaosmagnet::ErrorCode::none) {
    std::cerr << "{\"error\":\"engine start failed\"}\n";
    return nullptr;
  }

  // With nothing configured or requested, fall back to the two sources every
  // Linux host has.
  std::vector<std::string> ids = o.enable;
  if (ids.empty()) {
    bool any_enabled = false;
    for (const auto& kv : cfg.sources) any_enabled = any_enabled || kv.second.enabled;
    if (!any_enabled) ids = {chaosmagnet::kSourceOsRng, chaosmagnet::kSourceSystem};
  }
  for (const auto& id : ids) {
    const auto ec = engine->enable_source(id);
    if (ec != chaosmagnet::ErrorCode::none) {
      std::cerr << "{\"source\":\"" << chaosmagnet::jsonlite::escape(id)
                << "\",\"error_code\":\"" << chaosmagnet::to_string(ec) << "\"}\n";
    }
  }
  return engine;
}

int cmd_run(const CliOptions& o) {
  auto engine = start_engine(o);
  if (!engine) return 1;
  for (unsigned i = 0; i < o.seconds; ++i) {
    std::this_thread::sleep_for(std::chrono::seconds(1));
    std::cout << chaosmagnet::snapshot_summary_json(engine->get_snapshot()) << "\n" << std::flush;
  }
  engine->shutdown();
  std::cout << engine->stats().to_json() << "\n";
  return 0;
}

int cmd_mint(const CliOptions& o) {
  auto engine = start_engine(o);
  if (!engine) return 1;
  const double floor = engine->config().mint_floor_bits;
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(o.timeout_s);
  while (chaosmagnet::aggregate_conservative_entropy(engine->get_snapshot()) < floor &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  const auto r = engine->request_mint(o.requester);
  std::cout << chaosmagnet::mint_result_to_json(r) << "\n";
  engine->shutdown();
  return r.ok ? 0 : 2;
}

int cmd_snapshot(const CliOptions& o) {
  auto engine = start_engine(o);
  if (!engine) return 1;
  const unsigned wait_s = o.seconds_set ? o.seconds : 2;
  std::this_thread::sleep_for(std::chrono::seconds(wait_s));
  std::cout << chaosmagnet::snapshot_to_json(engine->get_snapshot()) << "\n";
  engine->shutdown();
  return 0;
}

int cmd_version() {
  const auto h = chaosmagnet::hash_runtime_info();
  std::cout << "{\"manifest\":"
            << chaosmagnet::version::manifest_to_json(chaosmagnet::version::current_manifest())
            << ",\"node\":" << chaosmagnet::node_identity_to_json(chaosmagnet::init_node_identity())
            << ",\"hash_primitive\":\"" << h.primitive << "\""
            << ",\"hash_backend\":\"" << h.backend << "\""
            << ",\"hash_version\":\"" << h.version << "\""
            << ",\"liboqs_version\":\"" << chaosmagnet::pqc::liboqs_version() << "\""
            << ",\"pqc_available\":"
            << (chaosmagnet::pqc::algorithms_available() ? "true" : "false") << "}\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }
  const std::string cmd = argv[1];
  if (cmd == "version") return cmd_version();

  CliOptions opts;
  if (!parse_options(argc, argv, 2, &opts)) {
    print_usage();
    return 1;
  }
  if (cmd == "run") return cmd_run(opts);
  if (cmd == "mint") return cmd_mint(opts);
  if (cmd == "snapshot") return cmd_snapshot(opts);

  print_usage();
  return 1;
}
