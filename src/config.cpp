#include "chaosmagnet/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>

#include "chaosmagnet/jsonlite.hpp"

namespace chaosmagnet {

namespace {

// Overlay helper: reads typed keys from one JSON object into fields, recording
// type errors under a dotted prefix ("uplink.port: ...").
struct Reader {
  const jsonlite::Object& obj;
  std::string prefix;
  ConfigValidationResult& r;
  std::set<std::string> seen{};

  void error(const std::string& key, const std::string& what) {
    r.ok = false;
    r.errors.push_back(prefix + key + " " + what);
  }

  bool present(const char* key) {
    seen.insert(key);
    return jsonlite::has_key(obj, key);
  }

  void read_uint(const char* key, uint64_t max, uint64_t* out) {
    if (!present(key)) return;
    const auto& v = obj.at(key).v;
    if (std::holds_alternative<std::uint64_t>(v)) {
      const uint64_t n = std::get<std::uint64_t>(v);
      if (n > max) { error(key, "is out of range"); return; }
      *out = n;
    } else if (std::holds_alternative<double>(v)) {
      error(key, std::get<double>(v) < 0.0 ? "must be non-negative" : "must be an integer");
    } else {
      error(key, "must be a number");
    }
  }

  void read_u32(const char* key, uint32_t* out) {
    uint64_t tmp = *out;
    read_uint(key, std::numeric_limits<uint32_t>::max(), &tmp);
    *out = static_cast<uint32_t>(tmp);
  }

  void read_u16(const char* key, uint16_t* out) {
    uint64_t tmp = *out;
    read_uint(key, std::numeric_limits<uint16_t>::max(), &tmp);
    *out = static_cast<uint16_t>(tmp);
  }

  // Negative values are accepted here and rejected by validation with a
  // field-specific message.
  void read_double(const char* key, double* out) {
    if (!present(key)) return;
    if (!jsonlite::is_number(obj, key)) { error(key, "must be a number"); return; }
    *out = jsonlite::get_double(obj, key, *out);
  }

  void read_bool(const char* key, bool* out) {
    if (!present(key)) return;
    if (!std::holds_alternative<bool>(obj.at(key).v)) { error(key, "must be a boolean"); return; }
    *out = std::get<bool>(obj.at(key).v);
  }

  void read_string(const char* key, std::string* out) {
    if (!present(key)) return;
    if (!std::holds_alternative<std::string>(obj.at(key).v)) { error(key, "must be a string"); return; }
    *out = std::get<std::string>(obj.at(key).v);
  }

  void warn_unknown_keys() {
    for (const auto& [k, v] : obj) {
      (void)v;
      if (!seen.contains(k)) r.warnings.push_back("unknown key '" + prefix + k + "' ignored");
    }
  }
};

void merge(ConfigValidationResult& into, const ConfigValidationResult& from) {
  if (!from.ok) into.ok = false;
  into.errors.insert(into.errors.end(), from.errors.begin(), from.errors.end());
  into.warnings.insert(into.warnings.end(), from.warnings.begin(), from.warnings.end());
}

void overlay_uplink(const jsonlite::Object& obj, const std::string& prefix,
                    UplinkConfig* u, ConfigValidationResult& r) {
  Reader rd{obj, prefix, r};
  rd.read_bool("enabled", &u->enabled);
  rd.read_string("host", &u->host);
  rd.read_u16("port", &u->port);
  rd.read_string("path", &u->path);
  rd.read_u32("interval_ms", &u->interval_ms);
  rd.read_u32("max_attempts", &u->max_attempts);
  rd.read_u32("backoff_base_ms", &u->backoff_base_ms);
  rd.read_u32("timeout_ms", &u->timeout_ms);
  rd.warn_unknown_keys();
}

void overlay_auto_mint(const jsonlite::Object& obj, const std::string& prefix,
                       AutoMintConfig* a, ConfigValidationResult& r) {
  Reader rd{obj, prefix, r};
  rd.read_bool("enabled", &a->enabled);
  rd.read_u32("every_cycles", &a->every_cycles);
  rd.read_double("min_entropy", &a->min_entropy);
  rd.warn_unknown_keys();
}

void overlay_p2p(const jsonlite::Object& obj, const std::string& prefix,
                 P2pConfig* p, ConfigValidationResult& r) {
  Reader rd{obj, prefix, r};
  rd.read_bool("enabled", &p->enabled);
  rd.read_u16("listen_port", &p->listen_port);
  rd.read_u32("interval_ms", &p->interval_ms);
  rd.read_u32("max_attempts", &p->max_attempts);
  rd.read_u32("backoff_base_ms", &p->backoff_base_ms);
  rd.read_u32("timeout_ms", &p->timeout_ms);
  if (rd.present("peers")) {
    const auto& v = obj.at("peers").v;
    if (!std::holds_alternative<jsonlite::Array>(v)) {
      rd.error("peers", "must be an array of \"host:port\" strings");
    } else {
      std::vector<PeerAddress> peers;
      const auto& arr = std::get<jsonlite::Array>(v);
      for (size_t i = 0; i < arr.size(); ++i) {
        const std::string where = "peers[" + std::to_string(i) + "]";
        if (!std::holds_alternative<std::string>(arr[i].v)) {
          rd.error(where, "must be a string");
          continue;
        }
        const auto& text = std::get<std::string>(arr[i].v);
        auto peer = parse_peer_address(text);
        if (!peer) {
          rd.error(where, "is not a valid host:port address: '" + text + "'");
          continue;
        }
        peers.push_back(*peer);
      }
      p->peers = std::move(peers);
    }
  }
  rd.warn_unknown_keys();
}

void overlay_source(const jsonlite::Object& obj, const std::string& prefix,
                    SourceConfig* s, ConfigValidationResult& r) {
  Reader rd{obj, prefix, r};
  rd.read_double("claimed_min_entropy", &s->claimed_min_entropy);
  rd.read_u32("poll_interval_ms", &s->poll_interval_ms);
  rd.read_string("device_path", &s->device_path);
  rd.read_bool("enabled", &s->enabled);
  rd.warn_unknown_keys();
}

bool parse_object(const std::string& json_text, jsonlite::Object* out, ConfigValidationResult& r) {
  std::optional<jsonlite::JsonError> err;
  *out = jsonlite::parse(json_text, &err);
  if (err) {
    r.ok = false;
    r.errors.push_back(err->code + ": " + err->message);
    return false;
  }
  return true;
}

bool valid_host(const std::string& host) {
  if (host.empty() || host.size() > 253) return false;
  return std::none_of(host.begin(), host.end(), [](unsigned char c) {
    return std::isspace(c) || c == '/' || c == '?' || c == '#' || c == '@';
  });
}

std::string upper(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

}  // namespace

const std::vector<std::string>& builtin_source_ids() {
  static const std::vector<std::string> ids = {
      kSourceOsRng, kSourceSystem, kSourceAudio, kSourceVideo, kSourceHid, kSourceTrng};
  return ids;
}

std::string normalize_source_id(const std::string& name) {
  static const std::map<std::string, std::string> aliases = {
      {"OS_RNG", kSourceOsRng},   {"OS-RNG", kSourceOsRng},   {"OSRNG", kSourceOsRng},
      {"URANDOM", kSourceOsRng},
      {"SYSTEM", kSourceSystem},  {"SYS", kSourceSystem},     {"SYSTEM/CPU", kSourceSystem},
      {"CPU", kSourceSystem},     {"JITTER", kSourceSystem},
      {"AUDIO", kSourceAudio},    {"AUDIO (MIC)", kSourceAudio}, {"MIC", kSourceAudio},
      {"VIDEO", kSourceVideo},    {"VIDEO (CAM)", kSourceVideo}, {"CAMERA", kSourceVideo},
      {"HID", kSourceHid},        {"HID (MOUSE)", kSourceHid},   {"MOUSE", kSourceHid},
      {"TRNG", kSourceTrng},      {"TRNG (HARDWARE)", kSourceTrng}, {"HWRNG", kSourceTrng},
  };
  auto it = aliases.find(upper(name));
  return it == aliases.end() ? name : it->second;
}

std::optional<PeerAddress> parse_peer_address(const std::string& text) {
  std::string host;
  std::string port_text;
  if (!text.empty() && text.front() == '[') {
    // [v6-literal]:port
    const auto close = text.find(']');
    if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':') return std::nullopt;
    host = text.substr(1, close - 1);
    port_text = text.substr(close + 2);
  } else {
    const auto colon = text.rfind(':');
    if (colon == std::string::npos) return std::nullopt;
    host = text.substr(0, colon);
    port_text = text.substr(colon + 1);
    if (host.find(':') != std::string::npos) return std::nullopt;  // bare v6 needs brackets
  }
  if (!valid_host(host)) return std::nullopt;
  if (port_text.empty() || port_text.size() > 5) return std::nullopt;
  if (!std::all_of(port_text.begin(), port_text.end(), [](unsigned char c) { return std::isdigit(c); })) {
    return std::nullopt;
  }
  const unsigned long port = std::stoul(port_text);
  if (port == 0 || port > 65535) return std::nullopt;
  return PeerAddress{host, static_cast<uint16_t>(port)};
}

std::string peer_to_string(const PeerAddress& peer) {
  if (peer.host.find(':') != std::string::npos) {
    return "[" + peer.host + "]:" + std::to_string(peer.port);
  }
  return peer.host + ":" + std::to_string(peer.port);
}

std::string uplink_target(const UplinkConfig& u) {
  return "http://" + peer_to_string(PeerAddress{u.host, u.port}) + u.path;
}

EngineConfig default_engine_config() {
  EngineConfig cfg;
  // Claimed min-entropy drives the health cutoffs only; the estimator measures
  // what each source actually delivers.
  cfg.sources[kSourceOsRng]  = SourceConfig{kSourceOsRng, 7.5, 1000, "", false};
  cfg.sources[kSourceSystem] = SourceConfig{kSourceSystem, 1.0, 500, "/proc/stat", false};
  cfg.sources[kSourceAudio]  = SourceConfig{kSourceAudio, 2.0, 200, "/dev/dsp", false};
  cfg.sources[kSourceVideo]  = SourceConfig{kSourceVideo, 2.0, 1000, "/dev/video0", false};
  cfg.sources[kSourceHid]    = SourceConfig{kSourceHid, 1.0, 50, "/dev/input/event0", false};
  cfg.sources[kSourceTrng]   = SourceConfig{kSourceTrng, 7.0, 1000, "/dev/hwrng", false};
  return cfg;
}

ConfigValidationResult validate_uplink_config(const UplinkConfig& u) {
  ConfigValidationResult r;
  auto fail = [&r](const std::string& m) { r.ok = false; r.errors.push_back(m); };
  if (!valid_host(u.host)) fail("uplink.host must be a non-empty host name or address");
  if (u.port == 0) fail("uplink.port must be in 1..65535");
  if (u.path.empty() || u.path.front() != '/') fail("uplink.path must start with '/'");
  if (u.interval_ms < 10) fail("uplink.interval_ms must be >= 10");
  if (u.max_attempts < 1 || u.max_attempts > 16) fail("uplink.max_attempts must be in 1..16");
  if (u.backoff_base_ms < 1 || u.backoff_base_ms > 60000) fail("uplink.backoff_base_ms must be in 1..60000");
  if (u.timeout_ms < 1 || u.timeout_ms > 60000) fail("uplink.timeout_ms must be in 1..60000");
  return r;
}

ConfigValidationResult validate_p2p_config(const P2pConfig& p) {
  ConfigValidationResult r;
  auto fail = [&r](const std::string& m) { r.ok = false; r.errors.push_back(m); };
  if (p.interval_ms < 10) fail("p2p.interval_ms must be >= 10");
  if (p.max_attempts < 1 || p.max_attempts > 16) fail("p2p.max_attempts must be in 1..16");
  if (p.backoff_base_ms < 1 || p.backoff_base_ms > 60000) fail("p2p.backoff_base_ms must be in 1..60000");
  if (p.timeout_ms < 1 || p.timeout_ms > 60000) fail("p2p.timeout_ms must be in 1..60000");
  for (const auto& peer : p.peers) {
    if (!valid_host(peer.host) || peer.port == 0) fail("p2p.peers contains invalid address '" + peer_to_string(peer) + "'");
  }
  if (p.enabled && p.peers.empty()) r.warnings.push_back("p2p enabled with no peers: listen only");
  return r;
}

ConfigValidationResult validate_config(const EngineConfig& cfg) {
  ConfigValidationResult r;
  auto fail = [&r](const std::string& m) { r.ok = false; r.errors.push_back(m); };

  if (cfg.bundles_dir.empty()) fail("bundles_dir must not be empty");
  if (cfg.queue_capacity < 1) fail("queue_capacity must be >= 1");
  if (cfg.health_window < 16) fail("health_window must be >= 16");
  if (cfg.estimator_window < 16) fail("estimator_window must be >= 16");
  if (!(cfg.alpha_log2 > 0.0 && cfg.alpha_log2 <= 64.0)) fail("alpha_log2 must be in (0, 64]");
  if (!(cfg.target_pool_bits > 0.0)) fail("target_pool_bits must be > 0");
  if (!(cfg.mint_floor_bits >= 0.0)) fail("mint_floor_bits must be >= 0");
  if (cfg.mix_interval_ms < 1) fail("mix_interval_ms must be >= 1");

  const auto& builtin = builtin_source_ids();
  for (const auto& [id, s] : cfg.sources) {
    if (std::find(builtin.begin(), builtin.end(), id) == builtin.end()) {
      fail("sources." + id + " is not a known source");
      continue;
    }
    if (!(s.claimed_min_entropy > 0.0 && s.claimed_min_entropy <= 8.0)) {
      fail("sources." + id + ".claimed_min_entropy must be in (0, 8]");
    }
    if (s.poll_interval_ms < 1) fail("sources." + id + ".poll_interval_ms must be >= 1");
  }

  if (cfg.auto_mint.every_cycles < 1) fail("auto_mint.every_cycles must be >= 1");
  if (!(cfg.auto_mint.min_entropy >= 0.0 && cfg.auto_mint.min_entropy <= 8.0)) {
    fail("auto_mint.min_entropy must be in [0, 8]");
  }

  merge(r, validate_uplink_config(cfg.uplink));
  merge(r, validate_p2p_config(cfg.p2p));
  return r;
}

ConfigValidationResult parse_engine_config(const std::string& json_text, EngineConfig* inout) {
  ConfigValidationResult r;
  jsonlite::Object obj;
  if (!parse_object(json_text, &obj, r)) return r;

  EngineConfig candidate = *inout;
  Reader rd{obj, "", r};
  rd.read_string("bundles_dir", &candidate.bundles_dir);
  rd.read_u32("queue_capacity", &candidate.queue_capacity);
  rd.read_u32("health_window", &candidate.health_window);
  rd.read_u32("estimator_window", &candidate.estimator_window);
  rd.read_double("alpha_log2", &candidate.alpha_log2);
  rd.read_double("target_pool_bits", &candidate.target_pool_bits);
  rd.read_double("mint_floor_bits", &candidate.mint_floor_bits);
  rd.read_u32("mix_interval_ms", &candidate.mix_interval_ms);
  rd.read_string("event_log_path", &candidate.event_log_path);
  rd.read_string("node_id", &candidate.node_id);

  if (rd.present("sources")) {
    const jsonlite::Object* sources = jsonlite::get_object(obj, "sources");
    if (!sources) {
      rd.error("sources", "must be an object keyed by source id");
    } else {
      for (const auto& [name, value] : *sources) {
        const std::string id = normalize_source_id(name);
        auto it = candidate.sources.find(id);
        if (it == candidate.sources.end()) {
          rd.error("sources." + name, "is not a known source");
          continue;
        }
        if (!std::holds_alternative<jsonlite::Object>(value.v)) {
          rd.error("sources." + name, "must be an object");
          continue;
        }
        overlay_source(std::get<jsonlite::Object>(value.v), "sources." + id + ".", &it->second, r);
      }
    }
  }
  if (rd.present("uplink")) {
    const jsonlite::Object* u = jsonlite::get_object(obj, "uplink");
    if (!u) rd.error("uplink", "must be an object");
    else overlay_uplink(*u, "uplink.", &candidate.uplink, r);
  }
  if (rd.present("p2p")) {
    const jsonlite::Object* p = jsonlite::get_object(obj, "p2p");
    if (!p) rd.error("p2p", "must be an object");
    else overlay_p2p(*p, "p2p.", &candidate.p2p, r);
  }
  if (rd.present("auto_mint")) {
    const jsonlite::Object* a = jsonlite::get_object(obj, "auto_mint");
    if (!a) rd.error("auto_mint", "must be an object");
    else overlay_auto_mint(*a, "auto_mint.", &candidate.auto_mint, r);
  }
  rd.warn_unknown_keys();

  if (!r.ok) return r;
  merge(r, validate_config(candidate));
  if (r.ok) *inout = std::move(candidate);
  return r;
}

ConfigValidationResult parse_uplink_config(const std::string& json_text, UplinkConfig* inout) {
  ConfigValidationResult r;
  jsonlite::Object obj;
  if (!parse_object(json_text, &obj, r)) return r;
  UplinkConfig candidate = *inout;
  overlay_uplink(obj, "uplink.", &candidate, r);
  if (!r.ok) return r;
  merge(r, validate_uplink_config(candidate));
  if (r.ok) *inout = std::move(candidate);
  return r;
}

ConfigValidationResult parse_p2p_config(const std::string& json_text, P2pConfig* inout) {
  ConfigValidationResult r;
  jsonlite::Object obj;
  if (!parse_object(json_text, &obj, r)) return r;
  P2pConfig candidate = *inout;
  overlay_p2p(obj, "p2p.", &candidate, r);
  if (!r.ok) return r;
  merge(r, validate_p2p_config(candidate));
  if (r.ok) *inout = std::move(candidate);
  return r;
}

ConfigValidationResult load_engine_config_file(const std::string& path, EngineConfig* out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    ConfigValidationResult r;
    r.ok = false;
    r.errors.push_back("cannot read config file '" + path + "'");
    return r;
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  EngineConfig cfg = default_engine_config();
  ConfigValidationResult r = parse_engine_config(buf.str(), &cfg);
  if (r.ok) *out = std::move(cfg);
  return r;
}

std::string validation_to_json(const ConfigValidationResult& r) {
  jsonlite::Array errors;
  for (const auto& e : r.errors) errors.push_back(jsonlite::Value{e});
  jsonlite::Array warnings;
  for (const auto& w : r.warnings) warnings.push_back(jsonlite::Value{w});
  jsonlite::Object o;
  o["ok"] = jsonlite::Value{r.ok};
  o["errors"] = jsonlite::Value{std::move(errors)};
  o["warnings"] = jsonlite::Value{std::move(warnings)};
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

}  // namespace chaosmagnet
