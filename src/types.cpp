#include "chaosmagnet/types.hpp"

#include "chaosmagnet/hash.hpp"

namespace chaosmagnet {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none:                 return "";
    case ErrorCode::config_invalid:       return "config_invalid";
    case ErrorCode::unknown_source:       return "unknown_source";
    case ErrorCode::invalid_state:        return "invalid_state";
    case ErrorCode::device_unavailable:   return "device_unavailable";
    case ErrorCode::permission_denied:    return "permission_denied";
    case ErrorCode::device_io_failed:     return "device_io_failed";
    case ErrorCode::queue_full:           return "queue_full";
    case ErrorCode::pool_below_threshold: return "pool_below_threshold";
    case ErrorCode::pool_stale:           return "pool_stale";
    case ErrorCode::keygen_failed:        return "keygen_failed";
    case ErrorCode::sign_failed:          return "sign_failed";
    case ErrorCode::persist_failed:       return "persist_failed";
    case ErrorCode::network_failed:       return "network_failed";
    case ErrorCode::json_parse_error:     return "json_parse_error";
    case ErrorCode::json_duplicate_key:   return "json_duplicate_key";
  }
  return "unknown_error";
}

std::string to_string(HarvesterState state) {
  switch (state) {
    case HarvesterState::disabled: return "disabled";
    case HarvesterState::starting: return "starting";
    case HarvesterState::running:  return "running";
    case HarvesterState::stopping: return "stopping";
    case HarvesterState::error:    return "error";
  }
  return "unknown";
}

std::string to_string(HealthResult result) {
  return result == HealthResult::pass ? "pass" : "fail";
}

bool health_result_from_string(const std::string& s, HealthResult* out) {
  if (s == "pass") { *out = HealthResult::pass; return true; }
  if (s == "fail") { *out = HealthResult::fail; return true; }
  return false;
}

double aggregate_conservative_entropy(const EngineSnapshot& snapshot) {
  double total = 0.0;
  for (const auto& s : snapshot.sources) {
    if (s.enabled && s.last_health_result == HealthResult::pass) {
      total += s.metrics.accumulated_true_entropy_bits;
    }
  }
  return total;
}

double total_conservative_entropy(const std::vector<SourceState>& sources) {
  double total = 0.0;
  for (const auto& s : sources) total += s.metrics.accumulated_true_entropy_bits;
  return total;
}

jsonlite::Value metrics_to_value(const EntropyMetrics& m) {
  jsonlite::Object o;
  o["shannon"] = jsonlite::Value{m.shannon_bits_per_byte};
  o["min_entropy"] = jsonlite::Value{m.min_entropy_bits_per_byte};
  o["collision_entropy"] = jsonlite::Value{m.collision_entropy_bits_per_byte};
  o["accumulated_bits"] = jsonlite::Value{m.accumulated_true_entropy_bits};
  o["sample_count"] = jsonlite::Value{m.sample_count};
  return jsonlite::Value{std::move(o)};
}

bool metrics_from_value(const jsonlite::Value& v, EntropyMetrics* out) {
  if (!std::holds_alternative<jsonlite::Object>(v.v)) return false;
  const auto& o = std::get<jsonlite::Object>(v.v);
  for (const char* key : {"shannon", "min_entropy", "collision_entropy", "accumulated_bits", "sample_count"}) {
    if (!jsonlite::is_number(o, key)) return false;
  }
  out->shannon_bits_per_byte = jsonlite::get_double(o, "shannon");
  out->min_entropy_bits_per_byte = jsonlite::get_double(o, "min_entropy");
  out->collision_entropy_bits_per_byte = jsonlite::get_double(o, "collision_entropy");
  out->accumulated_true_entropy_bits = jsonlite::get_double(o, "accumulated_bits");
  out->sample_count = jsonlite::get_u64(o, "sample_count");
  return true;
}

std::string snapshot_to_json(const EngineSnapshot& snapshot) {
  using jsonlite::Value;
  jsonlite::Object root;

  const auto& pool = snapshot.pool;
  root["pool_hex"] = Value{to_hex(pool.bytes.data(), pool.bytes.size())};
  root["fill_fraction"] = Value{pool.fill_fraction};
  root["extraction_ratio"] = Value{pool.extraction_ratio};
  root["raw_bytes"] = Value{pool.accumulated_raw_byte_count};
  root["mix_cycles"] = Value{pool.mix_cycle_count};
  root["last_mix_ms"] = Value{pool.last_mix_timestamp_ms};
  root["total_bytes_harvested"] = Value{snapshot.total_bytes_harvested};
  root["taken_at_ms"] = Value{snapshot.taken_at_ms};
  root["aggregate_entropy_bits"] = Value{aggregate_conservative_entropy(snapshot)};

  jsonlite::Array sources;
  for (const auto& s : snapshot.sources) {
    jsonlite::Object so;
    so["id"] = Value{s.source_id};
    so["enabled"] = Value{s.enabled};
    so["state"] = Value{to_string(s.lifecycle)};
    so["health"] = Value{to_string(s.last_health_result)};
    so["metrics"] = metrics_to_value(s.metrics);
    so["bytes"] = Value{s.bytes_received};
    so["health_failures"] = Value{s.health_failures};
    so["last_error"] = Value{s.last_error};
    sources.push_back(Value{std::move(so)});
  }
  root["sources"] = Value{std::move(sources)};

  jsonlite::Array hist_min;
  for (double d : snapshot.history_min_entropy) hist_min.push_back(Value{d});
  jsonlite::Array hist_white;
  for (double d : snapshot.history_whitened) hist_white.push_back(Value{d});
  jsonlite::Object history;
  history["min_entropy"] = Value{std::move(hist_min)};
  history["whitened"] = Value{std::move(hist_white)};
  root["history"] = Value{std::move(history)};

  jsonlite::Object uplink;
  uplink["enabled"] = Value{snapshot.uplink_enabled};
  uplink["target"] = Value{snapshot.uplink_target};
  root["uplink"] = Value{std::move(uplink)};

  jsonlite::Object p2p;
  p2p["enabled"] = Value{snapshot.p2p_enabled};
  p2p["port"] = Value{static_cast<std::uint64_t>(snapshot.p2p_port)};
  p2p["peers"] = Value{static_cast<std::uint64_t>(snapshot.p2p_peer_count)};
  p2p["received"] = Value{snapshot.p2p_received_count};
  root["p2p"] = Value{std::move(p2p)};

  return jsonlite::to_json(Value{std::move(root)});
}

std::string snapshot_summary_json(const EngineSnapshot& snapshot) {
  using jsonlite::Value;
  jsonlite::Object root;
  root["fill"] = Value{snapshot.pool.fill_fraction};
  root["mix_cycles"] = Value{snapshot.pool.mix_cycle_count};
  root["raw_bytes"] = Value{snapshot.pool.accumulated_raw_byte_count};
  root["aggregate_bits"] = Value{aggregate_conservative_entropy(snapshot)};
  jsonlite::Object sources;
  for (const auto& s : snapshot.sources) {
    if (!s.enabled) continue;
    jsonlite::Object so;
    so["state"] = Value{to_string(s.lifecycle)};
    so["health"] = Value{to_string(s.last_health_result)};
    so["min_entropy"] = Value{s.metrics.min_entropy_bits_per_byte};
    sources[s.source_id] = Value{std::move(so)};
  }
  root["sources"] = Value{std::move(sources)};
  return jsonlite::to_json(Value{std::move(root)});
}

}  // namespace chaosmagnet
