#include "chaosmagnet/minter.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <utility>
#include <vector>

#include "chaosmagnet/hash.hpp"
#include "chaosmagnet/jsonlite.hpp"
#include "chaosmagnet/observability.hpp"
#include "chaosmagnet/pqc.hpp"
#include "chaosmagnet/version.hpp"

namespace fs = std::filesystem;

namespace chaosmagnet {

namespace {

constexpr std::size_t kBundleIdHexLen = 32;

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_bundle_" + std::to_string(dist(rng)))).string();
}

// Wipes a serialized bundle on every exit from its scope.
class SecretText {
 public:
  explicit SecretText(std::string text) : text_(std::move(text)) {}
  ~SecretText() { pqc::cleanse_string(text_); }

  SecretText(const SecretText&) = delete;
  SecretText& operator=(const SecretText&) = delete;

  const std::string& str() const { return text_; }

 private:
  std::string text_;
};

std::string bytes_hex(const std::vector<std::uint8_t>& v) { return to_hex(v.data(), v.size()); }

bool hex_to_vector(const std::string& hex, std::vector<std::uint8_t>* out) {
  std::string raw;
  if (!from_hex(hex, &raw)) return false;
  out->assign(raw.begin(), raw.end());
  return true;
}

jsonlite::Object metrics_object(const PqcBundle& b) {
  jsonlite::Object o;
  for (const auto& [id, m] : b.per_source_metrics) o[id] = metrics_to_value(m);
  return o;
}

jsonlite::Object health_object(const PqcBundle& b) {
  jsonlite::Object o;
  for (const auto& [id, h] : b.health_state) o[id] = jsonlite::Value{to_string(h)};
  return o;
}

void set_error(std::string* error, std::string message) {
  if (error) *error = std::move(message);
}

}  // namespace

// ---------------------------------------------------------------------------
// Bundle serialization
// ---------------------------------------------------------------------------

std::string bundle_digest_payload(const PqcBundle& b) {
  using jsonlite::Value;
  jsonlite::Object o;
  o["aggregate_entropy_bits"] = Value{b.aggregate_entropy_bits};
  o["format_version"] = Value{static_cast<std::uint64_t>(b.format_version)};
  o["health_state"] = Value{health_object(b)};
  o["kem_algorithm"] = Value{b.kem_algorithm};
  o["kem_public_key"] = Value{b.kem_public_key_hex};
  o["per_source_metrics"] = Value{metrics_object(b)};
  o["pool_snapshot"] = Value{b.pool_snapshot_hex};
  o["requester"] = Value{b.requester};
  o["signature_algorithm"] = Value{b.signature_algorithm};
  o["signature_public_key"] = Value{b.signature_public_key_hex};
  o["timestamp"] = Value{b.timestamp_unix_ms};
  return jsonlite::to_json(Value{std::move(o)});
}

std::string bundle_to_json(const PqcBundle& b) {
  using jsonlite::Value;
  jsonlite::Object o;
  o["bundle_id"] = Value{b.bundle_id};
  o["timestamp"] = Value{b.timestamp_unix_ms};
  o["requester"] = Value{b.requester};
  o["kem_algorithm"] = Value{b.kem_algorithm};
  o["signature_algorithm"] = Value{b.signature_algorithm};
  o["kem_public_key"] = Value{b.kem_public_key_hex};
  o["kem_secret_key"] = Value{b.kem_secret_key_hex};
  o["signature"] = Value{b.signature_hex};
  o["signature_public_key"] = Value{b.signature_public_key_hex};
  o["pool_snapshot"] = Value{b.pool_snapshot_hex};
  o["snapshot_digest"] = Value{b.snapshot_digest};
  o["aggregate_entropy_bits"] = Value{b.aggregate_entropy_bits};
  o["per_source_metrics"] = Value{metrics_object(b)};
  o["health_state"] = Value{health_object(b)};
  o["format_version"] = Value{static_cast<std::uint64_t>(b.format_version)};
  Value root{std::move(o)};
  std::string out = jsonlite::to_json(root);
  pqc::cleanse_string(std::get<std::string>(std::get<jsonlite::Object>(root.v)["kem_secret_key"].v));
  return out;
}

std::string mint_result_to_json(const MintResult& r) {
  using jsonlite::Value;
  jsonlite::Object o;
  o["ok"] = Value{r.ok};
  o["error_code"] = Value{to_string(r.error_code)};
  o["message"] = Value{r.message};
  if (r.ok) {
    const PqcBundle& b = r.bundle;
    jsonlite::Object bo;
    bo["bundle_id"] = Value{b.bundle_id};
    bo["file"] = Value{b.file_path};
    bo["timestamp"] = Value{b.timestamp_unix_ms};
    bo["requester"] = Value{b.requester};
    bo["kem_algorithm"] = Value{b.kem_algorithm};
    bo["signature_algorithm"] = Value{b.signature_algorithm};
    bo["kem_public_key"] = Value{b.kem_public_key_hex};
    bo["signature_public_key"] = Value{b.signature_public_key_hex};
    bo["signature"] = Value{b.signature_hex};
    bo["pool_snapshot"] = Value{b.pool_snapshot_hex};
    bo["snapshot_digest"] = Value{b.snapshot_digest};
    bo["aggregate_entropy_bits"] = Value{b.aggregate_entropy_bits};
    o["bundle"] = Value{std::move(bo)};
  }
  return jsonlite::to_json(Value{std::move(o)});
}

bool bundle_from_json(const std::string& text, PqcBundle* out, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object o = jsonlite::parse(text, &err);
  if (err) {
    set_error(error, err->code + ": " + err->message);
    return false;
  }
  for (const char* key : {"bundle_id", "kem_public_key", "kem_secret_key", "signature",
                          "signature_public_key", "pool_snapshot", "snapshot_digest"}) {
    if (!jsonlite::has_key(o, key)) {
      set_error(error, std::string("missing field: ") + key);
      return false;
    }
  }

  PqcBundle b;
  b.bundle_id = jsonlite::get_string(o, "bundle_id");
  b.timestamp_unix_ms = jsonlite::get_u64(o, "timestamp");
  b.requester = jsonlite::get_string(o, "requester");
  b.kem_algorithm = jsonlite::get_string(o, "kem_algorithm");
  b.signature_algorithm = jsonlite::get_string(o, "signature_algorithm");
  b.kem_public_key_hex = jsonlite::get_string(o, "kem_public_key");
  b.kem_secret_key_hex = jsonlite::get_string(o, "kem_secret_key");
  b.signature_hex = jsonlite::get_string(o, "signature");
  b.signature_public_key_hex = jsonlite::get_string(o, "signature_public_key");
  b.pool_snapshot_hex = jsonlite::get_string(o, "pool_snapshot");
  b.snapshot_digest = jsonlite::get_string(o, "snapshot_digest");
  b.aggregate_entropy_bits = jsonlite::get_double(o, "aggregate_entropy_bits");
  b.format_version = static_cast<std::uint32_t>(jsonlite::get_u64(o, "format_version"));

  if (const auto* metrics = jsonlite::get_object(o, "per_source_metrics")) {
    for (const auto& [id, v] : *metrics) {
      EntropyMetrics m;
      if (!metrics_from_value(v, &m)) {
        set_error(error, "malformed metrics for source " + id);
        return false;
      }
      b.per_source_metrics[id] = m;
    }
  }
  if (const auto* health = jsonlite::get_object(o, "health_state")) {
    for (const auto& [id, v] : *health) {
      HealthResult h;
      if (!std::holds_alternative<std::string>(v.v) ||
          !health_result_from_string(std::get<std::string>(v.v), &h)) {
        set_error(error, "malformed health state for source " + id);
        return false;
      }
      b.health_state[id] = h;
    }
  }
  *out = std::move(b);
  return true;
}

bool read_bundle_file(const std::string& path, PqcBundle* out, std::string* error) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    set_error(error, "cannot open " + path);
    return false;
  }
  std::ostringstream ss;
  ss << ifs.rdbuf();
  if (!bundle_from_json(ss.str(), out, error)) return false;
  out->file_path = path;
  return true;
}

bool verify_bundle(const PqcBundle& b, std::string* error) {
  if (b.format_version == 0 || b.format_version > version::BUNDLE_FORMAT_VERSION) {
    set_error(error, "unsupported bundle format_version " + std::to_string(b.format_version));
    return false;
  }
  if (b.signature_algorithm != pqc::kSignatureAlgorithm) {
    set_error(error, "unsupported signature algorithm " + b.signature_algorithm);
    return false;
  }
  const std::string digest = mint_digest_hash(bundle_digest_payload(b));
  if (digest != b.snapshot_digest) {
    set_error(error, "snapshot_digest mismatch");
    return false;
  }
  std::vector<std::uint8_t> pk;
  std::vector<std::uint8_t> sig;
  if (!hex_to_vector(b.signature_public_key_hex, &pk) || !hex_to_vector(b.signature_hex, &sig)) {
    set_error(error, "malformed hex in signature fields");
    return false;
  }
  if (!pqc::verify_signature(pk, digest, sig)) {
    set_error(error, "signature verification failed");
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

std::string bundle_file_name(const PqcBundle& b) {
  return "bundle_" + std::to_string(b.timestamp_unix_ms) + "_" + b.bundle_id + ".json";
}

ErrorCode persist_bundle_atomic(const std::string& dir, PqcBundle* b, std::string* error) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    set_error(error, "cannot create " + dir + ": " + ec.message());
    return ErrorCode::persist_failed;
  }
  const fs::path target = fs::path(dir) / bundle_file_name(*b);
  if (fs::exists(target, ec)) {
    set_error(error, "bundle file already exists: " + target.string());
    return ErrorCode::persist_failed;
  }

  const SecretText data(bundle_to_json(*b));
  const std::string tmp = make_tmp_name(dir);
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      set_error(error, "cannot open " + tmp);
      return ErrorCode::persist_failed;
    }
    ofs.write(data.str().data(), static_cast<std::streamsize>(data.str().size()));
    ofs.put('\n');
    ofs.flush();
    if (!ofs) {
      ofs.close();
      std::remove(tmp.c_str());
      set_error(error, "write failed: " + tmp);
      return ErrorCode::persist_failed;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    set_error(error, "rename failed: " + ec.message());
    return ErrorCode::persist_failed;
  }
  b->file_path = target.string();
  return ErrorCode::none;
}

// ---------------------------------------------------------------------------
// KeyMinter
// ---------------------------------------------------------------------------

KeyMinter::KeyMinter(std::string bundles_dir, double mint_floor_bits)
    : bundles_dir_(std::move(bundles_dir)),
      floor_bits_(mint_floor_bits),
      ledger_(bundles_dir_.empty() ? std::string() : (fs::path(bundles_dir_) / "ledger.ndjson").string()) {}

std::uint64_t KeyMinter::mint_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return mint_count_;
}

MintResult KeyMinter::fail(ErrorCode code, std::string message) const {
  MintResult r;
  r.ok = false;
  r.error_code = code;
  r.message = std::move(message);
  return r;
}

MintResult KeyMinter::mint(const EngineSnapshot& snapshot, const std::string& requester) {
  std::lock_guard<std::mutex> lk(mu_);

  const double aggregate = aggregate_conservative_entropy(snapshot);
  if (aggregate < floor_bits_) {
    return fail(ErrorCode::pool_below_threshold,
                "aggregate entropy " + jsonlite::format_double(aggregate) + " bits below floor " +
                    jsonlite::format_double(floor_bits_));
  }
  const PoolBytes& pool = snapshot.pool.bytes;
  if (last_minted_pool_ && *last_minted_pool_ == pool) {
    return fail(ErrorCode::pool_stale, "pool has not been mixed since the last mint");
  }

  pqc::SubSeeds seeds = pqc::derive_subseeds(pool);
  pqc::KeyPair kem;
  pqc::KeyPair sig;
  ErrorCode ec = pqc::generate_kem_keypair(seeds.kem, &kem);
  if (ec == ErrorCode::none) ec = pqc::generate_signature_keypair(seeds.sig, &sig);
  seeds.wipe();
  if (ec != ErrorCode::none) {
    kem.wipe();
    sig.wipe();
    return fail(ec, "key generation failed");
  }

  PqcBundle b;
  b.timestamp_unix_ms = unix_time_ms();
  b.requester = requester;
  b.kem_algorithm = pqc::kKemAlgorithm;
  b.signature_algorithm = pqc::kSignatureAlgorithm;
  b.kem_public_key_hex = bytes_hex(kem.public_key);
  b.kem_secret_key_hex = bytes_hex(kem.secret_key);
  b.signature_public_key_hex = bytes_hex(sig.public_key);
  b.pool_snapshot_hex = to_hex(pool.data(), pool.size());
  b.aggregate_entropy_bits = aggregate;
  for (const auto& s : snapshot.sources) {
    b.per_source_metrics[s.source_id] = s.metrics;
    b.health_state[s.source_id] = s.last_health_result;
  }
  b.format_version = version::BUNDLE_FORMAT_VERSION;
  kem.wipe();

  b.snapshot_digest = mint_digest_hash(bundle_digest_payload(b));
  std::vector<std::uint8_t> signature;
  ec = pqc::sign_message(sig.secret_key, b.snapshot_digest, &signature);
  sig.wipe();
  if (ec != ErrorCode::none) {
    pqc::cleanse_string(b.kem_secret_key_hex);
    return fail(ec, "signing failed");
  }
  b.signature_hex = bytes_hex(signature);
  b.bundle_id = hash_domain("cm:bundle-id:", b.snapshot_digest + b.signature_hex).substr(0, kBundleIdHexLen);

  std::string persist_error;
  ec = persist_bundle_atomic(bundles_dir_, &b, &persist_error);
  // The secret key lives only in the bundle file; callers get public fields.
  pqc::cleanse_string(b.kem_secret_key_hex);
  if (ec != ErrorCode::none) return fail(ec, persist_error);

  last_minted_pool_ = pool;
  ++mint_count_;

  MintLedgerEntry entry;
  entry.bundle_id = b.bundle_id;
  entry.file = b.file_path;
  entry.snapshot_digest = b.snapshot_digest;
  entry.timestamp_unix_ms = b.timestamp_unix_ms;
  const bool ledgered = ledger_.append(entry);

  MintResult r;
  r.ok = true;
  r.message = ledgered ? "minted " + b.bundle_id : "minted " + b.bundle_id + " (ledger write failed)";
  r.bundle = std::move(b);
  return r;
}

}  // namespace chaosmagnet
