#pragma once

// chaosmagnet/minter.hpp: Post-quantum key bundles minted from the pool.
//
// MINT PIPELINE (KeyMinter::mint):
//   1. Work on the caller's snapshot; the live pool is never touched.
//   2. Reject pool_below_threshold if the conservative entropy of enabled,
//      passing sources is under the floor.
//   3. Reject pool_stale if the pool bytes equal those of the last successful
//      mint (nothing has been mixed since).
//   4. Derive KEM and signature sub-seeds (pqc::derive_subseeds) and generate
//      ML-KEM-512 and Falcon-512 key pairs from them. Sub-seeds are wiped
//      immediately after.
//   5. snapshot_digest = mint_digest_hash(bundle_digest_payload(bundle)).
//      The Falcon key signs the digest hex; its secret key is then wiped.
//   6. bundle_id = first 32 hex of hash_domain("cm:bundle-id:", digest || sig).
//   7. Persist atomically (temp file + rename). Existing files are never
//      rewritten. Any failure leaves no bundle file behind.
//   8. Append to the mint ledger (non-fatal).
//   9. Cleanse the KEM secret key hex on every path, so MintResult::bundle
//      never carries it. Serialized bundle text is cleansed after the write.
//
// BUNDLE FILE:
//   <bundles_dir>/bundle_<timestamp_ms>_<bundle_id>.json, one JSON object with
//   hex-encoded key material. The KEM secret key is stored in the clear; the
//   directory is expected to be private to the operator.

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "chaosmagnet/mint_ledger.hpp"
#include "chaosmagnet/types.hpp"

namespace chaosmagnet {

std::string bundle_to_json(const PqcBundle& b);
bool bundle_from_json(const std::string& text, PqcBundle* out, std::string* error);
bool read_bundle_file(const std::string& path, PqcBundle* out, std::string* error);

// Control-surface view of a mint outcome: public fields and the file path,
// never the secret key.
std::string mint_result_to_json(const MintResult& r);

// Canonical JSON of every field the signature covers.
std::string bundle_digest_payload(const PqcBundle& b);

// Recomputes the digest and checks the Falcon signature over it.
bool verify_bundle(const PqcBundle& b, std::string* error);

std::string bundle_file_name(const PqcBundle& b);

// Writes <dir>/bundle_file_name(b) via temp + rename and records the path in
// b->file_path. persist_failed if the target already exists or any step fails.
ErrorCode persist_bundle_atomic(const std::string& dir, PqcBundle* b, std::string* error);

class KeyMinter {
 public:
  KeyMinter(std::string bundles_dir, double mint_floor_bits);

  KeyMinter(const KeyMinter&) = delete;
  KeyMinter& operator=(const KeyMinter&) = delete;

  // Serialized: concurrent requests mint one after the other.
  MintResult mint(const EngineSnapshot& snapshot, const std::string& requester);

  const std::string& bundles_dir() const { return bundles_dir_; }
  double floor_bits() const { return floor_bits_; }
  const MintLedger& ledger() const { return ledger_; }
  std::uint64_t mint_count() const;

 private:
  MintResult fail(ErrorCode code, std::string message) const;

  const std::string bundles_dir_;
  const double      floor_bits_;
  MintLedger        ledger_;

  mutable std::mutex mu_;
  std::optional<PoolBytes> last_minted_pool_;
  std::uint64_t mint_count_{0};
};

}  // namespace chaosmagnet
