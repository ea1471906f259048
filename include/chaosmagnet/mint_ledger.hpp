#pragma once

// chaosmagnet/mint_ledger.hpp: Append-only, hash-chained record of mints.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: lines are never modified or deleted.
//   2. SEQUENTIAL: each line carries a monotonically increasing sequence number.
//   3. CHAINED: "prev" is the BLAKE3 hex of the previous line (64 zeros for the
//      first line written by this process), so an edited line breaks the chain.
//   4. FAIL-SAFE: a ledger write failure never fails the mint; the bundle file
//      is authoritative. Failures are counted.
//
// Format: NDJSON at <bundles_dir>/ledger.ndjson, one object per mint:
//   {"bundle_id":..,"file":..,"ledger_version":1,"prev":..,"seq":N,
//    "snapshot_digest":..,"ts_ms":..}

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>

namespace chaosmagnet {

struct MintLedgerEntry {
  std::uint64_t sequence{0};
  std::string   previous_digest;
  std::string   bundle_id;
  std::string   file;
  std::string   snapshot_digest;
  std::uint64_t timestamp_unix_ms{0};
};

std::string ledger_entry_to_json(const MintLedgerEntry& e);

class MintLedger {
 public:
  // Empty path: ledger disabled, append() is a successful no-op.
  explicit MintLedger(std::string path = "");
  ~MintLedger();

  MintLedger(const MintLedger&) = delete;
  MintLedger& operator=(const MintLedger&) = delete;

  // Assigns sequence and previous_digest in place. False if nothing was written.
  bool append(MintLedgerEntry& entry);

  std::uint64_t entry_count() const;
  std::uint64_t failure_count() const;
  const std::string& path() const { return path_; }

 private:
  std::string path_;
  mutable std::mutex mu_;
  std::FILE* file_{nullptr};
  std::uint64_t seq_{0};
  std::uint64_t entry_count_{0};
  std::uint64_t failure_count_{0};
  std::string last_digest_;
};

}  // namespace chaosmagnet
