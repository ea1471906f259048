#include "chaosmagnet/mint_ledger.hpp"

#include "chaosmagnet/hash.hpp"
#include "chaosmagnet/jsonlite.hpp"
#include "chaosmagnet/version.hpp"

namespace chaosmagnet {

std::string ledger_entry_to_json(const MintLedgerEntry& e) {
  using jsonlite::Value;
  jsonlite::Object o;
  o["seq"] = Value{e.sequence};
  o["prev"] = Value{e.previous_digest};
  o["bundle_id"] = Value{e.bundle_id};
  o["file"] = Value{e.file};
  o["snapshot_digest"] = Value{e.snapshot_digest};
  o["ts_ms"] = Value{e.timestamp_unix_ms};
  o["ledger_version"] = Value{static_cast<std::uint64_t>(version::MINT_LEDGER_VERSION)};
  return jsonlite::to_json(Value{std::move(o)});
}

MintLedger::MintLedger(std::string path)
    : path_(std::move(path)), last_digest_(64, '0') {
  // Opened lazily on first append so a missing bundles dir at construction
  // time is not an error.
}

MintLedger::~MintLedger() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

bool MintLedger::append(MintLedgerEntry& entry) {
  std::lock_guard<std::mutex> lk(mu_);
  if (path_.empty()) return true;

  if (!file_) {
    file_ = std::fopen(path_.c_str(), "a");
    if (!file_) {
      ++failure_count_;
      return false;
    }
  }

  std::fseek(file_, 0, SEEK_END);
  const long pre_write_pos = std::ftell(file_);
  if (pre_write_pos < 0) {
    ++failure_count_;
    return false;
  }

  entry.sequence = seq_ + 1;
  entry.previous_digest = last_digest_;
  const std::string line = ledger_entry_to_json(entry);
  const std::string final_line = line + "\n";

  const bool written =
      std::fwrite(final_line.data(), 1, final_line.size(), file_) == final_line.size() &&
      std::fflush(file_) == 0;
  if (!written) {
    ++failure_count_;
    return false;
  }
  // Commit the chain only once the line is on disk.
  ++seq_;
  last_digest_ = blake3_hex(line);
  ++entry_count_;
  return true;
}

std::uint64_t MintLedger::entry_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entry_count_;
}

std::uint64_t MintLedger::failure_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return failure_count_;
}

}  // namespace chaosmagnet
