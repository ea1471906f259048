#include "chaosmagnet/version.hpp"

#include "chaosmagnet/jsonlite.hpp"
#include "chaosmagnet/pqc.hpp"

#ifndef CHAOSMAGNET_SEMVER
#define CHAOSMAGNET_SEMVER "0.0.0"
#endif

namespace chaosmagnet {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.engine_semver       = CHAOSMAGNET_SEMVER;
  m.hash_primitive      = "blake3";
  m.kem_algorithm       = pqc::kKemAlgorithm;
  m.signature_algorithm = pqc::kSignatureAlgorithm;
  m.build_timestamp     = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  using jsonlite::Value;
  auto u = [](uint32_t v) { return Value{static_cast<std::uint64_t>(v)}; };
  jsonlite::Object o;
  o["engine_abi"]          = u(m.engine_abi);
  o["hash_algorithm"]      = u(m.hash_algorithm);
  o["bundle_format"]       = u(m.bundle_format);
  o["frame_format"]        = u(m.frame_format);
  o["mint_ledger"]         = u(m.mint_ledger);
  o["engine_semver"]       = Value{m.engine_semver};
  o["hash_primitive"]      = Value{m.hash_primitive};
  o["kem_algorithm"]       = Value{m.kem_algorithm};
  o["signature_algorithm"] = Value{m.signature_algorithm};
  o["build_timestamp"]     = Value{m.build_timestamp};
  return jsonlite::to_json(Value{std::move(o)});
}

CompatibilityResult check_compatibility(uint32_t caller_abi_version) {
  CompatibilityResult r;
  if (caller_abi_version != ENGINE_ABI_VERSION) {
    r.ok          = false;
    r.error_code  = "abi_version_mismatch";
    r.description = "caller built against ABI " + std::to_string(caller_abi_version) +
                    ", engine provides ABI " + std::to_string(ENGINE_ABI_VERSION) +
                    "; rebuild against the installed chaosmagnet/c_api.h";
    r.required_abi = ENGINE_ABI_VERSION;
    r.actual_abi   = caller_abi_version;
  }
  return r;
}

}  // namespace version
}  // namespace chaosmagnet
