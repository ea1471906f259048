#include "chaosmagnet/pqc.hpp"

#include <cstring>
#include <memory>
#include <mutex>

#include <oqs/oqs.h>

#include "chaosmagnet/hash.hpp"
#include "chaosmagnet/harvesters.hpp"

namespace chaosmagnet::pqc {
namespace {

// Guards the randomness hook and every liboqs call below.
std::mutex& oqs_mutex() {
  static std::mutex mu;
  return mu;
}

SeededStream* g_active_stream = nullptr;
bool g_random_failed = false;

void chaosmagnet_randombytes(uint8_t* out, size_t len) {
  if (g_active_stream != nullptr) {
    g_active_stream->generate(out, len);
    return;
  }
  if (read_os_entropy(out, len) != ErrorCode::none) {
    std::memset(out, 0, len);
    g_random_failed = true;
  }
}

void install_randombytes_locked() {
  static bool installed = false;
  if (installed) return;
  OQS_randombytes_custom_algorithm(&chaosmagnet_randombytes);
  installed = true;
}

// Routes OQS_randombytes through a seeded stream for one scope.
// Caller holds oqs_mutex().
class ScopedSeed {
 public:
  explicit ScopedSeed(const Seed& seed) : stream_(seed) {
    install_randombytes_locked();
    g_random_failed = false;
    g_active_stream = &stream_;
  }
  ~ScopedSeed() { g_active_stream = nullptr; }

  ScopedSeed(const ScopedSeed&) = delete;
  ScopedSeed& operator=(const ScopedSeed&) = delete;

 private:
  SeededStream stream_;
};

struct KemDeleter {
  void operator()(OQS_KEM* k) const { OQS_KEM_free(k); }
};
struct SigDeleter {
  void operator()(OQS_SIG* s) const { OQS_SIG_free(s); }
};

using KemPtr = std::unique_ptr<OQS_KEM, KemDeleter>;
using SigPtr = std::unique_ptr<OQS_SIG, SigDeleter>;

KemPtr new_kem() { return KemPtr(OQS_KEM_new(OQS_KEM_alg_ml_kem_512)); }
SigPtr new_sig() { return SigPtr(OQS_SIG_new(OQS_SIG_alg_falcon_512)); }

void cleanse_vector(std::vector<std::uint8_t>& v) {
  if (!v.empty()) OQS_MEM_cleanse(v.data(), v.size());
  v.clear();
}

}  // namespace

void cleanse_string(std::string& s) {
  if (!s.empty()) OQS_MEM_cleanse(s.data(), s.size());
  s.clear();
}

void SubSeeds::wipe() {
  OQS_MEM_cleanse(kem.data(), kem.size());
  OQS_MEM_cleanse(sig.data(), sig.size());
}

void KeyPair::wipe() {
  cleanse_vector(public_key);
  cleanse_vector(secret_key);
}

SubSeeds derive_subseeds(const PoolBytes& pool) {
  const std::string_view material(reinterpret_cast<const char*>(pool.data()), pool.size());
  SubSeeds seeds;
  std::string kem = derive_key_bytes(kKemSeedContext, material, seeds.kem.size());
  std::string sig = derive_key_bytes(kSigSeedContext, material, seeds.sig.size());
  std::memcpy(seeds.kem.data(), kem.data(), seeds.kem.size());
  std::memcpy(seeds.sig.data(), sig.data(), seeds.sig.size());
  OQS_MEM_cleanse(kem.data(), kem.size());
  OQS_MEM_cleanse(sig.data(), sig.size());
  return seeds;
}

ErrorCode generate_kem_keypair(const Seed& seed, KeyPair* out) {
  std::lock_guard<std::mutex> lk(oqs_mutex());
  KemPtr kem = new_kem();
  if (!kem) return ErrorCode::keygen_failed;

  KeyPair kp;
  kp.public_key.resize(kem->length_public_key);
  kp.secret_key.resize(kem->length_secret_key);
  OQS_STATUS rc;
  {
    ScopedSeed scoped(seed);
    rc = OQS_KEM_keypair(kem.get(), kp.public_key.data(), kp.secret_key.data());
  }
  if (rc != OQS_SUCCESS || g_random_failed) {
    kp.wipe();
    return ErrorCode::keygen_failed;
  }
  *out = std::move(kp);
  return ErrorCode::none;
}

ErrorCode generate_signature_keypair(const Seed& seed, KeyPair* out) {
  std::lock_guard<std::mutex> lk(oqs_mutex());
  SigPtr sig = new_sig();
  if (!sig) return ErrorCode::keygen_failed;

  KeyPair kp;
  kp.public_key.resize(sig->length_public_key);
  kp.secret_key.resize(sig->length_secret_key);
  OQS_STATUS rc;
  {
    ScopedSeed scoped(seed);
    rc = OQS_SIG_keypair(sig.get(), kp.public_key.data(), kp.secret_key.data());
  }
  if (rc != OQS_SUCCESS || g_random_failed) {
    kp.wipe();
    return ErrorCode::keygen_failed;
  }
  *out = std::move(kp);
  return ErrorCode::none;
}

ErrorCode sign_message(const std::vector<std::uint8_t>& secret_key,
                       std::string_view message,
                       std::vector<std::uint8_t>* signature) {
  std::lock_guard<std::mutex> lk(oqs_mutex());
  SigPtr sig = new_sig();
  if (!sig) return ErrorCode::sign_failed;
  if (secret_key.size() != sig->length_secret_key) return ErrorCode::sign_failed;

  install_randombytes_locked();
  g_random_failed = false;

  std::vector<std::uint8_t> out(sig->length_signature);
  size_t out_len = 0;
  const OQS_STATUS rc = OQS_SIG_sign(sig.get(), out.data(), &out_len,
                                     reinterpret_cast<const uint8_t*>(message.data()), message.size(),
                                     secret_key.data());
  if (rc != OQS_SUCCESS || g_random_failed) return ErrorCode::sign_failed;
  out.resize(out_len);
  *signature = std::move(out);
  return ErrorCode::none;
}

bool verify_signature(const std::vector<std::uint8_t>& public_key,
                      std::string_view message,
                      const std::vector<std::uint8_t>& signature) {
  std::lock_guard<std::mutex> lk(oqs_mutex());
  SigPtr sig = new_sig();
  if (!sig) return false;
  if (public_key.size() != sig->length_public_key) return false;
  return OQS_SIG_verify(sig.get(), reinterpret_cast<const uint8_t*>(message.data()), message.size(),
                        signature.data(), signature.size(), public_key.data()) == OQS_SUCCESS;
}

bool algorithms_available() {
  return OQS_KEM_alg_is_enabled(OQS_KEM_alg_ml_kem_512) == 1 &&
         OQS_SIG_alg_is_enabled(OQS_SIG_alg_falcon_512) == 1;
}

std::string liboqs_version() { return OQS_version(); }

}  // namespace chaosmagnet::pqc
