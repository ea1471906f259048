#include "chaosmagnet/c_api.h"

// C ABI over Engine.
//
//   - No C++ types cross the boundary; everything returned is JSON.
//   - Output strings are strdup'd and released with chaosmagnet_free_string().
//   - std::exception never escapes: control calls report it as
//     {"ok":false,"error_code":"internal_error"}.

#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <string>

#include "chaosmagnet/config.hpp"
#include "chaosmagnet/engine.hpp"
#include "chaosmagnet/jsonlite.hpp"
#include "chaosmagnet/minter.hpp"
#include "chaosmagnet/version.hpp"

struct chaosmagnet_ctx {
  uint32_t abi_version{CHAOSMAGNET_ABI_VERSION};
  std::unique_ptr<chaosmagnet::Engine> engine;
};

namespace {

using chaosmagnet::ErrorCode;

char* dup(const std::string& s) { return strdup(s.c_str()); }

std::string status_json(ErrorCode ec, const std::string& message) {
  using chaosmagnet::jsonlite::Value;
  chaosmagnet::jsonlite::Object o;
  o["ok"] = Value{ec == ErrorCode::none};
  o["error_code"] = Value{chaosmagnet::to_string(ec)};
  o["message"] = Value{message};
  return chaosmagnet::jsonlite::to_json(Value{std::move(o)});
}

std::string internal_error_json(const std::exception& e) {
  return std::string("{\"error_code\":\"internal_error\",\"message\":\"") +
         chaosmagnet::jsonlite::escape(e.what()) + "\",\"ok\":false}";
}

}  // namespace

extern "C" {

uint32_t chaosmagnet_abi_version(void) { return CHAOSMAGNET_ABI_VERSION; }

chaosmagnet_ctx_t* chaosmagnet_init(const char* config_json, uint32_t abi_version) {
  if (!chaosmagnet::version::check_compatibility(abi_version).ok) return nullptr;
  try {
    chaosmagnet::EngineConfig cfg = chaosmagnet::default_engine_config();
    if (config_json && config_json[0]) {
      if (!chaosmagnet::parse_engine_config(config_json, &cfg).ok) return nullptr;
    }
    auto engine = chaosmagnet::Engine::create(cfg);
    if (!engine) return nullptr;
    if (engine->start() != ErrorCode::none) return nullptr;
    auto* ctx = new chaosmagnet_ctx();
    ctx->engine = std::move(engine);
    return ctx;
  } catch (const std::exception&) {
    return nullptr;
  }
}

char* chaosmagnet_validate_config(const char* config_json) {
  try {
    chaosmagnet::EngineConfig cfg = chaosmagnet::default_engine_config();
    const auto r = chaosmagnet::parse_engine_config(config_json ? config_json : "{}", &cfg);
    return dup(chaosmagnet::validation_to_json(r));
  } catch (const std::exception& e) {
    return dup(internal_error_json(e));
  }
}

char* chaosmagnet_enable_source(chaosmagnet_ctx_t* ctx, const char* source_id) {
  if (!ctx || !source_id) return nullptr;
  try {
    const ErrorCode ec = ctx->engine->enable_source(source_id);
    const auto snap = ctx->engine->get_snapshot();
    std::string detail;
    for (const auto& s : snap.sources) {
      if (s.source_id == chaosmagnet::normalize_source_id(source_id)) detail = s.last_error;
    }
    return dup(status_json(ec, detail));
  } catch (const std::exception& e) {
    return dup(internal_error_json(e));
  }
}

char* chaosmagnet_disable_source(chaosmagnet_ctx_t* ctx, const char* source_id) {
  if (!ctx || !source_id) return nullptr;
  try {
    return dup(status_json(ctx->engine->disable_source(source_id), ""));
  } catch (const std::exception& e) {
    return dup(internal_error_json(e));
  }
}

char* chaosmagnet_snapshot(chaosmagnet_ctx_t* ctx) {
  if (!ctx) return nullptr;
  try {
    return dup(chaosmagnet::snapshot_to_json(ctx->engine->get_snapshot()));
  } catch (const std::exception& e) {
    return dup(internal_error_json(e));
  }
}

char* chaosmagnet_mint(chaosmagnet_ctx_t* ctx, const char* requester) {
  if (!ctx) return nullptr;
  try {
    const auto r = ctx->engine->request_mint(requester ? requester : "local");
    return dup(chaosmagnet::mint_result_to_json(r));
  } catch (const std::exception& e) {
    return dup(internal_error_json(e));
  }
}

char* chaosmagnet_configure_uplink(chaosmagnet_ctx_t* ctx, const char* config_json) {
  if (!ctx || !config_json) return nullptr;
  try {
    return dup(chaosmagnet::validation_to_json(ctx->engine->configure_uplink(config_json)));
  } catch (const std::exception& e) {
    return dup(internal_error_json(e));
  }
}

char* chaosmagnet_configure_p2p(chaosmagnet_ctx_t* ctx, const char* config_json) {
  if (!ctx || !config_json) return nullptr;
  try {
    return dup(chaosmagnet::validation_to_json(ctx->engine->configure_p2p(config_json)));
  } catch (const std::exception& e) {
    return dup(internal_error_json(e));
  }
}

char* chaosmagnet_reset_accumulators(chaosmagnet_ctx_t* ctx) {
  if (!ctx) return nullptr;
  try {
    ctx->engine->reset_accumulators();
    return dup(status_json(ErrorCode::none, "accumulators reset"));
  } catch (const std::exception& e) {
    return dup(internal_error_json(e));
  }
}

char* chaosmagnet_events(chaosmagnet_ctx_t* ctx, uint32_t max_events) {
  if (!ctx) return nullptr;
  try {
    return dup(ctx->engine->events().recent_json(max_events));
  } catch (const std::exception& e) {
    return dup(internal_error_json(e));
  }
}

char* chaosmagnet_stats(chaosmagnet_ctx_t* ctx) {
  if (!ctx) return nullptr;
  try {
    return dup(ctx->engine->stats().to_json());
  } catch (const std::exception& e) {
    return dup(internal_error_json(e));
  }
}

char* chaosmagnet_version_manifest(void) {
  try {
    return dup(chaosmagnet::version::manifest_to_json(chaosmagnet::version::current_manifest()));
  } catch (const std::exception& e) {
    return dup(internal_error_json(e));
  }
}

void chaosmagnet_free_string(char* s) {
  // strdup allocates with malloc.
  free(s);  // NOLINT
}

void chaosmagnet_shutdown(chaosmagnet_ctx_t* ctx) {
  if (!ctx) return;
  ctx->engine->shutdown();
  delete ctx;
}

}  // extern "C"
