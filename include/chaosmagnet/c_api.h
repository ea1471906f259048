/*
 * chaosmagnet/c_api.h: Stable C ABI for driving the engine from any language.
 *
 * The GUI (or any other front end) is an external client of this surface. It
 * never sees C++ types; every query returns a JSON string.
 *
 * OWNERSHIP CONTRACT:
 *   - Caller owns all INPUT strings. The engine copies what it keeps.
 *   - All OUTPUT strings are heap-allocated C strings.
 *   - Caller MUST free output strings via chaosmagnet_free_string().
 *   - chaosmagnet_ctx_t* is opaque. Never dereference or copy.
 *
 * THREAD SAFETY:
 *   - chaosmagnet_init() and chaosmagnet_shutdown() are NOT thread-safe.
 *   - Every other call is thread-safe on a live ctx.
 *
 * ERRORS:
 *   Control calls return {"ok":bool,"error_code":string,...}. NULL is returned
 *   only for a NULL ctx or argument, or on allocation failure.
 *
 * EXAMPLE (C):
 *   chaosmagnet_ctx_t* ctx = chaosmagnet_init("{}", CHAOSMAGNET_ABI_VERSION);
 *   char* r = chaosmagnet_enable_source(ctx, "OS_RNG");
 *   chaosmagnet_free_string(r);
 *   char* snap = chaosmagnet_snapshot(ctx);
 *   printf("%s\n", snap);
 *   chaosmagnet_free_string(snap);
 *   chaosmagnet_shutdown(ctx);
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Current C ABI version. Bump on any breaking change. */
#define CHAOSMAGNET_ABI_VERSION 1

/* Opaque engine context. Never dereference. */
typedef struct chaosmagnet_ctx chaosmagnet_ctx_t;

/*
 * chaosmagnet_init: Create and start an engine.
 *
 * config_json: engine configuration (see config.hpp). NULL or "{}" for defaults.
 * abi_version: pass CHAOSMAGNET_ABI_VERSION.
 *
 * Returns NULL on ABI mismatch or invalid configuration. Use
 * chaosmagnet_validate_config() to see why a configuration was refused.
 */
chaosmagnet_ctx_t* chaosmagnet_init(const char* config_json, uint32_t abi_version);

/* {"ok":bool,"errors":[...],"warnings":[...]} for a config document. */
char* chaosmagnet_validate_config(const char* config_json);

char* chaosmagnet_enable_source(chaosmagnet_ctx_t* ctx, const char* source_id);
char* chaosmagnet_disable_source(chaosmagnet_ctx_t* ctx, const char* source_id);

/* Pool hex, fill fraction, extraction ratio, per-source metrics and health. */
char* chaosmagnet_snapshot(chaosmagnet_ctx_t* ctx);

/*
 * chaosmagnet_mint: Mint one key bundle.
 *
 * requester: free-form label stored in the bundle; NULL means "local".
 * Returns {"ok":true,"bundle":{...}} or {"ok":false,"error_code":...}.
 * The KEM secret key is written to the bundle file only, never returned here.
 */
char* chaosmagnet_mint(chaosmagnet_ctx_t* ctx, const char* requester);

/* Overlay JSON onto the current uplink / P2P configuration. Invalid input
 * leaves the engine unchanged and returns the validation errors. */
char* chaosmagnet_configure_uplink(chaosmagnet_ctx_t* ctx, const char* config_json);
char* chaosmagnet_configure_p2p(chaosmagnet_ctx_t* ctx, const char* config_json);

/* Zeroes every source's accumulated entropy. Mints are refused until the
 * sources have gathered the floor again. Returns {"ok":true,...}. */
char* chaosmagnet_reset_accumulators(chaosmagnet_ctx_t* ctx);

/* Most recent events, oldest first, at most max_events. */
char* chaosmagnet_events(chaosmagnet_ctx_t* ctx, uint32_t max_events);

char* chaosmagnet_stats(chaosmagnet_ctx_t* ctx);

/* Version manifest JSON (does not need a ctx). */
char* chaosmagnet_version_manifest(void);

/*
 * chaosmagnet_free_string: Free a string returned by this API.
 * Do NOT use free() or delete[].
 */
void chaosmagnet_free_string(char* s);

/* Stops every thread and frees the ctx. ctx is invalid afterwards. */
void chaosmagnet_shutdown(chaosmagnet_ctx_t* ctx);

uint32_t chaosmagnet_abi_version(void);

#ifdef __cplusplus
}  /* extern "C" */
#endif
