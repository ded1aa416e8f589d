#ifndef SDIMPORT_MB_SHA256_TRAITS_H
#define SDIMPORT_MB_SHA256_TRAITS_H

#include <isal_crypto_api.h>
#include <multi_buffer.h>
#include <sha256_mb.h>

#include <cstddef>
#include <cstdint>

namespace sdimport {

//
// Binds the isa-l_crypto SHA-256 multi-buffer API, so the hasher
// does not refer to algorithm-specific names directly.
//
struct mb_sha256_traits {
   typedef ISAL_SHA256_HASH_CTX_MGR HASH_CTX_MGR;
   typedef ISAL_SHA256_HASH_CTX HASH_CTX;

   static constexpr const char *HASH_TYPE = "SHA256";

   // isa-l_crypto packs hash bytes into uint32_t for some hashes (e.g. `12 34 56 78` is packed as `0x12345678`)
   static constexpr bool HASH_UINT32_REORDER = true;

   // hash size, in uint32_t values, as defined by isa-l_crypto
   static constexpr size_t HASH_UINT32_SIZE = ISAL_SHA256_DIGEST_NWORDS;

   // hash size, in bytes
   static constexpr size_t HASH_SIZE = HASH_UINT32_SIZE * sizeof(uint32_t);

   static constexpr int (*ctx_mgr_init)(HASH_CTX_MGR *mgr) = &isal_sha256_ctx_mgr_init;
   static constexpr int (*ctx_mgr_submit)(HASH_CTX_MGR *mgr, HASH_CTX *ctx_in, HASH_CTX **ctx_out, const void *buffer, const uint32_t len, const ISAL_HASH_CTX_FLAG flags) = &isal_sha256_ctx_mgr_submit;
   static constexpr int (*ctx_mgr_flush)(HASH_CTX_MGR *mgr, HASH_CTX **ctx_out) = &isal_sha256_ctx_mgr_flush;
};

}

#endif // SDIMPORT_MB_SHA256_TRAITS_H
