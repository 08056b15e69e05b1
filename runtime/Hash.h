#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

struct evp_md_ctx_st;

namespace tally {

/** 256-bit digest; used as block identifier and proof-of-work target */
using Hash256 = std::array<uint8_t, 32>;

namespace hash {

/**
 * SHA3-256 of the given bytes, computed with OpenSSL EVP.
 * @throws std::runtime_error if OpenSSL fails to provide the digest
 */
Hash256 sha3_256(const std::string &input);

/** Lowercase hex rendering (64 chars) */
std::string toHex(const Hash256 &digest);

/** True when the first `count` bytes of the digest are zero */
bool hasLeadingZeroBytes(const Hash256 &digest, size_t count);

/**
 * Reusable SHA3-256 context for hot loops (nonce search).
 * Not thread safe; one instance per thread.
 */
class Sha3Hasher {
public:
  Sha3Hasher();
  ~Sha3Hasher();

  Sha3Hasher(const Sha3Hasher &) = delete;
  Sha3Hasher &operator=(const Sha3Hasher &) = delete;

  // Digest of prefix || suffix
  Hash256 digest(const std::string &prefix, const uint8_t *suffix,
                 size_t suffixSize);

private:
  evp_md_ctx_st *ctx_;
};

} // namespace hash
} // namespace tally
