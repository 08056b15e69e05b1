#include "Hash.h"
#include "../lib/Utilities.h"

#include <openssl/evp.h>
#include <stdexcept>

namespace tally {
namespace hash {

Hash256 sha3_256(const std::string &input) {
  Sha3Hasher hasher;
  return hasher.digest(input, nullptr, 0);
}

std::string toHex(const Hash256 &digest) {
  return utl::hexEncode(digest.data(), digest.size());
}

bool hasLeadingZeroBytes(const Hash256 &digest, size_t count) {
  if (count > digest.size()) {
    return false;
  }
  for (size_t i = 0; i < count; ++i) {
    if (digest[i] != 0) {
      return false;
    }
  }
  return true;
}

Sha3Hasher::Sha3Hasher() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }
}

Sha3Hasher::~Sha3Hasher() { EVP_MD_CTX_free(ctx_); }

Hash256 Sha3Hasher::digest(const std::string &prefix, const uint8_t *suffix,
                           size_t suffixSize) {
  EVP_MD_CTX *mdctx = ctx_;
  Hash256 out{};
  unsigned int hashLen = 0;

  if (EVP_DigestInit_ex(mdctx, EVP_sha3_256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }

  if (EVP_DigestUpdate(mdctx, prefix.data(), prefix.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }

  if (suffixSize > 0 && EVP_DigestUpdate(mdctx, suffix, suffixSize) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }

  if (EVP_DigestFinal_ex(mdctx, out.data(), &hashLen) != 1 ||
      hashLen != out.size()) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }

  return out;
}

} // namespace hash
} // namespace tally
