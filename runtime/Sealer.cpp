#include "Sealer.h"
#include "../lib/Serialize.hpp"

#include <chrono>
#include <limits>

namespace tally {

Sealer::Sealer(const RuntimeConfig &config)
    : Module("tally.Sealer"), config_(config) {}

Sealer::Roe<Block> Sealer::seal(UnsealedBlock &&block,
                                const std::atomic<bool> *stopFlag) {
  lastAttempts_ = 0;

  auto configResult = config_.validate();
  if (!configResult) {
    log().error << "Refusing to seal: " << configResult.error().message;
    return Error(Error::E_INVALID_CONFIG,
                 "Invalid runtime config: " + configResult.error().message);
  }

  // Everything before the nonce is fixed; only the trailing 8 bytes change
  const std::string prefix = block.encodePrefix();
  hash::Sha3Hasher hasher;
  uint8_t nonceBytes[sizeof(uint64_t)];

  auto startTime = std::chrono::steady_clock::now();
  log().debug << "Sealing block with " << block.operations.size()
              << " operations at difficulty " << config_.difficulty;

  uint64_t nonce = 0;
  while (true) {
    if (stopFlag && stopFlag->load(std::memory_order_relaxed)) {
      log().warning << "Sealing cancelled after " << lastAttempts_ << " attempts";
      return Error(Error::E_CANCELLED, "Sealing cancelled after " +
                                           std::to_string(lastAttempts_) + " attempts");
    }
    if (config_.maxSealAttempts > 0 && lastAttempts_ >= config_.maxSealAttempts) {
      log().warning << "Sealing gave up after " << lastAttempts_ << " attempts";
      return Error(Error::E_EXHAUSTED, "No valid nonce within " +
                                           std::to_string(config_.maxSealAttempts) +
                                           " attempts");
    }

    detail::putBigEndian(nonce, nonceBytes);
    Hash256 digest = hasher.digest(prefix, nonceBytes, sizeof(nonceBytes));
    ++lastAttempts_;

    if (hash::hasLeadingZeroBytes(digest, config_.difficulty)) {
      auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - startTime);
      log().info << "Sealed block " << hash::toHex(digest) << " nonce " << nonce
                 << " after " << lastAttempts_ << " attempts in "
                 << elapsed.count() << " ms";
      return Block(std::move(block.parentId), std::move(block.operations), nonce);
    }

    if (nonce == std::numeric_limits<uint64_t>::max()) {
      return Error(Error::E_EXHAUSTED, "Nonce space exhausted");
    }
    ++nonce;
  }
}

} // namespace tally
