#pragma once

#include "Block.h"
#include "Errors.h"
#include "RuntimeConfig.h"
#include "../lib/Module.h"

#include <atomic>
#include <cstdint>

namespace tally {

/**
 * Sealer - Proof-of-work nonce search
 *
 * Turns an UnsealedBlock into a Block whose identity starts with
 * `difficulty` zero bytes. Nonces are tried in order from 0, so the result
 * for a given unsealed block is deterministic.
 *
 * The search runs on the calling thread. It stops early when the optional
 * stop flag becomes true (E_CANCELLED) or when maxSealAttempts nonces have
 * been tried without success (E_EXHAUSTED).
 */
class Sealer : public Module {
public:
  using Error = RuntimeError;
  template <typename T> using Roe = ResultOrError<T, Error>;

  explicit Sealer(const RuntimeConfig &config);
  ~Sealer() override = default;

  const RuntimeConfig &getConfig() const { return config_; }

  /** Number of nonces tried by the last seal() call */
  uint64_t getLastAttempts() const { return lastAttempts_; }

  Roe<Block> seal(UnsealedBlock &&block,
                  const std::atomic<bool> *stopFlag = nullptr);

private:
  RuntimeConfig config_;
  uint64_t lastAttempts_{ 0 };
};

} // namespace tally
