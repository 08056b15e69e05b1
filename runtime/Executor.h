#pragma once

#include "Block.h"
#include "Errors.h"
#include "KeyValueStore.hpp"
#include "RuntimeConfig.h"
#include "../lib/Module.h"

namespace tally {

/**
 * Executor - Block validation and state transition
 *
 * Two entry points:
 * - validateRoot(): genesis acceptance, no proof-of-work, no state access
 * - executeBlock(): proof-of-work check, then replay the block's operations
 *   onto the counter with one read and one write
 *
 * A failed call never writes to the store.
 */
class Executor : public Module {
public:
  using Error = RuntimeError;
  template <typename T> using Roe = ResultOrError<T, Error>;

  explicit Executor(const RuntimeConfig &config);
  ~Executor() override = default;

  const RuntimeConfig &getConfig() const { return config_; }

  bool meetsDifficulty(const Block &block) const;

  Roe<void> validateRoot(const Block &block) const;
  Roe<void> executeBlock(const Block &block, KeyValueStore &store) const;

private:
  RuntimeConfig config_;
};

} // namespace tally
