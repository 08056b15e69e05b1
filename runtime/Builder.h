#pragma once

#include "Block.h"
#include "Errors.h"
#include "KeyValueStore.hpp"
#include "../lib/Module.h"

namespace tally {

/**
 * Builder - Incremental block construction for a block producer
 *
 * begin() links a new UnsealedBlock to its parent, applyOperation() runs
 * one operation against the live store and records it in the block, and
 * finalize() closes the block before it is handed to the Sealer.
 *
 * The state reached by applying operations one at a time equals the state
 * the Executor reaches replaying the sealed block from the parent state.
 */
class Builder : public Module {
public:
  using Error = RuntimeError;
  template <typename T> using Roe = ResultOrError<T, Error>;

  Builder();
  ~Builder() override = default;

  UnsealedBlock begin(const Block &parent) const;

  Roe<void> applyOperation(UnsealedBlock &block, const Operation &operation,
                           KeyValueStore &store) const;

  // Reserved for per-block finalization (e.g. inherent operations); no-op
  Roe<void> finalize(UnsealedBlock &block, KeyValueStore &store) const;
};

} // namespace tally
