#include "Executor.h"
#include "CounterState.h"
#include "../lib/Utilities.h"

namespace tally {

Executor::Executor(const RuntimeConfig &config)
    : Module("tally.Executor"), config_(config) {}

bool Executor::meetsDifficulty(const Block &block) const {
  return hash::hasLeadingZeroBytes(block.identity(), config_.difficulty);
}

Executor::Roe<void> Executor::validateRoot(const Block &block) const {
  if (!block.isRoot()) {
    return Error(Error::E_INVALID_ROOT, "Root block must not have a parent");
  }
  if (!block.getOperations().empty()) {
    return Error(Error::E_INVALID_ROOT, "Root block must not carry operations");
  }
  if (block.getNonce() != 0) {
    return Error(Error::E_INVALID_ROOT, "Root block must have nonce 0");
  }
  log().info << "Accepted root block " << hash::toHex(block.identity());
  return {};
}

Executor::Roe<void> Executor::executeBlock(const Block &block,
                                           KeyValueStore &store) const {
  auto configResult = config_.validate();
  if (!configResult) {
    log().error << "Refusing to execute: " << configResult.error().message;
    return Error(Error::E_INVALID_CONFIG,
                 "Invalid runtime config: " + configResult.error().message);
  }

  Hash256 id = block.identity();
  if (!hash::hasLeadingZeroBytes(id, config_.difficulty)) {
    log().warning << "Rejected block " << hash::toHex(id)
                  << ": difficulty too low";
    return Error(Error::E_DIFFICULTY_TOO_LOW,
                 "Block " + hash::toHex(id) + " does not meet difficulty " +
                     std::to_string(config_.difficulty));
  }

  const auto &operations = block.getOperations();
  for (size_t i = 0; i < operations.size(); ++i) {
    if (!operations[i].isKnown()) {
      log().warning << "Rejected block " << hash::toHex(id) << ": operation "
                    << i << " is " << operations[i];
      return Error(Error::E_INVALID_OPERATION,
                   "Block " + hash::toHex(id) + " operation " +
                       std::to_string(i) + " has unknown tag " +
                       std::to_string(operations[i].type));
    }
  }

  CounterState counter(store);
  auto loadResult = counter.load();
  if (!loadResult) {
    log().error << "Block " << hash::toHex(id) << ": "
                << loadResult.error().message;
    return loadResult.error();
  }

  uint128 before = loadResult.value();
  auto foldResult = CounterState::fold(before, operations);
  if (!foldResult) {
    return foldResult.error();
  }
  uint128 after = foldResult.value();

  auto storeResult = counter.store(after);
  if (!storeResult) {
    log().error << "Block " << hash::toHex(id) << ": "
                << storeResult.error().message;
    return storeResult.error();
  }

  log().debug << "Executed block " << hash::toHex(id) << " ("
              << operations.size() << " operations): counter "
              << utl::toString(before) << " -> " << utl::toString(after);
  return {};
}

} // namespace tally
