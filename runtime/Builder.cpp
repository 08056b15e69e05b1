#include "Builder.h"
#include "CounterState.h"
#include "../lib/Utilities.h"

namespace tally {

Builder::Builder() : Module("tally.Builder") {}

UnsealedBlock Builder::begin(const Block &parent) const {
  UnsealedBlock block;
  block.parentId = parent.identity();
  log().debug << "Building on parent " << hash::toHex(*block.parentId);
  return block;
}

Builder::Roe<void> Builder::applyOperation(UnsealedBlock &block,
                                           const Operation &operation,
                                           KeyValueStore &store) const {
  if (!operation.isKnown()) {
    log().error << "Refusing " << operation << ": unknown operation tag";
    return Error(Error::E_INVALID_OPERATION,
                 "Unknown operation tag " + std::to_string(operation.type));
  }

  CounterState counter(store);
  auto loadResult = counter.load();
  if (!loadResult) {
    log().error << "Cannot apply " << operation << ": "
                << loadResult.error().message;
    return loadResult.error();
  }

  auto applyResult = CounterState::apply(loadResult.value(), operation);
  if (!applyResult) {
    return applyResult.error();
  }
  uint128 after = applyResult.value();

  auto storeResult = counter.store(after);
  if (!storeResult) {
    log().error << "Cannot apply " << operation << ": "
                << storeResult.error().message;
    return storeResult.error();
  }

  // Recorded only once the state change is in, so block and store agree
  block.operations.push_back(operation);
  log().debug << "Applied " << operation << ", counter now "
              << utl::toString(after);
  return {};
}

Builder::Roe<void> Builder::finalize(UnsealedBlock &block,
                                     KeyValueStore &/*store*/) const {
  log().debug << "Finalized block with " << block.operations.size()
              << " operations";
  return {};
}

} // namespace tally
