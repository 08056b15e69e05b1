#include "CounterState.h"
#include "../lib/BinaryPack.hpp"

namespace tally {

CounterState::CounterState(KeyValueStore &store) : store_(store) {}

CounterState::Roe<uint128> CounterState::load() const {
  auto readResult = store_.read(KEY);
  if (!readResult) {
    return Error(Error::E_BACKEND, "Failed to read counter from " +
                                       store_.getModuleName() + ": " +
                                       readResult.error().message + " (code " +
                                       std::to_string(readResult.error().code) + ")");
  }
  const auto &bytes = readResult.value();
  if (!bytes) {
    return static_cast<uint128>(0);
  }
  return decode(*bytes);
}

CounterState::Roe<void> CounterState::store(uint128 value) {
  auto writeResult = store_.write(KEY, encode(value));
  if (!writeResult) {
    return Error(Error::E_BACKEND, "Failed to write counter to " +
                                       store_.getModuleName() + ": " +
                                       writeResult.error().message + " (code " +
                                       std::to_string(writeResult.error().code) + ")");
  }
  return {};
}

std::string CounterState::encode(uint128 value) { return utl::binaryPack(value); }

CounterState::Roe<uint128> CounterState::decode(const std::string &bytes) {
  auto result = utl::binaryUnpack<uint128>(bytes);
  if (!result) {
    return Error(Error::E_STATE_CORRUPTION,
                 "Stored counter is corrupted (" + std::to_string(bytes.size()) +
                     " bytes): " + result.error().message);
  }
  return result.value();
}

CounterState::Roe<uint128> CounterState::apply(uint128 counter,
                                               const Operation &op) {
  switch (op.type) {
  case Operation::T_ADD:
    return static_cast<uint128>(counter + op.magnitude);
  default:
    return Error(Error::E_INVALID_OPERATION,
                 "Unknown operation tag " + std::to_string(op.type));
  }
}

CounterState::Roe<uint128>
CounterState::fold(uint128 counter, const std::vector<Operation> &operations) {
  for (size_t i = 0; i < operations.size(); ++i) {
    auto result = apply(counter, operations[i]);
    if (!result) {
      return Error(result.error().code, "Operation " + std::to_string(i) +
                                            ": " + result.error().message);
    }
    counter = result.value();
  }
  return counter;
}

} // namespace tally
