#pragma once

#include "Errors.h"
#include "KeyValueStore.hpp"
#include "Operation.h"
#include "../lib/Serialize.hpp"

#include <string>
#include <vector>

namespace tally {

/**
 * The runtime's single piece of state: a 128-bit counter stored under
 * KEY as 16 big-endian bytes. Executor and Builder both go through this
 * class so key, encoding and arithmetic cannot drift apart.
 *
 * Arithmetic wraps modulo 2^128.
 */
class CounterState {
public:
  using Error = RuntimeError;
  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static const char *KEY = "counter";

  explicit CounterState(KeyValueStore &store);

  // Absent key reads as 0; undecodable bytes are E_STATE_CORRUPTION
  Roe<uint128> load() const;
  Roe<void> store(uint128 value);

  static std::string encode(uint128 value);
  static Roe<uint128> decode(const std::string &bytes);

  // Unknown operation tags are E_INVALID_OPERATION
  static Roe<uint128> apply(uint128 counter, const Operation &op);
  static Roe<uint128> fold(uint128 counter, const std::vector<Operation> &operations);

private:
  KeyValueStore &store_;
};

} // namespace tally
