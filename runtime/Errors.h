#pragma once

#include "../lib/ResultOrError.hpp"

#include <cstdint>

namespace tally {

/**
 * Error shared by the sealer, executor and builder.
 * Codes are stable; callers branch on them.
 */
struct RuntimeError : RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;

  constexpr static int32_t E_BACKEND = 1;             // Store read or write failed
  constexpr static int32_t E_DIFFICULTY_TOO_LOW = 2;  // Identity misses the proof-of-work target
  constexpr static int32_t E_STATE_CORRUPTION = 3;    // Stored counter is not a valid integer
  constexpr static int32_t E_INVALID_ROOT = 4;        // Not the canonical root block
  constexpr static int32_t E_CANCELLED = 5;           // Nonce search stopped by caller
  constexpr static int32_t E_EXHAUSTED = 6;           // Nonce search ran out of attempts
  constexpr static int32_t E_DECODE = 7;              // Malformed block wire form
  constexpr static int32_t E_INVALID_OPERATION = 8;   // Operation tag is not a known variant
  constexpr static int32_t E_INVALID_CONFIG = 9;      // RuntimeConfig failed validation
};

} // namespace tally
