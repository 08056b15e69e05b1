#pragma once

#include "../lib/Serialize.hpp"

#include <cstdint>
#include <string>
#include <type_traits>
#include <nlohmann/json.hpp>

namespace tally {

/**
 * Operation carried by a block (extrinsic).
 * Tagged union: `type` selects the variant and which payload fields are
 * encoded. Tags are part of the wire form and must never be reused.
 */
struct Operation {
  constexpr static uint8_t T_ADD = 0;

  uint8_t type{ T_ADD };
  uint128 magnitude{ 0 }; // T_ADD payload

  static Operation add(uint128 value) {
    Operation op;
    op.type = T_ADD;
    op.magnitude = value;
    return op;
  }

  // Only known variants have a wire form
  bool isKnown() const { return type == T_ADD; }

  template <typename Archive> void serialize(Archive &ar) {
    ar & type;
    switch (type) {
    case T_ADD:
      ar & magnitude;
      break;
    default:
      if constexpr (std::is_same_v<Archive, InputArchive>) {
        ar.fail();
      }
      break;
    }
  }

  bool operator==(const Operation &other) const;
  bool operator!=(const Operation &other) const { return !(*this == other); }

  nlohmann::json toJson() const;
};

std::ostream &operator<<(std::ostream &os, const Operation &op);

} // namespace tally
