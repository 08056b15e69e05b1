#include "Operation.h"
#include "../lib/Utilities.h"

#include <ostream>

namespace tally {

bool Operation::operator==(const Operation &other) const {
  if (type != other.type) {
    return false;
  }
  switch (type) {
  case T_ADD:
    return magnitude == other.magnitude;
  default:
    return true;
  }
}

nlohmann::json Operation::toJson() const {
  nlohmann::json j;
  switch (type) {
  case T_ADD:
    j["type"] = "add";
    // 128-bit values do not fit a JSON number
    j["magnitude"] = utl::toString(magnitude);
    break;
  default:
    j["type"] = "unknown";
    j["tag"] = type;
    break;
  }
  return j;
}

std::ostream &operator<<(std::ostream &os, const Operation &op) {
  switch (op.type) {
  case Operation::T_ADD:
    return os << "Add(" << utl::toString(op.magnitude) << ")";
  default:
    return os << "Unknown(" << static_cast<int>(op.type) << ")";
  }
}

} // namespace tally
