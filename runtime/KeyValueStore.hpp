#ifndef TALLY_KEY_VALUE_STORE_HPP
#define TALLY_KEY_VALUE_STORE_HPP

#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <optional>
#include <string>

namespace tally {

/**
 * Storage externality: the only channel through which the runtime reads
 * and writes persistent state. Backends (in-memory, on-disk, a host
 * framework's trie) implement this; the runtime never sees more than it.
 */
class KeyValueStore : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  KeyValueStore(const std::string &name) : Module(name) {}
  virtual ~KeyValueStore() = default;

  // Absent key is a successful read of std::nullopt
  virtual Roe<std::optional<std::string>> read(const std::string &key) const = 0;
  virtual Roe<void> write(const std::string &key, const std::string &value) = 0;
};

} // namespace tally

#endif // TALLY_KEY_VALUE_STORE_HPP
