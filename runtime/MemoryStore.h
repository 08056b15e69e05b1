#pragma once

#include "KeyValueStore.hpp"

#include <cstddef>
#include <map>
#include <string>

namespace tally {

/**
 * In-memory KeyValueStore. Ordered map so dumps are deterministic.
 */
class MemoryStore : public KeyValueStore {
public:
  MemoryStore();
  ~MemoryStore() override = default;

  Roe<std::optional<std::string>> read(const std::string &key) const override;
  Roe<void> write(const std::string &key, const std::string &value) override;

  bool contains(const std::string &key) const;
  size_t size() const;
  void clear();

  const std::map<std::string, std::string> &entries() const { return entries_; }

private:
  std::map<std::string, std::string> entries_;
};

} // namespace tally
