#include "MemoryStore.h"

namespace tally {

MemoryStore::MemoryStore() : KeyValueStore("tally.MemoryStore") {}

MemoryStore::Roe<std::optional<std::string>>
MemoryStore::read(const std::string &key) const {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    log().debug << "read " << key << ": absent";
    return std::optional<std::string>();
  }
  log().debug << "read " << key << ": " << it->second.size() << " bytes";
  return std::optional<std::string>(it->second);
}

MemoryStore::Roe<void> MemoryStore::write(const std::string &key,
                                          const std::string &value) {
  entries_[key] = value;
  log().debug << "write " << key << ": " << value.size() << " bytes";
  return {};
}

bool MemoryStore::contains(const std::string &key) const {
  return entries_.count(key) > 0;
}

size_t MemoryStore::size() const { return entries_.size(); }

void MemoryStore::clear() { entries_.clear(); }

} // namespace tally
