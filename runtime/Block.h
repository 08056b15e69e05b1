#pragma once

#include "Errors.h"
#include "Hash.h"
#include "Operation.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tally {

/**
 * Block under construction: parent link and operations, no nonce yet.
 * Created by Builder::begin, filled by Builder::applyOperation and consumed
 * once by Sealer::seal.
 */
struct UnsealedBlock {
  std::optional<Hash256> parentId;
  std::vector<Operation> operations;

  /**
   * Wire form of everything that precedes the nonce. A sealed block's
   * encoding is exactly this prefix followed by the 8-byte nonce.
   */
  std::string encodePrefix() const;

  nlohmann::json toJson() const;
};

/**
 * Sealed block. Immutable once constructed.
 *
 * Wire form (big endian, see OutputArchive):
 *   [parent flag (1)][parent id (32, if flag == 1)]
 *   [operation count (8)][operation...]
 *   [nonce (8)]
 * identity() is the SHA3-256 of exactly these bytes.
 */
class Block {
public:
  Block() = default;
  Block(std::optional<Hash256> parentId, std::vector<Operation> operations,
        uint64_t nonce);

  /** Root of every chain: no parent, no operations, nonce 0. Not sealed. */
  static Block genesis();

  const std::optional<Hash256> &getParentId() const { return parentId_; }
  const std::vector<Operation> &getOperations() const { return operations_; }
  uint64_t getNonce() const { return nonce_; }

  bool isRoot() const { return !parentId_.has_value(); }

  Hash256 identity() const;

  std::string encode() const;
  static ResultOrError<Block, RuntimeError> decode(const std::string &data);

  bool operator==(const Block &other) const;
  bool operator!=(const Block &other) const { return !(*this == other); }

  nlohmann::json toJson() const;

  template <typename Archive> void serialize(Archive &ar) {
    ar & parentId_ & operations_ & nonce_;
  }

private:
  std::optional<Hash256> parentId_;
  std::vector<Operation> operations_;
  uint64_t nonce_{ 0 };
};

} // namespace tally
