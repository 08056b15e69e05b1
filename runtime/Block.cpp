#include "Block.h"
#include "../lib/BinaryPack.hpp"

#include <sstream>
#include <utility>

namespace tally {

std::string UnsealedBlock::encodePrefix() const {
  std::ostringstream oss(std::ios::binary);
  OutputArchive ar(oss);
  ar & parentId & operations;
  return oss.str();
}

nlohmann::json UnsealedBlock::toJson() const {
  nlohmann::json j;
  j["parentId"] = parentId ? nlohmann::json(hash::toHex(*parentId)) : nlohmann::json();
  nlohmann::json ops = nlohmann::json::array();
  for (const auto &op : operations) {
    ops.push_back(op.toJson());
  }
  j["operations"] = ops;
  return j;
}

Block::Block(std::optional<Hash256> parentId, std::vector<Operation> operations,
             uint64_t nonce)
    : parentId_(std::move(parentId)), operations_(std::move(operations)),
      nonce_(nonce) {}

Block Block::genesis() { return Block(std::nullopt, {}, 0); }

Hash256 Block::identity() const { return hash::sha3_256(encode()); }

std::string Block::encode() const { return utl::binaryPack(*this); }

ResultOrError<Block, RuntimeError> Block::decode(const std::string &data) {
  auto result = utl::binaryUnpack<Block>(data);
  if (!result) {
    return RuntimeError(RuntimeError::E_DECODE,
                        "Failed to decode block: " + result.error().message);
  }
  return result.value();
}

bool Block::operator==(const Block &other) const {
  return parentId_ == other.parentId_ && operations_ == other.operations_ &&
         nonce_ == other.nonce_;
}

nlohmann::json Block::toJson() const {
  nlohmann::json j;
  j["id"] = hash::toHex(identity());
  j["parentId"] = parentId_ ? nlohmann::json(hash::toHex(*parentId_)) : nlohmann::json();
  nlohmann::json ops = nlohmann::json::array();
  for (const auto &op : operations_) {
    ops.push_back(op.toJson());
  }
  j["operations"] = ops;
  j["nonce"] = nonce_;
  return j;
}

} // namespace tally
