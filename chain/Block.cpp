#include "Block.h"
#include "../lib/BinaryPack.hpp"
#include "../lib/Utilities.h"

namespace ws {
namespace chain {

std::string TxIn::toString() const {
  return txId + "#" + std::to_string(index);
}

TxId Tx::getId() const { return utl::sha256(utl::binaryPack(*this)); }

HeaderHash BlockHeader::getHash() const {
  return utl::sha256(utl::binaryPack(*this));
}

nlohmann::json toJson(const TxIn &txIn) {
  nlohmann::json j;
  j["txId"] = txIn.txId;
  j["index"] = txIn.index;
  return j;
}

nlohmann::json toJson(const TxOut &txOut) {
  nlohmann::json j;
  j["address"] = txOut.address;
  j["amount"] = txOut.amount;
  return j;
}

nlohmann::json toJson(const Tx &tx) {
  nlohmann::json j;
  j["id"] = tx.getId();
  j["inputs"] = nlohmann::json::array();
  for (const auto &txIn : tx.inputs) {
    j["inputs"].push_back(toJson(txIn));
  }
  j["outputs"] = nlohmann::json::array();
  for (const auto &txOut : tx.outputs) {
    j["outputs"].push_back(toJson(txOut));
  }
  return j;
}

nlohmann::json toJson(const BlockHeader &header) {
  nlohmann::json j;
  j["type"] = header.isGenesis() ? "genesis" : "main";
  j["hash"] = header.getHash();
  j["previousHash"] = header.previousHash;
  j["epoch"] = header.slot.epoch;
  if (!header.isGenesis()) {
    j["slot"] = header.slot.slot;
  }
  j["difficulty"] = header.difficulty;
  return j;
}

} // namespace chain
} // namespace ws
