#include "WalletTypes.h"
#include "../lib/Utilities.h"

namespace ws {
namespace wallet {

std::string SyncTip::toString() const {
  if (state_ == State::NOT_SYNCED) {
    return "NotSynced";
  }
  return "SyncedWith " + tip_;
}

chain::Address deriveAddress(const std::string &publicKey, uint32_t account,
                             uint32_t index) {
  std::string digest = utl::sha256(publicKey + "|" + std::to_string(account) +
                                   "|" + std::to_string(index));
  return digest.substr(0, 40);
}

nlohmann::json toJson(const SyncTip &tip) {
  if (!tip.isSynced()) {
    return nullptr;
  }
  return tip.getTip();
}

nlohmann::json toJson(const AddressMeta &meta) {
  nlohmann::json j;
  j["walletId"] = meta.walletId;
  j["account"] = meta.accountIndex;
  j["index"] = meta.addressIndex;
  j["address"] = meta.address;
  return j;
}

nlohmann::json toJson(const TxHistoryEntry &entry) {
  nlohmann::json j;
  j["txId"] = entry.txId;
  j["inputs"] = nlohmann::json::array();
  for (const auto &txIn : entry.inputs) {
    j["inputs"].push_back(chain::toJson(txIn));
  }
  j["outputs"] = nlohmann::json::array();
  for (const auto &txOut : entry.outputs) {
    j["outputs"].push_back(chain::toJson(txOut));
  }
  j["difficulty"] = entry.difficulty ? nlohmann::json(*entry.difficulty)
                                     : nlohmann::json(nullptr);
  j["timestamp"] = entry.timestamp ? nlohmann::json(*entry.timestamp)
                                   : nlohmann::json(nullptr);
  return j;
}

nlohmann::json toJson(const PtxBlockInfo &info) {
  nlohmann::json j;
  j["difficulty"] = info.difficulty ? nlohmann::json(*info.difficulty)
                                    : nlohmann::json(nullptr);
  return j;
}

} // namespace wallet
} // namespace ws
