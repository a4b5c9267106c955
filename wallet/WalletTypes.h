#ifndef WS_SYNC_WALLET_TYPES_H
#define WS_SYNC_WALLET_TYPES_H

#include "../chain/Block.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ws {
namespace wallet {

using WalletId = std::string;

/**
 * Chain tip a wallet's stored state is consistent with
 */
class SyncTip {
public:
  enum class State { NOT_SYNCED, SYNCED_WITH };

  static SyncTip notSynced() { return SyncTip(State::NOT_SYNCED, ""); }
  static SyncTip syncedWith(const chain::HeaderHash &tip) {
    return SyncTip(State::SYNCED_WITH, tip);
  }

  State getState() const { return state_; }
  bool isSynced() const { return state_ == State::SYNCED_WITH; }
  // Empty unless synced
  const chain::HeaderHash &getTip() const { return tip_; }

  bool operator==(const SyncTip &other) const {
    return state_ == other.state_ && tip_ == other.tip_;
  }
  bool operator!=(const SyncTip &other) const { return !(*this == other); }

  std::string toString() const;

private:
  SyncTip(State state, const chain::HeaderHash &tip) : state_(state), tip_(tip) {}

  State state_;
  chain::HeaderHash tip_;
};

struct WalletKey {
  std::string publicKey;
};

struct AddressMeta {
  WalletId walletId;
  uint32_t accountIndex{ 0 };
  uint32_t addressIndex{ 0 };
  chain::Address address;

  bool operator==(const AddressMeta &other) const {
    return walletId == other.walletId && accountIndex == other.accountIndex &&
           addressIndex == other.addressIndex && address == other.address;
  }
};

struct TxHistoryEntry {
  chain::TxId txId;
  std::vector<chain::TxIn> inputs;
  std::vector<chain::TxOut> outputs;
  std::optional<uint64_t> difficulty;
  std::optional<int64_t> timestamp; // ms since the Unix epoch

  bool operator==(const TxHistoryEntry &other) const {
    return txId == other.txId && inputs == other.inputs &&
           outputs == other.outputs && difficulty == other.difficulty &&
           timestamp == other.timestamp;
  }
};

// Block info recorded for a pending transaction candidate
struct PtxBlockInfo {
  std::optional<uint64_t> difficulty;

  bool operator==(const PtxBlockInfo &other) const {
    return difficulty == other.difficulty;
  }
};

/**
 * Address of (account, index) under a wallet's public key:
 * first 40 hex chars of sha256("<publicKey>|<account>|<index>").
 */
chain::Address deriveAddress(const std::string &publicKey, uint32_t account,
                             uint32_t index);

nlohmann::json toJson(const SyncTip &tip);
nlohmann::json toJson(const AddressMeta &meta);
nlohmann::json toJson(const TxHistoryEntry &entry);
nlohmann::json toJson(const PtxBlockInfo &info);

} // namespace wallet
} // namespace ws

#endif // WS_SYNC_WALLET_TYPES_H
