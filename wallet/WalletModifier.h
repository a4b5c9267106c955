#ifndef WS_SYNC_WALLET_MODIFIER_H
#define WS_SYNC_WALLET_MODIFIER_H

#include "MapModifier.hpp"
#include "WalletTypes.h"

#include <nlohmann/json.hpp>
#include <string>

namespace ws {
namespace wallet {

/**
 * Unflushed delta of one wallet's derived state
 */
struct WalletModifier {
  MapModifier<chain::Address, AddressMeta> addresses;
  MapModifier<chain::TxId, TxHistoryEntry> history;
  MapModifier<chain::Address, chain::HeaderHash> used;   // address -> block
  MapModifier<chain::Address, chain::HeaderHash> change; // address -> block
  MapModifier<chain::TxIn, chain::TxOut> utxo;
  MapModifier<chain::TxId, PtxBlockInfo> ptxCandidates;

  /** Compose: this delta followed by the other one */
  void merge(const WalletModifier &other);

  bool isEmpty() const;

  // Short human readable counts, used in sync logs
  std::string getSummary() const;

  nlohmann::json toJson() const;

  bool operator==(const WalletModifier &other) const;
  bool operator!=(const WalletModifier &other) const {
    return !(*this == other);
  }
};

} // namespace wallet
} // namespace ws

#endif // WS_SYNC_WALLET_MODIFIER_H
