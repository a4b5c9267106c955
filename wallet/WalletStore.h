#ifndef WS_SYNC_WALLET_STORE_H
#define WS_SYNC_WALLET_STORE_H

#include "../lib/Module.h"
#include "IWalletStore.h"
#include "StorageModifier.h"

#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>

namespace ws {
namespace wallet {

/**
 * WalletStore - In-memory wallet database
 *
 * Holds per-wallet key, tracked addresses, sync tip and the derived state
 * that flushed modifiers are applied to.
 */
class WalletStore : public Module, public IWalletStore {
public:
  struct WalletState {
    WalletKey key;
    std::optional<SyncTip> syncTip;
    std::map<chain::Address, AddressMeta> mTracked; // address book
    std::map<chain::Address, AddressMeta> mAddresses; // seen on chain
    std::map<chain::TxId, TxHistoryEntry> mHistory;
    std::map<chain::Address, chain::HeaderHash> mUsed;
    std::map<chain::Address, chain::HeaderHash> mChange;
    std::map<chain::TxIn, chain::TxOut> mUtxo;
    std::map<chain::TxId, PtxBlockInfo> mPtxCandidates;

    uint64_t getBalance() const;
    nlohmann::json toJson() const;
  };

  WalletStore();
  ~WalletStore() override = default;

  // IWalletStore
  std::vector<WalletId> getWalletIds() const override;
  std::optional<SyncTip> getWalletSyncTip(const WalletId &walletId) const override;
  Roe<std::vector<AddressMeta>>
  getWalletAddrMetas(const WalletId &walletId) const override;
  Roe<WalletKey> getWalletKey(const WalletId &walletId) const override;

  Roe<void> addWallet(const WalletId &walletId, const WalletKey &key,
                      const std::optional<SyncTip> &syncTip);
  /** Track a new address derived from the wallet key */
  Roe<AddressMeta> addAddress(const WalletId &walletId, uint32_t account,
                              uint32_t index);
  /** Track an address meta as given, without checking derivation */
  Roe<void> addAddressMeta(const AddressMeta &meta);
  Roe<void> setWalletSyncTip(const WalletId &walletId, const SyncTip &syncTip);
  Roe<void> removeWallet(const WalletId &walletId);

  Roe<WalletState> getWalletState(const WalletId &walletId) const;

  /**
   * Apply drained modifiers and move the sync tip of every wallet present
   * in the buffer to newTip. Buffered wallets no longer in the store are
   * skipped.
   */
  void flush(const StorageModifier &storageModifier,
             const chain::HeaderHash &newTip);

  nlohmann::json toJson() const;

private:
  std::map<WalletId, WalletState> mWallets_;
  mutable std::mutex mutex_;
};

} // namespace wallet
} // namespace ws

#endif // WS_SYNC_WALLET_STORE_H
