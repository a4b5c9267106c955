#ifndef WS_SYNC_BLISTENER_H
#define WS_SYNC_BLISTENER_H

#include "../chain/IBListener.h"
#include "../chain/IChainState.h"
#include "../consensus/SlotClock.h"
#include "../lib/Module.h"
#include "../wallet/IWalletStore.h"
#include "../wallet/StorageModifier.h"
#include "../wallet/Tracking.h"
#include "Reporting.h"
#include "TipGuard.h"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace ws {
namespace blistener {

/**
 * WalletBListener - Keeps wallet modifiers in step with the chain
 *
 * Called by the block pipeline under the block lock. Each batch is
 * flattened once, then every wallet that passes the tip guard gets its
 * delta merged into the shared StorageModifier. A failing wallet is
 * reported and skipped; the rest of the batch continues. Writing the
 * buffer to the wallet store is a separate flush step, so both entry
 * points return no batch ops.
 */
class WalletBListener : public Module, public chain::IBListener {
public:
  // Batch level errors; per wallet failures are reported instead
  constexpr static int32_t E_EMPTY_BATCH = 1;
  constexpr static int32_t E_STRUCTURE = 2;
  // Per wallet failure codes, seen only by the reporter
  constexpr static int32_t E_WALLET_STORE = 10;
  constexpr static int32_t E_TRACKER = 11;

  WalletBListener(const chain::IChainState &chainState,
                  const consensus::ISlots &slots,
                  const wallet::IWalletStore &walletStore,
                  wallet::ITxTracker &tracker, IReporter &reporter,
                  wallet::StorageModifierVar &storageModifierVar);
  ~WalletBListener() override = default;

  Roe<chain::BatchOps>
  onApplyBlocks(const chain::OldestFirst<chain::Blund> &blunds) override;
  Roe<chain::BatchOps>
  onRollbackBlocks(const chain::NewestFirst<chain::Blund> &blunds) override;

  /** Warning delay of the batch watchdog: half the current slot */
  std::chrono::milliseconds getWarningTimeout() const;

private:
  using WalletSync = std::function<Roe<void>(const wallet::WalletId &)>;

  void syncWallets(const std::string &desc, const WalletSync &syncWallet);
  void catchInSync(const std::string &desc, const wallet::WalletId &walletId,
                   const WalletSync &syncWallet);

  Roe<void> applyToWallet(const chain::HeaderHash &currentTip,
                          const std::vector<chain::TxWithUndo> &txs,
                          const wallet::HeaderInfoGetter &getHeaderInfo,
                          size_t blockCount, const wallet::WalletId &walletId);
  Roe<void> rollbackFromWallet(const consensus::SlotId &currentSlot,
                               const chain::HeaderHash &currentTip,
                               const std::vector<chain::TxWithUndo> &txs,
                               const wallet::HeaderInfoGetter &getHeaderInfo,
                               size_t blockCount,
                               const wallet::WalletId &walletId);

  /** Key and tracked addresses of a wallet, read right before tracking */
  Roe<void> loadWallet(const wallet::WalletId &walletId, wallet::WalletKey &key,
                       std::vector<wallet::AddressMeta> &metas) const;

  wallet::HeaderInfoGetter makeHeaderInfoGetter() const;

  void logMsg(const std::string &action, size_t blockCount,
              const wallet::WalletId &walletId,
              const wallet::WalletModifier &modifier);

  const chain::IChainState &chainState_;
  const consensus::ISlots &slots_;
  const wallet::IWalletStore &walletStore_;
  wallet::ITxTracker &tracker_;
  IReporter &reporter_;
  wallet::StorageModifierVar &storageModifierVar_;
  TipGuard tipGuard_;
};

} // namespace blistener
} // namespace ws

#endif // WS_SYNC_BLISTENER_H
