#include "TipGuard.h"

namespace ws {
namespace blistener {

std::string toString(GuardResult result) {
  switch (result) {
  case GuardResult::NO_SYNC_TIP:
    return "NO_SYNC_TIP";
  case GuardResult::NOT_SYNCED:
    return "NOT_SYNCED";
  case GuardResult::TIP_MISMATCH:
    return "TIP_MISMATCH";
  case GuardResult::PASSED:
    return "PASSED";
  default:
    return "UNKNOWN";
  }
}

TipGuard::TipGuard(const wallet::IWalletStore &walletStore)
    : Module("wallet.blistener.guard"), walletStore_(walletStore) {}

GuardResult TipGuard::check(const chain::HeaderHash &currentTip,
                            const wallet::WalletId &walletId) const {
  auto syncTip = walletStore_.getWalletSyncTip(walletId);
  if (!syncTip) {
    log().info << "There is no sync tip corresponding to wallet #"
               << walletId;
    return GuardResult::NO_SYNC_TIP;
  }
  if (!syncTip->isSynced()) {
    log().info << "Wallet #" << walletId << " hasn't been synced yet";
    return GuardResult::NOT_SYNCED;
  }
  if (syncTip->getTip() != currentTip) {
    log().warning << "Skip wallet #" << walletId << ", because of wallet's tip "
                  << syncTip->getTip() << " mismatched with current tip "
                  << currentTip;
    return GuardResult::TIP_MISMATCH;
  }
  return GuardResult::PASSED;
}

} // namespace blistener
} // namespace ws
