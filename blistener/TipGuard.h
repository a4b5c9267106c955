#ifndef WS_SYNC_TIP_GUARD_H
#define WS_SYNC_TIP_GUARD_H

#include "../lib/Module.h"
#include "../wallet/IWalletStore.h"

#include <string>

namespace ws {
namespace blistener {

enum class GuardResult {
  NO_SYNC_TIP,  // store has no sync tip for the wallet
  NOT_SYNCED,   // wallet never synced
  TIP_MISMATCH, // wallet synced with another tip
  PASSED,
};

std::string toString(GuardResult result);

/**
 * TipGuard - Wallet eligibility check against the current chain tip
 *
 * Only a wallet synced with exactly the current tip may be updated. Other
 * outcomes are logged and skipped.
 */
class TipGuard : public Module {
public:
  explicit TipGuard(const wallet::IWalletStore &walletStore);
  ~TipGuard() override = default;

  GuardResult check(const chain::HeaderHash &currentTip,
                    const wallet::WalletId &walletId) const;

  /** Run action only when the wallet passes the check */
  template <typename F>
  GuardResult guard(const chain::HeaderHash &currentTip,
                    const wallet::WalletId &walletId, F &&action) const {
    GuardResult result = check(currentTip, walletId);
    if (result == GuardResult::PASSED) {
      action();
    }
    return result;
  }

private:
  const wallet::IWalletStore &walletStore_;
};

} // namespace blistener
} // namespace ws

#endif // WS_SYNC_TIP_GUARD_H
