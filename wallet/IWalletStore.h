#ifndef WS_SYNC_IWALLET_STORE_H
#define WS_SYNC_IWALLET_STORE_H

#include "../lib/ResultOrError.hpp"
#include "WalletTypes.h"

#include <optional>
#include <vector>

namespace ws {
namespace wallet {

/**
 * Read access to the wallet database used during block sync
 */
class IWalletStore {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_WALLET_NOT_FOUND = 1;
  constexpr static int32_t E_WALLET_EXISTS = 2;
  constexpr static int32_t E_ADDRESS = 3;

  virtual ~IWalletStore() = default;

  virtual std::vector<WalletId> getWalletIds() const = 0;
  /** std::nullopt when no sync tip is recorded for the wallet */
  virtual std::optional<SyncTip>
  getWalletSyncTip(const WalletId &walletId) const = 0;
  /** Every address ever tracked by the wallet */
  virtual Roe<std::vector<AddressMeta>>
  getWalletAddrMetas(const WalletId &walletId) const = 0;
  virtual Roe<WalletKey> getWalletKey(const WalletId &walletId) const = 0;
};

} // namespace wallet
} // namespace ws

#endif // WS_SYNC_IWALLET_STORE_H
