#ifndef WS_SYNC_TRACKING_H
#define WS_SYNC_TRACKING_H

#include "../chain/Block.h"
#include "../consensus/Slotting.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "WalletModifier.h"
#include "WalletTypes.h"

#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace ws {
namespace wallet {

// Block data the tracker needs per header
struct HeaderInfo {
  std::optional<uint64_t> difficulty;
  std::optional<int64_t> timestamp;     // slot start, none for genesis
  std::optional<uint64_t> ptxDifficulty; // main blocks only
};

using HeaderInfoGetter = std::function<HeaderInfo(const chain::BlockHeader &)>;

/**
 * Computes wallet deltas for flattened transactions
 */
class ITxTracker {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_KEY_DERIVATION = 1;
  constexpr static int32_t E_UNDO = 2;

  virtual ~ITxTracker() = default;

  /** Forward delta for txs given oldest first */
  virtual Roe<WalletModifier>
  trackApply(const WalletKey &key, const std::vector<AddressMeta> &metas,
             const HeaderInfoGetter &getHeaderInfo,
             const std::vector<chain::TxWithUndo> &txs) = 0;

  /** Inverse delta for txs given newest first */
  virtual Roe<WalletModifier>
  trackRollback(const WalletKey &key, const std::vector<AddressMeta> &metas,
                const consensus::SlotId &currentSlot,
                const HeaderInfoGetter &getHeaderInfo,
                const std::vector<chain::TxWithUndo> &txs) = 0;
};

/**
 * TxTracker - Default tracking algorithm
 *
 * Own addresses are the tracked metas that re-derive from the wallet key.
 * Inputs are attributed through their undo outputs.
 */
class TxTracker : public Module, public ITxTracker {
public:
  TxTracker();
  ~TxTracker() override = default;

  Roe<WalletModifier>
  trackApply(const WalletKey &key, const std::vector<AddressMeta> &metas,
             const HeaderInfoGetter &getHeaderInfo,
             const std::vector<chain::TxWithUndo> &txs) override;

  Roe<WalletModifier>
  trackRollback(const WalletKey &key, const std::vector<AddressMeta> &metas,
                const consensus::SlotId &currentSlot,
                const HeaderInfoGetter &getHeaderInfo,
                const std::vector<chain::TxWithUndo> &txs) override;

private:
  // Own part of one transaction
  struct TxView {
    chain::TxId txId;
    std::vector<std::pair<chain::TxIn, chain::TxOut>> ownInputs;
    std::vector<std::pair<chain::TxIn, chain::TxOut>> ownOutputs;
    bool hasForeignOutput{ false };

    bool isTouching() const { return !ownInputs.empty() || !ownOutputs.empty(); }
  };

  Roe<std::map<chain::Address, AddressMeta>>
  getOwnAddresses(const WalletKey &key,
                  const std::vector<AddressMeta> &metas) const;
  Roe<TxView> makeTxView(const chain::TxWithUndo &txWithUndo,
                         const std::map<chain::Address, AddressMeta> &own) const;
};

} // namespace wallet
} // namespace ws

#endif // WS_SYNC_TRACKING_H
