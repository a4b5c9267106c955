#ifndef WS_SYNC_REPLAY_H
#define WS_SYNC_REPLAY_H

#include "../blistener/BListener.h"
#include "../blistener/Reporting.h"
#include "../chain/ChainState.h"
#include "../consensus/SlotClock.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "../wallet/StorageModifier.h"
#include "../wallet/Tracking.h"
#include "../wallet/WalletStore.h"

#include <cstdint>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ws {
namespace app {

/**
 * Replay - Runs scripted apply/rollback batches through the chain state
 * and the wallet block listener
 *
 * Batch file format:
 *   [
 *     { "action": "apply", "blocks": [
 *         { "type": "genesis", "epoch": 1 },
 *         { "slot": { "epoch": 0, "slot": 3 }, "txs": [
 *             { "label": "t1",
 *               "inputs": [ { "ref": "t0", "index": 0 } ],
 *               "outputs": [ { "wallet": "W1", "account": 0, "index": 0,
 *                              "amount": 10 },
 *                            { "address": "ab12...", "amount": 5 } ] } ] } ] },
 *     { "action": "rollback", "count": 1 }
 *   ]
 *
 * Inputs name a tx by "ref" (label) or "txId". Undo entries are resolved
 * from outputs created earlier in the replay unless given as "undo".
 */
class Replay : public Module {
public:
  struct AddressConfig {
    uint32_t account{ 0 };
    uint32_t index{ 0 };
    std::string address; // empty: derive from the wallet key
  };

  struct WalletConfig {
    wallet::WalletId id;
    std::string publicKey;
    std::vector<AddressConfig> addresses;
    bool isSynced{ true };
    std::optional<chain::HeaderHash> syncTip; // default: genesis tip
  };

  struct Config {
    std::string logLevel{ "INFO" };
    std::string logFile;
    int64_t systemStart{ 0 };
    uint64_t slotsPerEpoch{ 10 };
    uint64_t slotDuration{ 1000 }; // ms
    consensus::SlottingData slottingData;
    chain::HeaderHash genesisTip;
    std::vector<WalletConfig> wallets;
  };

  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_CONFIG = 1;
  constexpr static int32_t E_BATCH = 2;
  constexpr static int32_t E_CHAIN = 3;
  constexpr static int32_t E_WALLET = 4;

  Replay();
  ~Replay() override = default;

  static Roe<Config> parseConfig(const nlohmann::json &jd);

  /** Header hash used as tip before the first block */
  static chain::HeaderHash getDefaultGenesisTip();

  Roe<void> init(const Config &config);
  Roe<void> runBatches(const nlohmann::json &batches, bool isFlushEnabled);
  Roe<void> runBatch(const nlohmann::json &batch, bool isFlushEnabled);

  const chain::ChainState &getChainState() const { return *spChainState_; }
  const wallet::WalletStore &getWalletStore() const { return walletStore_; }
  const wallet::StorageModifierVar &getStorageModifierVar() const {
    return storageModifierVar_;
  }
  size_t getReportCount() const { return reporter_.getReportCount(); }

  nlohmann::json toJson() const;

private:
  Roe<chain::OldestFirst<chain::Blund>>
  buildBlunds(const nlohmann::json &blocks);
  Roe<chain::Blund> buildBlund(const nlohmann::json &jb,
                               const chain::HeaderHash &previousHash);
  Roe<chain::TxId> resolveTxId(const nlohmann::json &ji) const;
  Roe<chain::Address> resolveAddress(const nlohmann::json &jo) const;

  Roe<void> applyBatch(const nlohmann::json &batch);
  Roe<void> rollbackBatch(const nlohmann::json &batch);

  Config config_;
  std::unique_ptr<chain::ChainState> spChainState_;
  std::unique_ptr<consensus::SlotClock> spSlotClock_;
  std::unique_ptr<blistener::WalletBListener> spListener_;
  wallet::WalletStore walletStore_;
  wallet::TxTracker tracker_;
  blistener::LogReporter reporter_;
  wallet::StorageModifierVar storageModifierVar_;

  std::map<std::string, chain::TxId> mLabels_;
  std::map<chain::TxIn, chain::TxOut> mOutputs_;
  std::map<wallet::WalletId, std::string> mPublicKeys_;
  uint64_t tipDifficulty_{ 0 };
};

} // namespace app
} // namespace ws

#endif // WS_SYNC_REPLAY_H
