#include "BListener.h"
#include "../lib/Watchdog.h"
#include "BlockFlattener.h"

#include <exception>

namespace ws {
namespace blistener {

WalletBListener::WalletBListener(const chain::IChainState &chainState,
                                 const consensus::ISlots &slots,
                                 const wallet::IWalletStore &walletStore,
                                 wallet::ITxTracker &tracker,
                                 IReporter &reporter,
                                 wallet::StorageModifierVar &storageModifierVar)
    : Module("wallet.blistener"), chainState_(chainState), slots_(slots),
      walletStore_(walletStore), tracker_(tracker), reporter_(reporter),
      storageModifierVar_(storageModifierVar), tipGuard_(walletStore) {}

std::chrono::milliseconds WalletBListener::getWarningTimeout() const {
  return slots_.getCurrentEpochSlotDuration() / 2;
}

WalletBListener::Roe<chain::BatchOps>
WalletBListener::onApplyBlocks(const chain::OldestFirst<chain::Blund> &blunds) {
  Watchdog watchdog(log(), getWarningTimeout(), "Wallet blistener apply");

  auto flatResult = BlockFlattener::flattenApply(blunds);
  if (!flatResult) {
    log().error << "Cannot apply batch: " << flatResult.error().message;
    int32_t code = flatResult.error().code == BlockFlattener::E_EMPTY_BATCH
                       ? E_EMPTY_BATCH
                       : E_STRUCTURE;
    return Error(code, flatResult.error().message);
  }
  const auto &txs = flatResult.value();

  chain::HeaderHash currentTip = chainState_.getTip();
  wallet::HeaderInfoGetter getHeaderInfo = makeHeaderInfoGetter();
  size_t blockCount = blunds.size();

  syncWallets("apply", [&](const wallet::WalletId &walletId) {
    return applyToWallet(currentTip, txs, getHeaderInfo, blockCount, walletId);
  });

  return chain::BatchOps{};
}

WalletBListener::Roe<chain::BatchOps> WalletBListener::onRollbackBlocks(
    const chain::NewestFirst<chain::Blund> &blunds) {
  Watchdog watchdog(log(), getWarningTimeout(), "Wallet blistener rollback");

  auto flatResult = BlockFlattener::flattenRollback(blunds);
  if (!flatResult) {
    log().error << "Cannot roll back batch: " << flatResult.error().message;
    int32_t code = flatResult.error().code == BlockFlattener::E_EMPTY_BATCH
                       ? E_EMPTY_BATCH
                       : E_STRUCTURE;
    return Error(code, flatResult.error().message);
  }
  const auto &txs = flatResult.value();

  consensus::SlotId currentSlot = slots_.getCurrentSlotInaccurate();
  chain::HeaderHash currentTip = chainState_.getTip();
  wallet::HeaderInfoGetter getHeaderInfo = makeHeaderInfoGetter();
  size_t blockCount = blunds.size();

  syncWallets("rollback", [&](const wallet::WalletId &walletId) {
    return rollbackFromWallet(currentSlot, currentTip, txs, getHeaderInfo,
                              blockCount, walletId);
  });

  return chain::BatchOps{};
}

void WalletBListener::syncWallets(const std::string &desc,
                                  const WalletSync &syncWallet) {
  for (const auto &walletId : walletStore_.getWalletIds()) {
    catchInSync(desc, walletId, syncWallet);
  }
}

void WalletBListener::catchInSync(const std::string &desc,
                                  const wallet::WalletId &walletId,
                                  const WalletSync &syncWallet) {
  std::string prefix =
      "Failed to sync wallet " + walletId + " in BListener (" + desc + "): ";
  try {
    auto result = syncWallet(walletId);
    if (!result) {
      reporter_.reportOrLogW(prefix, result.error().message);
    }
  } catch (const std::exception &e) {
    reporter_.reportOrLogW(prefix, e.what());
  } catch (...) {
    reporter_.reportOrLogW(prefix, "unknown exception");
  }
}

WalletBListener::Roe<void>
WalletBListener::loadWallet(const wallet::WalletId &walletId,
                            wallet::WalletKey &key,
                            std::vector<wallet::AddressMeta> &metas) const {
  auto metasResult = walletStore_.getWalletAddrMetas(walletId);
  if (!metasResult) {
    return Error(E_WALLET_STORE, metasResult.error().message);
  }
  auto keyResult = walletStore_.getWalletKey(walletId);
  if (!keyResult) {
    return Error(E_WALLET_STORE, keyResult.error().message);
  }
  metas = metasResult.value();
  key = keyResult.value();
  return {};
}

WalletBListener::Roe<void> WalletBListener::applyToWallet(
    const chain::HeaderHash &currentTip,
    const std::vector<chain::TxWithUndo> &txs,
    const wallet::HeaderInfoGetter &getHeaderInfo, size_t blockCount,
    const wallet::WalletId &walletId) {
  Roe<void> outcome;
  tipGuard_.guard(currentTip, walletId, [&]() {
    wallet::WalletKey key;
    std::vector<wallet::AddressMeta> metas;
    auto loaded = loadWallet(walletId, key, metas);
    if (!loaded) {
      outcome = loaded;
      return;
    }
    auto tracked = tracker_.trackApply(key, metas, getHeaderInfo, txs);
    if (!tracked) {
      outcome = Error(E_TRACKER, tracked.error().message);
      return;
    }
    storageModifierVar_.applyWalModifier(walletId, tracked.value());
    logMsg("Applied", blockCount, walletId, tracked.value());
  });
  return outcome;
}

WalletBListener::Roe<void> WalletBListener::rollbackFromWallet(
    const consensus::SlotId &currentSlot, const chain::HeaderHash &currentTip,
    const std::vector<chain::TxWithUndo> &txs,
    const wallet::HeaderInfoGetter &getHeaderInfo, size_t blockCount,
    const wallet::WalletId &walletId) {
  Roe<void> outcome;
  tipGuard_.guard(currentTip, walletId, [&]() {
    wallet::WalletKey key;
    std::vector<wallet::AddressMeta> metas;
    auto loaded = loadWallet(walletId, key, metas);
    if (!loaded) {
      outcome = loaded;
      return;
    }
    auto tracked =
        tracker_.trackRollback(key, metas, currentSlot, getHeaderInfo, txs);
    if (!tracked) {
      outcome = Error(E_TRACKER, tracked.error().message);
      return;
    }
    storageModifierVar_.applyWalModifier(walletId, tracked.value());
    logMsg("Rolled back", blockCount, walletId, tracked.value());
  });
  return outcome;
}

wallet::HeaderInfoGetter WalletBListener::makeHeaderInfoGetter() const {
  int64_t systemStart = chainState_.getSystemStart();
  consensus::SlottingData slottingData = chainState_.getSlottingData();
  return [systemStart, slottingData](const chain::BlockHeader &header) {
    wallet::HeaderInfo info;
    info.difficulty = header.difficulty;
    if (!header.isGenesis()) {
      info.timestamp =
          consensus::getSlotStart(systemStart, header.slot, slottingData);
      info.ptxDifficulty = header.difficulty;
    }
    return info;
  };
}

void WalletBListener::logMsg(const std::string &action, size_t blockCount,
                             const wallet::WalletId &walletId,
                             const wallet::WalletModifier &modifier) {
  log().info << action << " " << blockCount << " block(s) to wallet "
             << walletId << ", " << modifier.getSummary();
}

} // namespace blistener
} // namespace ws
