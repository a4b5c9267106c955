#include "Tracking.h"

namespace ws {
namespace wallet {

TxTracker::TxTracker() : Module("wallet.tracking") {}

TxTracker::Roe<std::map<chain::Address, AddressMeta>>
TxTracker::getOwnAddresses(const WalletKey &key,
                           const std::vector<AddressMeta> &metas) const {
  std::map<chain::Address, AddressMeta> own;
  for (const auto &meta : metas) {
    chain::Address derived =
        deriveAddress(key.publicKey, meta.accountIndex, meta.addressIndex);
    if (derived != meta.address) {
      return Error(E_KEY_DERIVATION,
                   "Address " + meta.address + " (" +
                       std::to_string(meta.accountIndex) + "/" +
                       std::to_string(meta.addressIndex) +
                       ") does not derive from the wallet key");
    }
    own[meta.address] = meta;
  }
  return own;
}

TxTracker::Roe<TxTracker::TxView>
TxTracker::makeTxView(const chain::TxWithUndo &txWithUndo,
                      const std::map<chain::Address, AddressMeta> &own) const {
  const chain::Tx &tx = txWithUndo.tx;
  TxView view;
  view.txId = tx.getId();

  if (tx.inputs.size() != txWithUndo.undo.size()) {
    return Error(E_UNDO, "Transaction " + view.txId + " has " +
                             std::to_string(tx.inputs.size()) +
                             " inputs but " +
                             std::to_string(txWithUndo.undo.size()) +
                             " undo entries");
  }

  for (size_t i = 0; i < tx.inputs.size(); ++i) {
    if (own.count(txWithUndo.undo[i].address) > 0) {
      view.ownInputs.emplace_back(tx.inputs[i], txWithUndo.undo[i]);
    }
  }
  for (size_t i = 0; i < tx.outputs.size(); ++i) {
    const chain::TxOut &txOut = tx.outputs[i];
    if (own.count(txOut.address) > 0) {
      chain::TxIn txIn;
      txIn.txId = view.txId;
      txIn.index = static_cast<uint32_t>(i);
      view.ownOutputs.emplace_back(txIn, txOut);
    } else {
      view.hasForeignOutput = true;
    }
  }
  return view;
}

TxTracker::Roe<WalletModifier>
TxTracker::trackApply(const WalletKey &key,
                      const std::vector<AddressMeta> &metas,
                      const HeaderInfoGetter &getHeaderInfo,
                      const std::vector<chain::TxWithUndo> &txs) {
  auto ownResult = getOwnAddresses(key, metas);
  if (!ownResult) {
    return ownResult.error();
  }
  const auto &own = ownResult.value();

  WalletModifier modifier;
  for (const auto &txWithUndo : txs) {
    auto viewResult = makeTxView(txWithUndo, own);
    if (!viewResult) {
      return viewResult.error();
    }
    const TxView &view = viewResult.value();
    if (!view.isTouching()) {
      continue;
    }

    HeaderInfo info = getHeaderInfo(txWithUndo.header);
    chain::HeaderHash headerHash = txWithUndo.header.getHash();
    bool isChange = !view.ownInputs.empty() && view.hasForeignOutput;

    for (const auto &[txIn, txOut] : view.ownInputs) {
      modifier.utxo.remove(txIn, txOut);
    }
    for (const auto &[txIn, txOut] : view.ownOutputs) {
      modifier.utxo.insert(txIn, txOut);
      modifier.addresses.insert(txOut.address, own.at(txOut.address));
      modifier.used.insert(txOut.address, headerHash);
      if (isChange) {
        modifier.change.insert(txOut.address, headerHash);
      }
    }

    TxHistoryEntry entry;
    entry.txId = view.txId;
    entry.inputs = txWithUndo.tx.inputs;
    entry.outputs = txWithUndo.tx.outputs;
    entry.difficulty = info.difficulty;
    entry.timestamp = info.timestamp;
    modifier.history.insert(view.txId, entry);

    if (!view.ownInputs.empty()) {
      PtxBlockInfo ptxInfo;
      ptxInfo.difficulty = info.ptxDifficulty;
      modifier.ptxCandidates.insert(view.txId, ptxInfo);
    }
  }

  log().debug << "Tracked " << txs.size() << " tx(s) forward: "
              << modifier.getSummary();
  return modifier;
}

TxTracker::Roe<WalletModifier>
TxTracker::trackRollback(const WalletKey &key,
                         const std::vector<AddressMeta> &metas,
                         const consensus::SlotId &currentSlot,
                         const HeaderInfoGetter &getHeaderInfo,
                         const std::vector<chain::TxWithUndo> &txs) {
  auto ownResult = getOwnAddresses(key, metas);
  if (!ownResult) {
    return ownResult.error();
  }
  const auto &own = ownResult.value();

  // Start of the current slot, for headers without a timestamp
  chain::BlockHeader currentSlotHeader;
  currentSlotHeader.type = chain::BlockHeader::T_MAIN;
  currentSlotHeader.slot = currentSlot;
  std::optional<int64_t> fallbackTimestamp =
      getHeaderInfo(currentSlotHeader).timestamp;

  WalletModifier modifier;
  for (const auto &txWithUndo : txs) {
    auto viewResult = makeTxView(txWithUndo, own);
    if (!viewResult) {
      return viewResult.error();
    }
    const TxView &view = viewResult.value();
    if (!view.isTouching()) {
      continue;
    }

    HeaderInfo info = getHeaderInfo(txWithUndo.header);
    chain::HeaderHash headerHash = txWithUndo.header.getHash();
    bool isChange = !view.ownInputs.empty() && view.hasForeignOutput;

    for (const auto &[txIn, txOut] : view.ownOutputs) {
      modifier.utxo.remove(txIn, txOut);
      modifier.addresses.remove(txOut.address, own.at(txOut.address));
      modifier.used.remove(txOut.address, headerHash);
      if (isChange) {
        modifier.change.remove(txOut.address, headerHash);
      }
    }
    for (const auto &[txIn, txOut] : view.ownInputs) {
      modifier.utxo.insert(txIn, txOut);
    }

    TxHistoryEntry entry;
    entry.txId = view.txId;
    entry.inputs = txWithUndo.tx.inputs;
    entry.outputs = txWithUndo.tx.outputs;
    entry.difficulty = info.difficulty;
    entry.timestamp = info.timestamp ? info.timestamp : fallbackTimestamp;
    modifier.history.remove(view.txId, entry);

    if (!view.ownInputs.empty()) {
      modifier.ptxCandidates.remove(view.txId, PtxBlockInfo{});
    }
  }

  log().debug << "Tracked " << txs.size() << " tx(s) backward at slot "
              << currentSlot.toString() << ": " << modifier.getSummary();
  return modifier;
}

} // namespace wallet
} // namespace ws
