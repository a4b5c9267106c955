#include "Replay.h"

namespace ws {
namespace app {

Replay::Replay() : Module("app.replay") {}

chain::HeaderHash Replay::getDefaultGenesisTip() {
  chain::BlockHeader genesis;
  genesis.type = chain::BlockHeader::T_GENESIS;
  return genesis.getHash();
}

Replay::Roe<Replay::Config> Replay::parseConfig(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_CONFIG, "Configuration must be a JSON object");
  }

  Config config;
  try {
    config.logLevel = jd.value("logLevel", config.logLevel);
    config.logFile = jd.value("logFile", config.logFile);
    config.systemStart = jd.value("systemStart", config.systemStart);
    config.slotsPerEpoch = jd.value("slotsPerEpoch", config.slotsPerEpoch);
    config.slotDuration = jd.value("slotDuration", config.slotDuration);
    config.genesisTip = jd.value("genesisTip", getDefaultGenesisTip());

    if (config.slotsPerEpoch == 0) {
      return Error(E_CONFIG, "'slotsPerEpoch' must be positive");
    }
    if (config.slotDuration == 0) {
      return Error(E_CONFIG, "'slotDuration' must be positive");
    }

    if (jd.contains("epochs")) {
      int64_t nextStart = 0;
      for (const auto &je : jd["epochs"]) {
        uint64_t epoch = je.value("epoch", uint64_t(0));
        consensus::EpochSlottingData data;
        data.slotDurationMs = je.value("slotDuration", config.slotDuration);
        data.epochStartDiffMs = je.value("epochStart", nextStart);
        if (data.slotDurationMs == 0) {
          return Error(E_CONFIG, "Epoch " + std::to_string(epoch) +
                                     " has zero slot duration");
        }
        config.slottingData.insert(epoch, data);
        nextStart = data.epochStartDiffMs +
                    static_cast<int64_t>(data.slotDurationMs *
                                         config.slotsPerEpoch);
      }
    } else {
      uint64_t epochCount = jd.value("epochCount", uint64_t(1));
      config.slottingData = consensus::SlottingData::makeUniform(
          config.slotDuration, config.slotsPerEpoch, epochCount);
    }

    for (const auto &jw : jd.value("wallets", nlohmann::json::array())) {
      WalletConfig wc;
      if (!jw.contains("id") || !jw["id"].is_string()) {
        return Error(E_CONFIG, "Wallet entry missing 'id' field");
      }
      if (!jw.contains("publicKey") || !jw["publicKey"].is_string()) {
        return Error(E_CONFIG, "Wallet entry missing 'publicKey' field");
      }
      wc.id = jw["id"].get<std::string>();
      wc.publicKey = jw["publicKey"].get<std::string>();
      wc.isSynced = jw.value("synced", true);
      if (jw.contains("syncTip")) {
        wc.syncTip = jw["syncTip"].get<std::string>();
      }
      for (const auto &ja : jw.value("addresses", nlohmann::json::array())) {
        AddressConfig ac;
        ac.account = ja.value("account", uint32_t(0));
        ac.index = ja.value("index", uint32_t(0));
        ac.address = ja.value("address", std::string());
        wc.addresses.push_back(ac);
      }
      config.wallets.push_back(wc);
    }
  } catch (const nlohmann::json::exception &e) {
    return Error(E_CONFIG, std::string("Invalid configuration: ") + e.what());
  }
  return config;
}

Replay::Roe<void> Replay::init(const Config &config) {
  config_ = config;

  logging::Level level;
  if (!logging::parseLevel(config_.logLevel, level)) {
    return Error(E_CONFIG, "Unknown log level: " + config_.logLevel);
  }
  logging::getRootLogger().setLevel(level);
  if (!config_.logFile.empty()) {
    logging::getRootLogger().addFileHandler(config_.logFile, level);
  }

  chain::ChainState::Config chainConfig;
  chainConfig.systemStart = config_.systemStart;
  chainConfig.slottingData = config_.slottingData;
  chainConfig.genesisTip = config_.genesisTip;
  spChainState_ = std::make_unique<chain::ChainState>(chainConfig);

  consensus::SlotClock::Config clockConfig;
  clockConfig.systemStart = config_.systemStart;
  clockConfig.slotsPerEpoch = config_.slotsPerEpoch;
  clockConfig.defaultSlotDurationMs = config_.slotDuration;
  spSlotClock_ = std::make_unique<consensus::SlotClock>(clockConfig);
  spSlotClock_->setSlottingData(config_.slottingData);

  for (const auto &wc : config_.wallets) {
    std::optional<wallet::SyncTip> syncTip;
    if (!wc.isSynced) {
      syncTip = wallet::SyncTip::notSynced();
    } else {
      syncTip = wallet::SyncTip::syncedWith(wc.syncTip ? *wc.syncTip
                                                       : config_.genesisTip);
    }

    wallet::WalletKey key;
    key.publicKey = wc.publicKey;
    auto added = walletStore_.addWallet(wc.id, key, syncTip);
    if (!added) {
      return Error(E_WALLET, added.error().message);
    }
    mPublicKeys_[wc.id] = wc.publicKey;

    for (const auto &ac : wc.addresses) {
      if (ac.address.empty()) {
        auto meta = walletStore_.addAddress(wc.id, ac.account, ac.index);
        if (!meta) {
          return Error(E_WALLET, meta.error().message);
        }
        continue;
      }
      wallet::AddressMeta meta;
      meta.walletId = wc.id;
      meta.accountIndex = ac.account;
      meta.addressIndex = ac.index;
      meta.address = ac.address;
      auto metaResult = walletStore_.addAddressMeta(meta);
      if (!metaResult) {
        return Error(E_WALLET, metaResult.error().message);
      }
    }
  }

  spListener_ = std::make_unique<blistener::WalletBListener>(
      *spChainState_, *spSlotClock_, walletStore_, tracker_, reporter_,
      storageModifierVar_);

  log().info << "Initialized with " << config_.wallets.size()
             << " wallet(s), genesis tip " << config_.genesisTip;
  return {};
}

Replay::Roe<chain::TxId> Replay::resolveTxId(const nlohmann::json &ji) const {
  if (ji.contains("ref")) {
    std::string label = ji["ref"].get<std::string>();
    auto it = mLabels_.find(label);
    if (it == mLabels_.end()) {
      return Error(E_BATCH, "Unknown tx label: " + label);
    }
    return it->second;
  }
  if (ji.contains("txId")) {
    return ji["txId"].get<std::string>();
  }
  return Error(E_BATCH, "Input needs 'ref' or 'txId'");
}

Replay::Roe<chain::Address>
Replay::resolveAddress(const nlohmann::json &jo) const {
  if (jo.contains("address")) {
    return jo["address"].get<std::string>();
  }
  if (!jo.contains("wallet")) {
    return Error(E_BATCH, "Output needs 'address' or 'wallet'");
  }
  std::string walletId = jo["wallet"].get<std::string>();
  auto it = mPublicKeys_.find(walletId);
  if (it == mPublicKeys_.end()) {
    return Error(E_BATCH, "Unknown wallet: " + walletId);
  }
  return wallet::deriveAddress(it->second, jo.value("account", uint32_t(0)),
                               jo.value("index", uint32_t(0)));
}

Replay::Roe<chain::Blund>
Replay::buildBlund(const nlohmann::json &jb,
                   const chain::HeaderHash &previousHash) {
  chain::Blund blund;
  chain::BlockHeader &header = blund.block.header;
  header.previousHash = previousHash;

  if (jb.value("type", std::string("main")) == "genesis") {
    header.type = chain::BlockHeader::T_GENESIS;
    header.slot.epoch = jb.value("epoch", uint64_t(0));
    header.difficulty = tipDifficulty_;
    return blund;
  }

  header.type = chain::BlockHeader::T_MAIN;
  if (jb.contains("slot")) {
    header.slot.epoch = jb["slot"].value("epoch", uint64_t(0));
    header.slot.slot = jb["slot"].value("slot", uint32_t(0));
  }
  header.difficulty = tipDifficulty_ + 1;

  for (const auto &jt : jb.value("txs", nlohmann::json::array())) {
    chain::Tx tx;
    for (const auto &ji : jt.value("inputs", nlohmann::json::array())) {
      auto txId = resolveTxId(ji);
      if (!txId) {
        return txId.error();
      }
      chain::TxIn txIn;
      txIn.txId = txId.value();
      txIn.index = ji.value("index", uint32_t(0));
      tx.inputs.push_back(txIn);
    }
    for (const auto &jo : jt.value("outputs", nlohmann::json::array())) {
      auto address = resolveAddress(jo);
      if (!address) {
        return address.error();
      }
      chain::TxOut txOut;
      txOut.address = address.value();
      txOut.amount = jo.value("amount", uint64_t(0));
      tx.outputs.push_back(txOut);
    }

    chain::TxUndo undo;
    if (jt.contains("undo")) {
      for (const auto &ju : jt["undo"]) {
        auto address = resolveAddress(ju);
        if (!address) {
          return address.error();
        }
        chain::TxOut txOut;
        txOut.address = address.value();
        txOut.amount = ju.value("amount", uint64_t(0));
        undo.push_back(txOut);
      }
    } else {
      for (const auto &txIn : tx.inputs) {
        auto it = mOutputs_.find(txIn);
        if (it == mOutputs_.end()) {
          return Error(E_BATCH, "No undo for input " + txIn.toString());
        }
        undo.push_back(it->second);
      }
    }

    chain::TxId txId = tx.getId();
    if (jt.contains("label")) {
      mLabels_[jt["label"].get<std::string>()] = txId;
    }
    for (size_t i = 0; i < tx.outputs.size(); ++i) {
      chain::TxIn created;
      created.txId = txId;
      created.index = static_cast<uint32_t>(i);
      mOutputs_[created] = tx.outputs[i];
    }

    blund.block.txs.push_back(tx);
    blund.undo.txUndos.push_back(undo);
  }
  return blund;
}

Replay::Roe<chain::OldestFirst<chain::Blund>>
Replay::buildBlunds(const nlohmann::json &blocks) {
  if (!blocks.is_array() || blocks.empty()) {
    return Error(E_BATCH, "'blocks' must be a non-empty array");
  }
  std::vector<chain::Blund> blunds;
  chain::HeaderHash previousHash = spChainState_->getTip();
  uint64_t difficulty = tipDifficulty_;
  for (const auto &jb : blocks) {
    auto blund = buildBlund(jb, previousHash);
    if (!blund) {
      tipDifficulty_ = difficulty;
      return blund.error();
    }
    previousHash = blund.value().block.header.getHash();
    tipDifficulty_ = blund.value().block.header.difficulty;
    blunds.push_back(blund.value());
  }
  tipDifficulty_ = difficulty;
  return chain::OldestFirst<chain::Blund>(std::move(blunds));
}

Replay::Roe<void> Replay::applyBatch(const nlohmann::json &batch) {
  auto blunds = buildBlunds(batch.value("blocks", nlohmann::json::array()));
  if (!blunds) {
    return blunds.error();
  }
  auto applied = spChainState_->applyBlocks(blunds.value(), *spListener_);
  if (!applied) {
    return Error(E_CHAIN, applied.error().message);
  }
  tipDifficulty_ = blunds.value().back().block.header.difficulty;
  return {};
}

Replay::Roe<void> Replay::rollbackBatch(const nlohmann::json &batch) {
  auto blunds = spChainState_->getLastBlunds(batch.value("count", size_t(1)));
  if (!blunds) {
    return Error(E_CHAIN, blunds.error().message);
  }
  auto rolledBack =
      spChainState_->rollbackBlocks(blunds.value(), *spListener_);
  if (!rolledBack) {
    return Error(E_CHAIN, rolledBack.error().message);
  }
  const chain::BlockHeader &oldest = blunds.value().back().block.header;
  tipDifficulty_ = oldest.isGenesis() ? oldest.difficulty : oldest.difficulty - 1;
  return {};
}

Replay::Roe<void> Replay::runBatch(const nlohmann::json &batch,
                                   bool isFlushEnabled) {
  if (!spChainState_ || !spListener_) {
    return Error(E_CONFIG, "Replay is not initialized");
  }

  Roe<void> result;
  try {
    std::string action = batch.value("action", std::string());
    if (action == "apply") {
      result = applyBatch(batch);
    } else if (action == "rollback") {
      result = rollbackBatch(batch);
    } else {
      return Error(E_BATCH, "Unknown batch action: '" + action + "'");
    }
  } catch (const nlohmann::json::exception &e) {
    return Error(E_BATCH, std::string("Invalid batch: ") + e.what());
  }
  if (!result) {
    return result;
  }

  if (isFlushEnabled) {
    walletStore_.flush(storageModifierVar_.take(), spChainState_->getTip());
  }
  return {};
}

Replay::Roe<void> Replay::runBatches(const nlohmann::json &batches,
                                     bool isFlushEnabled) {
  if (!batches.is_array()) {
    return Error(E_BATCH, "Batch file must contain a JSON array");
  }
  for (size_t i = 0; i < batches.size(); ++i) {
    auto result = runBatch(batches[i], isFlushEnabled);
    if (!result) {
      return Error(result.error().code, "Batch " + std::to_string(i) + ": " +
                                            result.error().message);
    }
  }
  log().info << "Replayed " << batches.size() << " batch(es), tip "
             << spChainState_->getTip();
  return {};
}

nlohmann::json Replay::toJson() const {
  nlohmann::json j;
  j["tip"] = spChainState_ ? spChainState_->getTip() : std::string();
  j["blocks"] = spChainState_ ? spChainState_->getBlockCount() : 0;
  j["reports"] = reporter_.getReportCount();
  j["buffer"] = storageModifierVar_.snapshot().toJson();
  j["wallets"] = walletStore_.toJson();
  return j;
}

} // namespace app
} // namespace ws
