#include "WalletStore.h"

namespace ws {
namespace wallet {

uint64_t WalletStore::WalletState::getBalance() const {
  uint64_t balance = 0;
  for (const auto &entry : mUtxo) {
    balance += entry.second.amount;
  }
  return balance;
}

nlohmann::json WalletStore::WalletState::toJson() const {
  nlohmann::json j;
  j["syncTip"] = syncTip ? wallet::toJson(*syncTip) : nlohmann::json(nullptr);
  j["balance"] = getBalance();
  j["addresses"] = nlohmann::json::array();
  for (const auto &entry : mAddresses) {
    j["addresses"].push_back(wallet::toJson(entry.second));
  }
  j["history"] = nlohmann::json::array();
  for (const auto &entry : mHistory) {
    j["history"].push_back(wallet::toJson(entry.second));
  }
  j["used"] = mUsed;
  j["change"] = mChange;
  j["utxo"] = nlohmann::json::array();
  for (const auto &[txIn, txOut] : mUtxo) {
    nlohmann::json u = chain::toJson(txIn);
    u["output"] = chain::toJson(txOut);
    j["utxo"].push_back(u);
  }
  j["ptxCandidates"] = nlohmann::json::object();
  for (const auto &[txId, info] : mPtxCandidates) {
    j["ptxCandidates"][txId] = wallet::toJson(info);
  }
  return j;
}

WalletStore::WalletStore() : Module("wallet.store") {}

std::vector<WalletId> WalletStore::getWalletIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<WalletId> ids;
  ids.reserve(mWallets_.size());
  for (const auto &entry : mWallets_) {
    ids.push_back(entry.first);
  }
  return ids;
}

std::optional<SyncTip>
WalletStore::getWalletSyncTip(const WalletId &walletId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mWallets_.find(walletId);
  if (it == mWallets_.end()) {
    return std::nullopt;
  }
  return it->second.syncTip;
}

WalletStore::Roe<std::vector<AddressMeta>>
WalletStore::getWalletAddrMetas(const WalletId &walletId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mWallets_.find(walletId);
  if (it == mWallets_.end()) {
    return Error(E_WALLET_NOT_FOUND, "Wallet not found: " + walletId);
  }
  std::vector<AddressMeta> metas;
  for (const auto &entry : it->second.mTracked) {
    metas.push_back(entry.second);
  }
  return metas;
}

WalletStore::Roe<WalletKey>
WalletStore::getWalletKey(const WalletId &walletId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mWallets_.find(walletId);
  if (it == mWallets_.end()) {
    return Error(E_WALLET_NOT_FOUND, "Wallet not found: " + walletId);
  }
  return it->second.key;
}

WalletStore::Roe<void>
WalletStore::addWallet(const WalletId &walletId, const WalletKey &key,
                       const std::optional<SyncTip> &syncTip) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (mWallets_.count(walletId) > 0) {
    return Error(E_WALLET_EXISTS, "Wallet already exists: " + walletId);
  }
  WalletState state;
  state.key = key;
  state.syncTip = syncTip;
  mWallets_[walletId] = state;
  log().debug << "Added wallet " << walletId;
  return {};
}

WalletStore::Roe<AddressMeta> WalletStore::addAddress(const WalletId &walletId,
                                                      uint32_t account,
                                                      uint32_t index) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mWallets_.find(walletId);
  if (it == mWallets_.end()) {
    return Error(E_WALLET_NOT_FOUND, "Wallet not found: " + walletId);
  }
  AddressMeta meta;
  meta.walletId = walletId;
  meta.accountIndex = account;
  meta.addressIndex = index;
  meta.address = deriveAddress(it->second.key.publicKey, account, index);
  it->second.mTracked[meta.address] = meta;
  return meta;
}

WalletStore::Roe<void> WalletStore::addAddressMeta(const AddressMeta &meta) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mWallets_.find(meta.walletId);
  if (it == mWallets_.end()) {
    return Error(E_WALLET_NOT_FOUND, "Wallet not found: " + meta.walletId);
  }
  if (meta.address.empty()) {
    return Error(E_ADDRESS, "Empty address for wallet " + meta.walletId);
  }
  it->second.mTracked[meta.address] = meta;
  return {};
}

WalletStore::Roe<void> WalletStore::setWalletSyncTip(const WalletId &walletId,
                                                     const SyncTip &syncTip) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mWallets_.find(walletId);
  if (it == mWallets_.end()) {
    return Error(E_WALLET_NOT_FOUND, "Wallet not found: " + walletId);
  }
  it->second.syncTip = syncTip;
  return {};
}

WalletStore::Roe<void> WalletStore::removeWallet(const WalletId &walletId) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (mWallets_.erase(walletId) == 0) {
    return Error(E_WALLET_NOT_FOUND, "Wallet not found: " + walletId);
  }
  log().debug << "Removed wallet " << walletId;
  return {};
}

WalletStore::Roe<WalletStore::WalletState>
WalletStore::getWalletState(const WalletId &walletId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mWallets_.find(walletId);
  if (it == mWallets_.end()) {
    return Error(E_WALLET_NOT_FOUND, "Wallet not found: " + walletId);
  }
  return it->second;
}

void WalletStore::flush(const StorageModifier &storageModifier,
                        const chain::HeaderHash &newTip) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[walletId, modifier] : storageModifier.getModifiers()) {
    auto it = mWallets_.find(walletId);
    if (it == mWallets_.end()) {
      log().warning << "Skip flushing removed wallet " << walletId;
      continue;
    }
    WalletState &state = it->second;
    modifier.addresses.applyTo(state.mAddresses);
    modifier.history.applyTo(state.mHistory);
    modifier.used.applyTo(state.mUsed);
    modifier.change.applyTo(state.mChange);
    modifier.utxo.applyTo(state.mUtxo);
    modifier.ptxCandidates.applyTo(state.mPtxCandidates);
    state.syncTip = SyncTip::syncedWith(newTip);
  }
  log().info << "Flushed " << storageModifier.getSize()
             << " wallet modifier(s), tip " << newTip;
}

nlohmann::json WalletStore::toJson() const {
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json j = nlohmann::json::object();
  for (const auto &[walletId, state] : mWallets_) {
    j[walletId] = state.toJson();
  }
  return j;
}

} // namespace wallet
} // namespace ws
