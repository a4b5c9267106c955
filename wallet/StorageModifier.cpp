#include "StorageModifier.h"

#include <utility>

namespace ws {
namespace wallet {

void StorageModifier::applyWalModifier(const WalletId &walletId,
                                       const WalletModifier &modifier) {
  mModifiers_[walletId].merge(modifier);
}

std::optional<WalletModifier>
StorageModifier::getWalModifier(const WalletId &walletId) const {
  auto it = mModifiers_.find(walletId);
  if (it == mModifiers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

nlohmann::json StorageModifier::toJson() const {
  nlohmann::json j = nlohmann::json::object();
  for (const auto &[walletId, modifier] : mModifiers_) {
    j[walletId] = modifier.toJson();
  }
  return j;
}

void StorageModifierVar::modify(
    const WalletId &walletId,
    const std::function<void(WalletModifier &)> &update) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &modifiers = storageModifier_.mModifiers_;
  auto it = modifiers.find(walletId);
  WalletModifier updated =
      it == modifiers.end() ? WalletModifier{} : it->second;
  update(updated);
  modifiers[walletId] = std::move(updated);
}

void StorageModifierVar::applyWalModifier(const WalletId &walletId,
                                          const WalletModifier &modifier) {
  modify(walletId,
         [&modifier](WalletModifier &current) { current.merge(modifier); });
}

StorageModifier StorageModifierVar::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return storageModifier_;
}

StorageModifier StorageModifierVar::take() {
  std::lock_guard<std::mutex> lock(mutex_);
  StorageModifier drained = std::move(storageModifier_);
  storageModifier_ = StorageModifier();
  return drained;
}

} // namespace wallet
} // namespace ws
