#ifndef WS_SYNC_STORAGE_MODIFIER_H
#define WS_SYNC_STORAGE_MODIFIER_H

#include "WalletModifier.h"

#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>

namespace ws {
namespace wallet {

/**
 * Buffered wallet deltas not yet flushed to the wallet store
 */
class StorageModifier {
public:
  StorageModifier() = default;

  /** Merge a delta after whatever is buffered for the wallet */
  void applyWalModifier(const WalletId &walletId,
                        const WalletModifier &modifier);

  std::optional<WalletModifier> getWalModifier(const WalletId &walletId) const;
  const std::map<WalletId, WalletModifier> &getModifiers() const {
    return mModifiers_;
  }

  bool isEmpty() const { return mModifiers_.empty(); }
  size_t getSize() const { return mModifiers_.size(); }

  nlohmann::json toJson() const;

private:
  friend class StorageModifierVar;

  std::map<WalletId, WalletModifier> mModifiers_;
};

/**
 * StorageModifierVar - Shared cell holding the StorageModifier
 *
 * Every entry update is a single read-modify-write under the mutex. The
 * update function works on a copy, so readers never see a partial merge
 * even when the function throws.
 */
class StorageModifierVar {
public:
  StorageModifierVar() = default;

  StorageModifierVar(const StorageModifierVar &) = delete;
  StorageModifierVar &operator=(const StorageModifierVar &) = delete;

  void modify(const WalletId &walletId,
              const std::function<void(WalletModifier &)> &update);

  void applyWalModifier(const WalletId &walletId,
                        const WalletModifier &modifier);

  StorageModifier snapshot() const;

  /** Drain the buffer for flushing, leaving it empty */
  StorageModifier take();

private:
  StorageModifier storageModifier_;
  mutable std::mutex mutex_;
};

} // namespace wallet
} // namespace ws

#endif // WS_SYNC_STORAGE_MODIFIER_H
