#ifndef WS_SYNC_MAP_MODIFIER_HPP
#define WS_SYNC_MAP_MODIFIER_HPP

#include <cstddef>
#include <map>

namespace ws {
namespace wallet {

/**
 * MapModifier - Net insertions and deletions relative to a base map
 *
 * Operations cancel each other where possible, so an insertion followed by
 * the removal of the same key leaves no trace. Deletions carry the removed
 * value to allow a later insertion of the same value to cancel them.
 */
template <typename K, typename V> class MapModifier {
public:
  MapModifier() = default;

  void insert(const K &key, const V &value) {
    auto it = mDeletions_.find(key);
    if (it != mDeletions_.end() && it->second == value) {
      mDeletions_.erase(it);
      return;
    }
    mInsertions_[key] = value;
  }

  void remove(const K &key, const V &value) {
    auto it = mInsertions_.find(key);
    if (it != mInsertions_.end()) {
      mInsertions_.erase(it);
      return;
    }
    mDeletions_[key] = value;
  }

  /** Compose: this modifier followed by the other one */
  void merge(const MapModifier &other) {
    for (const auto &[key, value] : other.mDeletions_) {
      remove(key, value);
    }
    for (const auto &[key, value] : other.mInsertions_) {
      insert(key, value);
    }
  }

  void applyTo(std::map<K, V> &base) const {
    for (const auto &entry : mDeletions_) {
      base.erase(entry.first);
    }
    for (const auto &[key, value] : mInsertions_) {
      base[key] = value;
    }
  }

  bool isEmpty() const { return mInsertions_.empty() && mDeletions_.empty(); }

  bool isInserted(const K &key) const { return mInsertions_.count(key) > 0; }
  bool isDeleted(const K &key) const { return mDeletions_.count(key) > 0; }

  const std::map<K, V> &getInsertions() const { return mInsertions_; }
  const std::map<K, V> &getDeletions() const { return mDeletions_; }

  bool operator==(const MapModifier &other) const {
    return mInsertions_ == other.mInsertions_ &&
           mDeletions_ == other.mDeletions_;
  }
  bool operator!=(const MapModifier &other) const { return !(*this == other); }

private:
  std::map<K, V> mInsertions_;
  std::map<K, V> mDeletions_;
};

} // namespace wallet
} // namespace ws

#endif // WS_SYNC_MAP_MODIFIER_HPP
