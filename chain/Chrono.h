#ifndef WS_SYNC_CHRONO_H
#define WS_SYNC_CHRONO_H

#include <utility>
#include <vector>

namespace ws {
namespace chain {

template <typename T> class NewestFirst;

/**
 * Sequence ordered from the oldest element to the newest.
 * Distinct from NewestFirst so the two orders cannot be mixed up.
 */
template <typename T> class OldestFirst {
public:
  using const_iterator = typename std::vector<T>::const_iterator;

  OldestFirst() = default;
  explicit OldestFirst(std::vector<T> items) : items_(std::move(items)) {}

  const std::vector<T> &get() const { return items_; }
  size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }
  const T &front() const { return items_.front(); }
  const T &back() const { return items_.back(); }
  const_iterator begin() const { return items_.begin(); }
  const_iterator end() const { return items_.end(); }

  NewestFirst<T> toNewestFirst() const {
    std::vector<T> reversed(items_.rbegin(), items_.rend());
    return NewestFirst<T>(std::move(reversed));
  }

private:
  std::vector<T> items_;
};

/**
 * Sequence ordered from the newest element to the oldest
 */
template <typename T> class NewestFirst {
public:
  using const_iterator = typename std::vector<T>::const_iterator;

  NewestFirst() = default;
  explicit NewestFirst(std::vector<T> items) : items_(std::move(items)) {}

  const std::vector<T> &get() const { return items_; }
  size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }
  const T &front() const { return items_.front(); }
  const T &back() const { return items_.back(); }
  const_iterator begin() const { return items_.begin(); }
  const_iterator end() const { return items_.end(); }

  OldestFirst<T> toOldestFirst() const {
    std::vector<T> reversed(items_.rbegin(), items_.rend());
    return OldestFirst<T>(std::move(reversed));
  }

private:
  std::vector<T> items_;
};

} // namespace chain
} // namespace ws

#endif // WS_SYNC_CHRONO_H
