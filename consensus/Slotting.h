#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace ws {
namespace consensus {

/**
 * Slot identifier: epoch index and slot index within the epoch
 */
struct SlotId {
  uint64_t epoch{ 0 };
  uint32_t slot{ 0 };

  template <typename Archive> void serialize(Archive &ar) {
    ar & epoch & slot;
  }

  /** Absolute slot number counted from the first slot of epoch 0 */
  uint64_t flatten(uint64_t slotsPerEpoch) const {
    return epoch * slotsPerEpoch + slot;
  }

  bool operator==(const SlotId &other) const {
    return epoch == other.epoch && slot == other.slot;
  }
  bool operator!=(const SlotId &other) const { return !(*this == other); }
  bool operator<(const SlotId &other) const {
    return epoch < other.epoch || (epoch == other.epoch && slot < other.slot);
  }

  std::string toString() const;
};

/**
 * Timing parameters of one epoch
 */
struct EpochSlottingData {
  uint64_t slotDurationMs{ 0 };
  int64_t epochStartDiffMs{ 0 }; // epoch start relative to system start
};

/**
 * Slotting data for all epochs known to the chain state.
 * Slot durations may change between epochs.
 */
class SlottingData {
public:
  SlottingData() = default;

  bool isEmpty() const { return mEpochs_.empty(); }
  size_t getSize() const { return mEpochs_.size(); }

  /** Returns nullptr if the epoch is unknown */
  const EpochSlottingData *getEpochData(uint64_t epoch) const;

  /** Last epoch with known data; 0 if empty */
  uint64_t getLastKnownEpoch() const;

  const std::map<uint64_t, EpochSlottingData> &getEpochs() const {
    return mEpochs_;
  }

  void insert(uint64_t epoch, const EpochSlottingData &data);

  /**
   * Build slotting data for a chain with a constant slot duration,
   * covering epochs [0, epochCount).
   */
  static SlottingData makeUniform(uint64_t slotDurationMs,
                                  uint64_t slotsPerEpoch, uint64_t epochCount);

private:
  std::map<uint64_t, EpochSlottingData> mEpochs_;
};

/**
 * Wall-clock start of a slot in milliseconds since the Unix epoch.
 * Returns std::nullopt when the slot's epoch has no slotting data.
 */
std::optional<int64_t> getSlotStart(int64_t systemStartMs, const SlotId &slot,
                                    const SlottingData &slottingData);

} // namespace consensus
} // namespace ws
