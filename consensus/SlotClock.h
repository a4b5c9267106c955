#pragma once

#include "../lib/Module.h"
#include "Slotting.h"

#include <chrono>
#include <cstdint>
#include <mutex>

namespace ws {
namespace consensus {

/**
 * Slot timing service used by chain listeners
 */
class ISlots {
public:
  virtual ~ISlots() = default;

  /**
   * Current slot derived from the local clock. Inaccurate: when the clock is
   * past the known slotting data the last known epoch is extrapolated.
   */
  virtual SlotId getCurrentSlotInaccurate() const = 0;

  /** Slot duration of the epoch the clock is currently in */
  virtual std::chrono::milliseconds getCurrentEpochSlotDuration() const = 0;
};

/**
 * Slot Clock
 *
 * ISlots implementation on top of the system clock and the chain's
 * slotting data.
 */
class SlotClock : public Module, public ISlots {
public:
  struct Config {
    int64_t systemStart{ 0 };           // ms since the Unix epoch
    int64_t timeOffset{ 0 };            // network_time = local_time + timeOffset
    uint64_t slotsPerEpoch{ 0 };
    uint64_t defaultSlotDurationMs{ 0 }; // used until slotting data is known
  };

  explicit SlotClock(const Config &config);
  ~SlotClock() override = default;

  void setSlottingData(const SlottingData &slottingData);

  SlotId getCurrentSlotInaccurate() const override;
  std::chrono::milliseconds getCurrentEpochSlotDuration() const override;

  /** Slot containing the given timestamp (ms since the Unix epoch) */
  SlotId getSlotAt(int64_t timestampMs) const;

  /** Slot duration of the epoch containing the given timestamp */
  std::chrono::milliseconds getSlotDurationAt(int64_t timestampMs) const;

  const Config &getConfig() const { return config_; }
  int64_t getTimestamp() const;

private:
  uint64_t getDurationOf(uint64_t epoch) const;

  Config config_;
  SlottingData slottingData_;
  mutable std::mutex mutex_;
};

} // namespace consensus
} // namespace ws
