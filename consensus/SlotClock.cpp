#include "SlotClock.h"

namespace ws {
namespace consensus {

SlotClock::SlotClock(const Config &config)
    : Module("consensus.slot_clock"), config_(config) {}

void SlotClock::setSlottingData(const SlottingData &slottingData) {
  std::lock_guard<std::mutex> lock(mutex_);
  slottingData_ = slottingData;
}

int64_t SlotClock::getTimestamp() const {
  auto now = std::chrono::system_clock::now();
  int64_t localTime = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch())
                          .count();
  return localTime + config_.timeOffset;
}

SlotId SlotClock::getCurrentSlotInaccurate() const {
  return getSlotAt(getTimestamp());
}

std::chrono::milliseconds SlotClock::getCurrentEpochSlotDuration() const {
  return getSlotDurationAt(getTimestamp());
}

uint64_t SlotClock::getDurationOf(uint64_t epoch) const {
  const EpochSlottingData *data = slottingData_.getEpochData(epoch);
  if (data) {
    return data->slotDurationMs;
  }
  if (!slottingData_.isEmpty()) {
    // Later epochs keep the last known duration
    return slottingData_.getEpochs().rbegin()->second.slotDurationMs;
  }
  return config_.defaultSlotDurationMs;
}

SlotId SlotClock::getSlotAt(int64_t timestampMs) const {
  if (config_.slotsPerEpoch == 0) {
    log().error << "Slots per epoch is 0";
    return {};
  }

  std::lock_guard<std::mutex> lock(mutex_);
  int64_t elapsed = timestampMs - config_.systemStart;
  if (elapsed < 0) {
    return {};
  }

  // Reference point: start of the last known epoch at or before the timestamp
  uint64_t baseEpoch = 0;
  int64_t baseStart = 0;
  for (const auto &[epoch, data] : slottingData_.getEpochs()) {
    if (data.epochStartDiffMs > elapsed) {
      break;
    }
    baseEpoch = epoch;
    baseStart = data.epochStartDiffMs;
  }

  uint64_t duration = getDurationOf(baseEpoch);
  if (duration == 0) {
    log().error << "Slot duration is 0 for epoch " << baseEpoch;
    return { baseEpoch, 0 };
  }

  uint64_t slotsSinceBase = static_cast<uint64_t>(elapsed - baseStart) / duration;
  SlotId slot;
  slot.epoch = baseEpoch + slotsSinceBase / config_.slotsPerEpoch;
  slot.slot = static_cast<uint32_t>(slotsSinceBase % config_.slotsPerEpoch);
  return slot;
}

std::chrono::milliseconds SlotClock::getSlotDurationAt(int64_t timestampMs) const {
  SlotId slot = getSlotAt(timestampMs);
  std::lock_guard<std::mutex> lock(mutex_);
  return std::chrono::milliseconds(getDurationOf(slot.epoch));
}

} // namespace consensus
} // namespace ws
