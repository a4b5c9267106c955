#include "Slotting.h"

namespace ws {
namespace consensus {

std::string SlotId::toString() const {
  return std::to_string(epoch) + "." + std::to_string(slot);
}

const EpochSlottingData *SlottingData::getEpochData(uint64_t epoch) const {
  auto it = mEpochs_.find(epoch);
  if (it == mEpochs_.end()) {
    return nullptr;
  }
  return &it->second;
}

uint64_t SlottingData::getLastKnownEpoch() const {
  if (mEpochs_.empty()) {
    return 0;
  }
  return mEpochs_.rbegin()->first;
}

void SlottingData::insert(uint64_t epoch, const EpochSlottingData &data) {
  mEpochs_[epoch] = data;
}

SlottingData SlottingData::makeUniform(uint64_t slotDurationMs,
                                       uint64_t slotsPerEpoch,
                                       uint64_t epochCount) {
  SlottingData sd;
  int64_t epochLength = static_cast<int64_t>(slotDurationMs * slotsPerEpoch);
  for (uint64_t epoch = 0; epoch < epochCount; ++epoch) {
    sd.insert(epoch, {slotDurationMs, static_cast<int64_t>(epoch) * epochLength});
  }
  return sd;
}

std::optional<int64_t> getSlotStart(int64_t systemStartMs, const SlotId &slot,
                                    const SlottingData &slottingData) {
  const EpochSlottingData *data = slottingData.getEpochData(slot.epoch);
  if (!data) {
    return std::nullopt;
  }
  return systemStartMs + data->epochStartDiffMs +
         static_cast<int64_t>(slot.slot * data->slotDurationMs);
}

} // namespace consensus
} // namespace ws
