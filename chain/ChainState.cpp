#include "ChainState.h"

namespace ws {
namespace chain {

ChainState::ChainState(const Config &config)
    : Module("chain.state"), config_(config) {
  tips_.push_back(config_.genesisTip);
}

HeaderHash ChainState::getTip() const {
  std::lock_guard<std::mutex> lock(stateMutex_);
  return tips_.back();
}

consensus::SlottingData ChainState::getSlottingData() const {
  std::lock_guard<std::mutex> lock(stateMutex_);
  return config_.slottingData;
}

int64_t ChainState::getSystemStart() const { return config_.systemStart; }

size_t ChainState::getBlockCount() const {
  std::lock_guard<std::mutex> lock(stateMutex_);
  return blunds_.size();
}

void ChainState::setSlottingData(const consensus::SlottingData &slottingData) {
  std::lock_guard<std::mutex> lock(stateMutex_);
  config_.slottingData = slottingData;
}

ChainState::Roe<NewestFirst<Blund>>
ChainState::getLastBlunds(size_t count) const {
  std::lock_guard<std::mutex> lock(stateMutex_);
  if (count == 0) {
    return Error(E_EMPTY_BATCH, "Requested zero blocks");
  }
  if (count > blunds_.size()) {
    return Error(E_ROLLBACK_DEPTH, "Requested " + std::to_string(count) +
                                       " blocks, chain has " +
                                       std::to_string(blunds_.size()));
  }
  std::vector<Blund> result(blunds_.rbegin(), blunds_.rbegin() + count);
  return NewestFirst<Blund>(std::move(result));
}

ChainState::Roe<void> ChainState::applyBlocks(const OldestFirst<Blund> &blunds,
                                              IBListener &listener) {
  if (blunds.empty()) {
    return Error(E_EMPTY_BATCH, "Cannot apply an empty batch");
  }

  std::lock_guard<std::mutex> blockLock(blockMutex_);

  std::vector<HeaderHash> newTips;
  {
    std::lock_guard<std::mutex> lock(stateMutex_);
    HeaderHash expected = tips_.back();
    for (const auto &blund : blunds) {
      const BlockHeader &header = blund.block.header;
      if (header.previousHash != expected) {
        return Error(E_BLOCK_CHAIN, "Block " + header.getHash() +
                                        " does not extend " + expected);
      }
      expected = header.getHash();
      newTips.push_back(expected);
    }
  }

  auto result = listener.onApplyBlocks(blunds);
  if (!result) {
    return Error(E_LISTENER, result.error().message);
  }

  {
    std::lock_guard<std::mutex> lock(stateMutex_);
    blunds_.insert(blunds_.end(), blunds.begin(), blunds.end());
    tips_.insert(tips_.end(), newTips.begin(), newTips.end());
  }
  log().info << "Applied " << blunds.size() << " block(s), tip " << newTips.back();
  return {};
}

ChainState::Roe<void>
ChainState::rollbackBlocks(const NewestFirst<Blund> &blunds,
                           IBListener &listener) {
  if (blunds.empty()) {
    return Error(E_EMPTY_BATCH, "Cannot roll back an empty batch");
  }

  std::lock_guard<std::mutex> blockLock(blockMutex_);

  std::vector<Blund> removedBlunds;
  std::vector<HeaderHash> removedTips;
  {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (blunds.size() > blunds_.size()) {
      return Error(E_ROLLBACK_DEPTH,
                   "Cannot roll back " + std::to_string(blunds.size()) +
                       " blocks, chain has " + std::to_string(blunds_.size()));
    }
    HeaderHash expected = tips_.back();
    for (const auto &blund : blunds) {
      const BlockHeader &header = blund.block.header;
      if (header.getHash() != expected) {
        return Error(E_BLOCK_CHAIN, "Block " + header.getHash() +
                                        " is not the tip " + expected);
      }
      expected = header.previousHash;
    }

    // Retract before notifying so the listener observes the new tip
    size_t keep = blunds_.size() - blunds.size();
    removedBlunds.assign(blunds_.begin() + keep, blunds_.end());
    removedTips.assign(tips_.begin() + keep + 1, tips_.end());
    blunds_.resize(keep);
    tips_.resize(keep + 1);
  }

  auto result = listener.onRollbackBlocks(blunds);
  if (!result) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    blunds_.insert(blunds_.end(), removedBlunds.begin(), removedBlunds.end());
    tips_.insert(tips_.end(), removedTips.begin(), removedTips.end());
    return Error(E_LISTENER, result.error().message);
  }

  log().info << "Rolled back " << blunds.size() << " block(s), tip "
             << getTip();
  return {};
}

} // namespace chain
} // namespace ws
