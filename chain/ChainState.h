#ifndef WS_SYNC_CHAIN_STATE_H
#define WS_SYNC_CHAIN_STATE_H

#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "IBListener.h"
#include "IChainState.h"

#include <cstdint>
#include <mutex>
#include <vector>

namespace ws {
namespace chain {

/**
 * ChainState - In-memory chain of blunds with a block lock
 *
 * Drives block listeners the way the block pipeline does: batches are
 * validated against the current tip, then the listener runs while the block
 * lock is held. Apply notifies before the tip advances; rollback retracts
 * the tip first.
 */
class ChainState : public Module, public IChainState {
public:
  struct Config {
    int64_t systemStart{ 0 }; // ms since the Unix epoch
    consensus::SlottingData slottingData;
    HeaderHash genesisTip;    // tip before the first block
  };

  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_EMPTY_BATCH = 1;
  constexpr static int32_t E_BLOCK_CHAIN = 2;   // batch does not connect to tip
  constexpr static int32_t E_ROLLBACK_DEPTH = 3;
  constexpr static int32_t E_LISTENER = 4;

  explicit ChainState(const Config &config);
  ~ChainState() override = default;

  // IChainState
  HeaderHash getTip() const override;
  consensus::SlottingData getSlottingData() const override;
  int64_t getSystemStart() const override;

  size_t getBlockCount() const;

  /** The most recent blunds, newest first */
  Roe<NewestFirst<Blund>> getLastBlunds(size_t count) const;

  void setSlottingData(const consensus::SlottingData &slottingData);

  Roe<void> applyBlocks(const OldestFirst<Blund> &blunds, IBListener &listener);
  Roe<void> rollbackBlocks(const NewestFirst<Blund> &blunds,
                           IBListener &listener);

private:
  Config config_;
  std::vector<Blund> blunds_;
  std::vector<HeaderHash> tips_; // tips_[i] is the tip after i blocks

  // Block lock serializes batches, state lock guards the fields above
  std::mutex blockMutex_;
  mutable std::mutex stateMutex_;
};

} // namespace chain
} // namespace ws

#endif // WS_SYNC_CHAIN_STATE_H
