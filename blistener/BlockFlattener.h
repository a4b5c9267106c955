#ifndef WS_SYNC_BLOCK_FLATTENER_H
#define WS_SYNC_BLOCK_FLATTENER_H

#include "../chain/Block.h"
#include "../chain/Chrono.h"
#include "../lib/ResultOrError.hpp"

#include <vector>

namespace ws {
namespace blistener {

/**
 * Turns block batches into the (tx, undo, header) sequence the tracker
 * consumes
 */
class BlockFlattener {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_EMPTY_BATCH = 1;
  // tx/undo counts differ, or tx inputs/undo entries differ
  constexpr static int32_t E_STRUCTURE = 2;

  /** Genesis blocks yield nothing, main blocks one entry per tx */
  static Roe<std::vector<chain::TxWithUndo>> flatten(const chain::Blund &blund);

  /** Blocks and txs in chain order */
  static Roe<std::vector<chain::TxWithUndo>>
  flattenApply(const chain::OldestFirst<chain::Blund> &blunds);

  /** Blocks newest first, txs of each block in reverse */
  static Roe<std::vector<chain::TxWithUndo>>
  flattenRollback(const chain::NewestFirst<chain::Blund> &blunds);
};

} // namespace blistener
} // namespace ws

#endif // WS_SYNC_BLOCK_FLATTENER_H
