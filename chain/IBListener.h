#ifndef WS_SYNC_IBLISTENER_H
#define WS_SYNC_IBLISTENER_H

#include "../lib/ResultOrError.hpp"
#include "Block.h"
#include "Chrono.h"

#include <string>
#include <vector>

namespace ws {
namespace chain {

// Key-value write to be committed together with the chain state
struct BatchOp {
  std::string key;
  std::string value;
};

using BatchOps = std::vector<BatchOp>;

/**
 * Listener notified by the block pipeline while it holds the block lock.
 * onApplyBlocks sees the tip before the batch, onRollbackBlocks the tip
 * after it.
 */
class IBListener {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  virtual ~IBListener() = default;

  virtual Roe<BatchOps> onApplyBlocks(const OldestFirst<Blund> &blunds) = 0;
  virtual Roe<BatchOps> onRollbackBlocks(const NewestFirst<Blund> &blunds) = 0;
};

} // namespace chain
} // namespace ws

#endif // WS_SYNC_IBLISTENER_H
