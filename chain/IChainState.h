#ifndef WS_SYNC_ICHAIN_STATE_H
#define WS_SYNC_ICHAIN_STATE_H

#include "../consensus/Slotting.h"
#include "Block.h"

#include <cstdint>

namespace ws {
namespace chain {

/**
 * Read access to the node's chain state
 */
class IChainState {
public:
  virtual ~IChainState() = default;

  /** Hash of the header the chain state is currently consistent with */
  virtual HeaderHash getTip() const = 0;
  virtual consensus::SlottingData getSlottingData() const = 0;
  /** System start, ms since the Unix epoch */
  virtual int64_t getSystemStart() const = 0;
};

} // namespace chain
} // namespace ws

#endif // WS_SYNC_ICHAIN_STATE_H
