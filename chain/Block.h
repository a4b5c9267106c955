#ifndef WS_SYNC_BLOCK_H
#define WS_SYNC_BLOCK_H

#include "../consensus/Slotting.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ws {
namespace chain {

using HeaderHash = std::string;
using TxId = std::string;
using Address = std::string;

struct TxIn {
  TxId txId;
  uint32_t index{ 0 };

  template <typename Archive> void serialize(Archive &ar) {
    ar & txId & index;
  }

  bool operator==(const TxIn &other) const {
    return txId == other.txId && index == other.index;
  }
  bool operator<(const TxIn &other) const {
    return txId < other.txId || (txId == other.txId && index < other.index);
  }

  std::string toString() const;
};

struct TxOut {
  Address address;
  uint64_t amount{ 0 };

  template <typename Archive> void serialize(Archive &ar) {
    ar & address & amount;
  }

  bool operator==(const TxOut &other) const {
    return address == other.address && amount == other.amount;
  }
  bool operator!=(const TxOut &other) const { return !(*this == other); }
};

struct Tx {
  std::vector<TxIn> inputs;
  std::vector<TxOut> outputs;

  template <typename Archive> void serialize(Archive &ar) {
    ar & inputs & outputs;
  }

  // SHA-256 of the binary packing
  TxId getId() const;
};

// Outputs consumed by a transaction's inputs, one per input
using TxUndo = std::vector<TxOut>;

struct BlockHeader {
  enum Type : uint8_t {
    T_GENESIS = 0,
    T_MAIN = 1,
  };

  uint8_t type{ T_MAIN };
  HeaderHash previousHash;
  consensus::SlotId slot; // genesis headers only use the epoch
  uint64_t difficulty{ 0 };

  template <typename Archive> void serialize(Archive &ar) {
    ar & type & previousHash & slot & difficulty;
  }

  bool isGenesis() const { return type == T_GENESIS; }
  HeaderHash getHash() const;
};

struct Block {
  BlockHeader header;
  std::vector<Tx> txs;
};

struct Undo {
  std::vector<TxUndo> txUndos;
};

/**
 * Block paired with the undo data needed to reverse it
 */
struct Blund {
  Block block;
  Undo undo;
};

/**
 * One transaction with its undo and the header of the block containing it
 */
struct TxWithUndo {
  Tx tx;
  TxUndo undo;
  BlockHeader header;
};

nlohmann::json toJson(const TxIn &txIn);
nlohmann::json toJson(const TxOut &txOut);
nlohmann::json toJson(const Tx &tx);
nlohmann::json toJson(const BlockHeader &header);

} // namespace chain
} // namespace ws

#endif // WS_SYNC_BLOCK_H
