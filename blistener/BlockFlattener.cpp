#include "BlockFlattener.h"

#include <string>

namespace ws {
namespace blistener {

BlockFlattener::Roe<std::vector<chain::TxWithUndo>>
BlockFlattener::flatten(const chain::Blund &blund) {
  std::vector<chain::TxWithUndo> result;
  const chain::Block &block = blund.block;
  if (block.header.isGenesis()) {
    return result;
  }

  const auto &txUndos = blund.undo.txUndos;
  if (block.txs.size() != txUndos.size()) {
    return Error(E_STRUCTURE, "Block " + block.header.getHash() + " has " +
                                  std::to_string(block.txs.size()) +
                                  " txs but " +
                                  std::to_string(txUndos.size()) + " undos");
  }

  result.reserve(block.txs.size());
  for (size_t i = 0; i < block.txs.size(); ++i) {
    const chain::Tx &tx = block.txs[i];
    if (tx.inputs.size() != txUndos[i].size()) {
      return Error(E_STRUCTURE, "Transaction " + tx.getId() + " in block " +
                                    block.header.getHash() + " has " +
                                    std::to_string(tx.inputs.size()) +
                                    " inputs but " +
                                    std::to_string(txUndos[i].size()) +
                                    " undo entries");
    }
    result.push_back({ block.txs[i], txUndos[i], block.header });
  }
  return result;
}

BlockFlattener::Roe<std::vector<chain::TxWithUndo>>
BlockFlattener::flattenApply(const chain::OldestFirst<chain::Blund> &blunds) {
  if (blunds.empty()) {
    return Error(E_EMPTY_BATCH, "Empty apply batch");
  }
  std::vector<chain::TxWithUndo> result;
  for (const auto &blund : blunds) {
    auto flat = flatten(blund);
    if (!flat) {
      return flat.error();
    }
    result.insert(result.end(), flat.value().begin(), flat.value().end());
  }
  return result;
}

BlockFlattener::Roe<std::vector<chain::TxWithUndo>>
BlockFlattener::flattenRollback(
    const chain::NewestFirst<chain::Blund> &blunds) {
  if (blunds.empty()) {
    return Error(E_EMPTY_BATCH, "Empty rollback batch");
  }
  std::vector<chain::TxWithUndo> result;
  for (const auto &blund : blunds) {
    auto flat = flatten(blund);
    if (!flat) {
      return flat.error();
    }
    result.insert(result.end(), flat.value().rbegin(), flat.value().rend());
  }
  return result;
}

} // namespace blistener
} // namespace ws
