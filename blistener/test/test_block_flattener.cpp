#include "../BlockFlattener.h"
#include <gtest/gtest.h>

#include <algorithm>

using namespace ws::chain;
using ws::blistener::BlockFlattener;

namespace {

// Main block with one output-only tx per amount
Blund makeMainBlund(const std::string &previousHash, uint32_t slot,
                    const std::vector<uint64_t> &amounts) {
    Blund blund;
    blund.block.header.previousHash = previousHash;
    blund.block.header.slot.slot = slot;
    for (uint64_t amount : amounts) {
        Tx tx;
        tx.outputs.push_back({"addr", amount});
        blund.block.txs.push_back(tx);
        blund.undo.txUndos.push_back({});
    }
    return blund;
}

Blund makeGenesisBlund(uint64_t epoch) {
    Blund blund;
    blund.block.header.type = BlockHeader::T_GENESIS;
    blund.block.header.slot.epoch = epoch;
    return blund;
}

std::vector<uint64_t> amountsOf(const std::vector<TxWithUndo> &flat) {
    std::vector<uint64_t> amounts;
    for (const auto &entry : flat) {
        amounts.push_back(entry.tx.outputs[0].amount);
    }
    return amounts;
}

} // namespace

TEST(BlockFlattenerTest, GenesisBlockYieldsNothing) {
    auto flat = BlockFlattener::flatten(makeGenesisBlund(1));
    ASSERT_TRUE(flat.isOk());
    EXPECT_TRUE(flat.value().empty());
}

TEST(BlockFlattenerTest, ApplyKeepsBlockAndTxOrder) {
    Blund b1 = makeMainBlund("g", 1, {1, 2});
    Blund b2 = makeMainBlund(b1.block.header.getHash(), 2, {3});
    Blund g = makeGenesisBlund(1);

    auto flat = BlockFlattener::flattenApply(OldestFirst<Blund>({b1, g, b2}));
    ASSERT_TRUE(flat.isOk());
    EXPECT_EQ(amountsOf(flat.value()), (std::vector<uint64_t>{1, 2, 3}));
    EXPECT_EQ(flat.value()[0].header.getHash(), b1.block.header.getHash());
    EXPECT_EQ(flat.value()[2].header.getHash(), b2.block.header.getHash());
}

TEST(BlockFlattenerTest, RollbackIsExactReverseOfApply) {
    Blund b1 = makeMainBlund("g", 1, {1, 2, 3});
    Blund b2 = makeMainBlund(b1.block.header.getHash(), 2, {4, 5});
    OldestFirst<Blund> batch({b1, b2});

    auto forward = BlockFlattener::flattenApply(batch);
    auto backward = BlockFlattener::flattenRollback(batch.toNewestFirst());
    ASSERT_TRUE(forward.isOk());
    ASSERT_TRUE(backward.isOk());

    std::vector<uint64_t> reversed = amountsOf(forward.value());
    std::reverse(reversed.begin(), reversed.end());
    EXPECT_EQ(amountsOf(backward.value()), reversed);
    EXPECT_EQ(amountsOf(backward.value()), (std::vector<uint64_t>{5, 4, 3, 2, 1}));
}

TEST(BlockFlattenerTest, TxUndoMismatchIsStructuralError) {
    Blund b1 = makeMainBlund("g", 1, {1, 2});
    b1.undo.txUndos.pop_back();

    auto flat = BlockFlattener::flattenApply(OldestFirst<Blund>({b1}));
    ASSERT_TRUE(flat.isError());
    EXPECT_EQ(flat.error().code, BlockFlattener::E_STRUCTURE);

    auto rollback = BlockFlattener::flattenRollback(NewestFirst<Blund>({b1}));
    ASSERT_TRUE(rollback.isError());
    EXPECT_EQ(rollback.error().code, BlockFlattener::E_STRUCTURE);
}

TEST(BlockFlattenerTest, InputWithoutUndoEntryIsStructuralError) {
    Blund b1 = makeMainBlund("g", 1, {1, 2});
    b1.block.txs[1].inputs.push_back({"spent", 0});

    auto flat = BlockFlattener::flattenApply(OldestFirst<Blund>({b1}));
    ASSERT_TRUE(flat.isError());
    EXPECT_EQ(flat.error().code, BlockFlattener::E_STRUCTURE);
    EXPECT_NE(flat.error().message.find("1 inputs but 0 undo entries"), std::string::npos);

    auto rollback = BlockFlattener::flattenRollback(NewestFirst<Blund>({b1}));
    ASSERT_TRUE(rollback.isError());
    EXPECT_EQ(rollback.error().code, BlockFlattener::E_STRUCTURE);

    b1.undo.txUndos[1].push_back({"addr", 9});
    EXPECT_TRUE(BlockFlattener::flattenApply(OldestFirst<Blund>({b1})).isOk());
}

TEST(BlockFlattenerTest, EmptyBatchIsError) {
    EXPECT_EQ(BlockFlattener::flattenApply(OldestFirst<Blund>()).error().code,
              BlockFlattener::E_EMPTY_BATCH);
    EXPECT_EQ(BlockFlattener::flattenRollback(NewestFirst<Blund>()).error().code,
              BlockFlattener::E_EMPTY_BATCH);
}
