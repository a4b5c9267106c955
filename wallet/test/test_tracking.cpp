#include "../Tracking.h"
#include <gtest/gtest.h>

using namespace ws::wallet;
using ws::chain::BlockHeader;
using ws::chain::Tx;
using ws::chain::TxIn;
using ws::chain::TxOut;
using ws::chain::TxWithUndo;

class TxTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        key.publicKey = "pk-alice";
        own0 = deriveAddress(key.publicKey, 0, 0);
        own1 = deriveAddress(key.publicKey, 0, 1);
        metas.push_back({"W1", 0, 0, own0});
        metas.push_back({"W1", 0, 1, own1});

        header.slot.epoch = 0;
        header.slot.slot = 4;
        header.difficulty = 9;
        header.previousHash = "prev";

        getHeaderInfo = [](const BlockHeader &h) {
            HeaderInfo info;
            info.difficulty = h.difficulty;
            if (h.slot.epoch == 0) {
                info.timestamp = static_cast<int64_t>(h.slot.slot) * 1000;
            }
            info.ptxDifficulty = h.difficulty;
            return info;
        };
    }

    TxWithUndo makeFunding(const std::string &address, uint64_t amount) {
        TxWithUndo t;
        t.tx.outputs.push_back({address, amount});
        t.header = header;
        return t;
    }

    TxWithUndo makeSpend(const TxIn &input, const TxOut &spent,
                         std::vector<TxOut> outputs) {
        TxWithUndo t;
        t.tx.inputs.push_back(input);
        t.tx.outputs = std::move(outputs);
        t.undo.push_back(spent);
        t.header = header;
        return t;
    }

    TxTracker tracker;
    WalletKey key;
    std::string own0;
    std::string own1;
    std::vector<AddressMeta> metas;
    BlockHeader header;
    HeaderInfoGetter getHeaderInfo;
};

TEST_F(TxTrackerTest, IncomingTxAddsUtxoHistoryAndUsedAddress) {
    auto funding = makeFunding(own0, 100);
    auto result = tracker.trackApply(key, metas, getHeaderInfo, {funding});
    ASSERT_TRUE(result.isOk()) << result.error().message;
    const WalletModifier &m = result.value();

    TxIn created{funding.tx.getId(), 0};
    ASSERT_TRUE(m.utxo.isInserted(created));
    EXPECT_EQ(m.utxo.getInsertions().at(created).amount, 100u);

    const auto &entry = m.history.getInsertions().at(funding.tx.getId());
    EXPECT_EQ(entry.difficulty, std::optional<uint64_t>(9));
    EXPECT_EQ(entry.timestamp, std::optional<int64_t>(4000));

    EXPECT_EQ(m.used.getInsertions().at(own0), header.getHash());
    EXPECT_TRUE(m.addresses.isInserted(own0));
    EXPECT_TRUE(m.change.isEmpty());
    EXPECT_TRUE(m.ptxCandidates.isEmpty());
}

TEST_F(TxTrackerTest, OutgoingTxSpendsInputAndRecordsChange) {
    TxIn input{"funding-tx", 0};
    TxOut spent{own0, 100};
    auto spend = makeSpend(input, spent, {{"foreign", 60}, {own1, 40}});

    auto result = tracker.trackApply(key, metas, getHeaderInfo, {spend});
    ASSERT_TRUE(result.isOk()) << result.error().message;
    const WalletModifier &m = result.value();

    EXPECT_TRUE(m.utxo.isDeleted(input));
    EXPECT_TRUE(m.utxo.isInserted(TxIn{spend.tx.getId(), 1}));
    EXPECT_FALSE(m.utxo.isInserted(TxIn{spend.tx.getId(), 0}));
    EXPECT_TRUE(m.change.isInserted(own1));
    EXPECT_EQ(m.ptxCandidates.getInsertions().at(spend.tx.getId()).difficulty,
              std::optional<uint64_t>(9));
}

TEST_F(TxTrackerTest, ForeignTxLeavesModifierEmpty) {
    auto foreign = makeFunding("foreign", 5);
    auto result = tracker.trackApply(key, metas, getHeaderInfo, {foreign});
    ASSERT_TRUE(result.isOk());
    EXPECT_TRUE(result.value().isEmpty());
}

TEST_F(TxTrackerTest, MetaNotDerivedFromKeyFails) {
    metas.push_back({"W1", 0, 2, "not-derived"});
    auto result = tracker.trackApply(key, metas, getHeaderInfo, {makeFunding(own0, 1)});
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ITxTracker::E_KEY_DERIVATION);

    auto rollback = tracker.trackRollback(key, metas, {0, 5}, getHeaderInfo, {makeFunding(own0, 1)});
    ASSERT_TRUE(rollback.isError());
    EXPECT_EQ(rollback.error().code, ITxTracker::E_KEY_DERIVATION);
}

TEST_F(TxTrackerTest, UndoLengthMismatchFails) {
    auto spend = makeSpend({"funding-tx", 0}, {own0, 100}, {{"foreign", 100}});
    spend.undo.clear();
    auto result = tracker.trackApply(key, metas, getHeaderInfo, {spend});
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ITxTracker::E_UNDO);
}

TEST_F(TxTrackerTest, RollbackInvertsApply) {
    auto funding = makeFunding(own0, 100);
    auto spend = makeSpend({funding.tx.getId(), 0}, {own0, 100}, {{"foreign", 70}, {own1, 30}});

    auto applied = tracker.trackApply(key, metas, getHeaderInfo, {funding, spend});
    ASSERT_TRUE(applied.isOk());
    auto rolledBack = tracker.trackRollback(key, metas, {0, 8}, getHeaderInfo, {spend, funding});
    ASSERT_TRUE(rolledBack.isOk());

    WalletModifier combined = applied.value();
    combined.merge(rolledBack.value());
    EXPECT_TRUE(combined.isEmpty()) << combined.getSummary();
}

TEST_F(TxTrackerTest, RollbackDatesHistoryFromCurrentSlotWhenHeaderHasNoTimestamp) {
    header.slot.epoch = 5; // no timestamp known for this epoch
    auto funding = makeFunding(own0, 100);

    auto result = tracker.trackRollback(key, metas, {0, 7}, getHeaderInfo, {funding});
    ASSERT_TRUE(result.isOk());
    const auto &entry = result.value().history.getDeletions().at(funding.tx.getId());
    EXPECT_EQ(entry.timestamp, std::optional<int64_t>(7000));
    EXPECT_TRUE(result.value().utxo.isDeleted({funding.tx.getId(), 0}));
}

TEST_F(TxTrackerTest, MergedBatchDeltasEqualCombinedDelta) {
    auto funding = makeFunding(own0, 100);
    auto spend = makeSpend({funding.tx.getId(), 0}, {own0, 100}, {{"foreign", 100}});
    auto incoming = makeFunding(own1, 20);

    auto a = tracker.trackApply(key, metas, getHeaderInfo, {funding});
    auto b = tracker.trackApply(key, metas, getHeaderInfo, {spend, incoming});
    auto ab = tracker.trackApply(key, metas, getHeaderInfo, {funding, spend, incoming});
    ASSERT_TRUE(a.isOk());
    ASSERT_TRUE(b.isOk());
    ASSERT_TRUE(ab.isOk());

    WalletModifier merged = a.value();
    merged.merge(b.value());
    EXPECT_EQ(merged, ab.value());
}
