#include "../ChainState.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace ws::chain;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

namespace {

class MockListener : public IBListener {
public:
    MOCK_METHOD(Roe<BatchOps>, onApplyBlocks, (const OldestFirst<Blund> &), (override));
    MOCK_METHOD(Roe<BatchOps>, onRollbackBlocks, (const NewestFirst<Blund> &), (override));
};

Blund makeBlund(const HeaderHash &previousHash, uint32_t slot) {
    Blund blund;
    blund.block.header.previousHash = previousHash;
    blund.block.header.slot.slot = slot;
    blund.block.header.difficulty = slot;
    return blund;
}

} // namespace

class ChainStateTest : public ::testing::Test {
protected:
    ChainStateTest() : chain(makeConfig()) {}

    static ChainState::Config makeConfig() {
        ChainState::Config config;
        config.systemStart = 1000;
        config.slottingData = ws::consensus::SlottingData::makeUniform(1000, 10, 2);
        config.genesisTip = "tip0";
        return config;
    }

    // Apply n chained blocks on top of the current tip
    std::vector<Blund> applyChain(size_t n) {
        std::vector<Blund> blunds;
        HeaderHash previous = chain.getTip();
        for (size_t i = 0; i < n; ++i) {
            blunds.push_back(makeBlund(previous, static_cast<uint32_t>(chain.getBlockCount() + i + 1)));
            previous = blunds.back().block.header.getHash();
        }
        EXPECT_CALL(listener, onApplyBlocks(_)).WillOnce(Return(BatchOps{}));
        EXPECT_TRUE(chain.applyBlocks(OldestFirst<Blund>(blunds), listener).isOk());
        return blunds;
    }

    ChainState chain;
    ::testing::StrictMock<MockListener> listener;
};

TEST_F(ChainStateTest, InitialState) {
    EXPECT_EQ(chain.getTip(), "tip0");
    EXPECT_EQ(chain.getBlockCount(), 0u);
    EXPECT_EQ(chain.getSystemStart(), 1000);
    EXPECT_EQ(chain.getSlottingData().getSize(), 2u);
}

TEST_F(ChainStateTest, ApplyNotifiesListenerBeforeAdvancingTip) {
    Blund blund = makeBlund("tip0", 1);
    HeaderHash seenTip;
    EXPECT_CALL(listener, onApplyBlocks(_)).WillOnce(Invoke([&](const OldestFirst<Blund> &blunds) {
        seenTip = chain.getTip();
        EXPECT_EQ(blunds.size(), 1u);
        return IBListener::Roe<BatchOps>(BatchOps{});
    }));

    ASSERT_TRUE(chain.applyBlocks(OldestFirst<Blund>({blund}), listener).isOk());
    EXPECT_EQ(seenTip, "tip0");
    EXPECT_EQ(chain.getTip(), blund.block.header.getHash());
    EXPECT_EQ(chain.getBlockCount(), 1u);
}

TEST_F(ChainStateTest, ApplyRejectsDisconnectedBatch) {
    Blund blund = makeBlund("other", 1);
    auto result = chain.applyBlocks(OldestFirst<Blund>({blund}), listener);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ChainState::E_BLOCK_CHAIN);
    EXPECT_EQ(chain.getTip(), "tip0");
}

TEST_F(ChainStateTest, ApplyRejectsEmptyBatch) {
    auto result = chain.applyBlocks(OldestFirst<Blund>(), listener);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ChainState::E_EMPTY_BATCH);
}

TEST_F(ChainStateTest, ListenerFailureKeepsTip) {
    Blund blund = makeBlund("tip0", 1);
    EXPECT_CALL(listener, onApplyBlocks(_))
        .WillOnce(Return(IBListener::Error(7, "listener failed")));

    auto result = chain.applyBlocks(OldestFirst<Blund>({blund}), listener);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ChainState::E_LISTENER);
    EXPECT_EQ(chain.getTip(), "tip0");
}

TEST_F(ChainStateTest, RollbackNotifiesListenerAfterRetractingTip) {
    auto blunds = applyChain(2);
    HeaderHash middle = blunds[0].block.header.getHash();

    auto last = chain.getLastBlunds(1);
    ASSERT_TRUE(last.isOk());
    EXPECT_EQ(last.value().front().block.header.getHash(), chain.getTip());

    HeaderHash seenTip;
    EXPECT_CALL(listener, onRollbackBlocks(_)).WillOnce(Invoke([&](const NewestFirst<Blund> &) {
        seenTip = chain.getTip();
        return IBListener::Roe<BatchOps>(BatchOps{});
    }));

    ASSERT_TRUE(chain.rollbackBlocks(last.value(), listener).isOk());
    EXPECT_EQ(seenTip, middle);
    EXPECT_EQ(chain.getTip(), middle);
    EXPECT_EQ(chain.getBlockCount(), 1u);
}

TEST_F(ChainStateTest, RollbackFailureRestoresTip) {
    applyChain(2);
    HeaderHash tip = chain.getTip();
    auto last = chain.getLastBlunds(2);
    ASSERT_TRUE(last.isOk());

    EXPECT_CALL(listener, onRollbackBlocks(_))
        .WillOnce(Return(IBListener::Error(7, "listener failed")));

    auto result = chain.rollbackBlocks(last.value(), listener);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(chain.getTip(), tip);
    EXPECT_EQ(chain.getBlockCount(), 2u);
}

TEST_F(ChainStateTest, RollbackRejectsNonTipBatch) {
    auto blunds = applyChain(2);
    auto result = chain.rollbackBlocks(NewestFirst<Blund>({blunds[0]}), listener);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ChainState::E_BLOCK_CHAIN);
}

TEST_F(ChainStateTest, GetLastBlundsChecksDepth) {
    applyChain(1);
    EXPECT_EQ(chain.getLastBlunds(2).error().code, ChainState::E_ROLLBACK_DEPTH);
    EXPECT_EQ(chain.getLastBlunds(0).error().code, ChainState::E_EMPTY_BATCH);
}
