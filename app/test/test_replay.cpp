#include "../Replay.h"
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

using namespace ws;
using ws::app::Replay;
using ws::wallet::SyncTip;

namespace {

const char *CONFIG_JSON = R"({
  "logLevel": "WARNING",
  "systemStart": 1700000000000,
  "slotsPerEpoch": 10,
  "slotDuration": 1000,
  "epochs": [
    { "epoch": 0, "slotDuration": 1000 },
    { "epoch": 1, "slotDuration": 2000 }
  ],
  "wallets": [
    { "id": "W1", "publicKey": "pk-alice",
      "addresses": [ { "account": 0, "index": 0 }, { "account": 0, "index": 1 } ] },
    { "id": "W2", "publicKey": "pk-bob",
      "addresses": [ { "account": 0, "index": 0 } ] },
    { "id": "W3", "publicKey": "pk-carol", "synced": false,
      "addresses": [ { "account": 0, "index": 0 } ] }
  ]
})";

const char *FUND_BATCH = R"({
  "action": "apply",
  "blocks": [ { "slot": { "epoch": 0, "slot": 1 }, "txs": [
    { "label": "fund",
      "outputs": [ { "wallet": "W1", "account": 0, "index": 0, "amount": 100 } ] } ] } ]
})";

const char *PAY_BATCH = R"({
  "action": "apply",
  "blocks": [ { "slot": { "epoch": 0, "slot": 2 }, "txs": [
    { "label": "pay",
      "inputs": [ { "ref": "fund", "index": 0 } ],
      "outputs": [ { "wallet": "W2", "account": 0, "index": 0, "amount": 30 },
                   { "wallet": "W1", "account": 0, "index": 1, "amount": 70 } ] } ] } ]
})";

} // namespace

class ReplayTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto config = Replay::parseConfig(nlohmann::json::parse(CONFIG_JSON));
        ASSERT_TRUE(config.isOk()) << config.error().message;
        auto initResult = replay.init(config.value());
        ASSERT_TRUE(initResult.isOk()) << initResult.error().message;
    }

    uint64_t getBalance(const std::string &walletId) {
        auto state = replay.getWalletStore().getWalletState(walletId);
        EXPECT_TRUE(state.isOk());
        return state.isOk() ? state.value().getBalance() : 0;
    }

    Replay replay;
};

TEST(ReplayConfigTest, ParsesEpochsAndWallets) {
    auto config = Replay::parseConfig(nlohmann::json::parse(CONFIG_JSON));
    ASSERT_TRUE(config.isOk());

    const auto &sd = config.value().slottingData;
    ASSERT_EQ(sd.getSize(), 2u);
    EXPECT_EQ(sd.getEpochData(1)->slotDurationMs, 2000u);
    EXPECT_EQ(sd.getEpochData(1)->epochStartDiffMs, 10000);
    EXPECT_EQ(config.value().genesisTip, Replay::getDefaultGenesisTip());

    ASSERT_EQ(config.value().wallets.size(), 3u);
    EXPECT_EQ(config.value().wallets[0].addresses.size(), 2u);
    EXPECT_FALSE(config.value().wallets[2].isSynced);
}

TEST(ReplayConfigTest, RejectsInvalidConfig) {
    auto missingKey = Replay::parseConfig(nlohmann::json::parse(R"({"wallets": [ { "id": "W1" } ]})"));
    ASSERT_TRUE(missingKey.isError());
    EXPECT_EQ(missingKey.error().code, Replay::E_CONFIG);

    auto zeroSlots = Replay::parseConfig(nlohmann::json::parse(R"({"slotsPerEpoch": 0})"));
    ASSERT_TRUE(zeroSlots.isError());
    EXPECT_EQ(zeroSlots.error().code, Replay::E_CONFIG);

    EXPECT_TRUE(Replay::parseConfig(nlohmann::json::array()).isError());
}

TEST_F(ReplayTest, FlushMovesBufferIntoWalletStore) {
    nlohmann::json batches = nlohmann::json::array();
    batches.push_back(nlohmann::json::parse(FUND_BATCH));
    batches.push_back(nlohmann::json::parse(PAY_BATCH));

    auto result = replay.runBatches(batches, true);
    ASSERT_TRUE(result.isOk()) << result.error().message;

    EXPECT_EQ(replay.getChainState().getBlockCount(), 2u);
    EXPECT_EQ(getBalance("W1"), 70u);
    EXPECT_EQ(getBalance("W2"), 30u);
    EXPECT_EQ(getBalance("W3"), 0u);
    EXPECT_EQ(replay.getReportCount(), 0u);
    EXPECT_TRUE(replay.getStorageModifierVar().snapshot().isEmpty());

    std::string tip = replay.getChainState().getTip();
    EXPECT_EQ(replay.getWalletStore().getWalletSyncTip("W1"), SyncTip::syncedWith(tip));
    EXPECT_EQ(replay.getWalletStore().getWalletSyncTip("W3"), SyncTip::notSynced());
}

TEST_F(ReplayTest, WithoutFlushLaterBatchesAreSkipped) {
    nlohmann::json batches = nlohmann::json::array();
    batches.push_back(nlohmann::json::parse(FUND_BATCH));
    batches.push_back(nlohmann::json::parse(PAY_BATCH));

    ASSERT_TRUE(replay.runBatches(batches, false).isOk());

    auto modifier = replay.getStorageModifierVar().snapshot().getWalModifier("W1");
    ASSERT_TRUE(modifier.has_value());
    EXPECT_EQ(modifier->history.getInsertions().size(), 1u);
    EXPECT_EQ(getBalance("W1"), 0u);
    EXPECT_EQ(replay.getWalletStore().getWalletSyncTip("W1"),
              SyncTip::syncedWith(Replay::getDefaultGenesisTip()));
}

TEST_F(ReplayTest, RollbackUndoesUnflushedApply) {
    nlohmann::json batches = nlohmann::json::array();
    batches.push_back(nlohmann::json::parse(FUND_BATCH));
    batches.push_back(nlohmann::json::parse(R"({ "action": "rollback", "count": 1 })"));

    ASSERT_TRUE(replay.runBatches(batches, false).isOk());

    EXPECT_EQ(replay.getChainState().getTip(), Replay::getDefaultGenesisTip());
    auto modifier = replay.getStorageModifierVar().snapshot().getWalModifier("W1");
    ASSERT_TRUE(modifier.has_value());
    EXPECT_TRUE(modifier->isEmpty());
}

TEST_F(ReplayTest, GenesisBlockOnlyMovesTheTip) {
    auto result = replay.runBatch(
        nlohmann::json::parse(R"({ "action": "apply", "blocks": [ { "type": "genesis", "epoch": 1 } ] })"),
        true);
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(replay.getChainState().getBlockCount(), 1u);
    EXPECT_EQ(getBalance("W1"), 0u);
    EXPECT_EQ(replay.getWalletStore().getWalletSyncTip("W1"),
              SyncTip::syncedWith(replay.getChainState().getTip()));
}

TEST_F(ReplayTest, BadBatchesAreRejected) {
    auto unknownAction = replay.runBatch(nlohmann::json::parse(R"({ "action": "reorg" })"), false);
    ASSERT_TRUE(unknownAction.isError());
    EXPECT_EQ(unknownAction.error().code, Replay::E_BATCH);

    auto unknownLabel = replay.runBatch(nlohmann::json::parse(R"({
      "action": "apply",
      "blocks": [ { "txs": [ { "inputs": [ { "ref": "missing" } ] } ] } ]
    })"), false);
    ASSERT_TRUE(unknownLabel.isError());
    EXPECT_EQ(unknownLabel.error().code, Replay::E_BATCH);

    auto tooDeep = replay.runBatch(nlohmann::json::parse(R"({ "action": "rollback", "count": 3 })"), false);
    ASSERT_TRUE(tooDeep.isError());
    EXPECT_EQ(tooDeep.error().code, Replay::E_CHAIN);

    nlohmann::json batches = nlohmann::json::array();
    batches.push_back(nlohmann::json::parse(FUND_BATCH));
    batches.push_back(nlohmann::json::parse(R"({ "action": "reorg" })"));
    auto failed = replay.runBatches(batches, false);
    ASSERT_TRUE(failed.isError());
    EXPECT_EQ(failed.error().message.rfind("Batch 1: ", 0), 0u);
    EXPECT_EQ(replay.getChainState().getBlockCount(), 1u);
}

TEST_F(ReplayTest, JsonReportHasTipAndWallets) {
    ASSERT_TRUE(replay.runBatch(nlohmann::json::parse(FUND_BATCH), false).isOk());
    nlohmann::json j = replay.toJson();
    EXPECT_EQ(j["tip"].get<std::string>(), replay.getChainState().getTip());
    EXPECT_EQ(j["blocks"].get<size_t>(), 1u);
    EXPECT_TRUE(j["buffer"].contains("W1"));
    EXPECT_TRUE(j["wallets"].contains("W3"));
}
