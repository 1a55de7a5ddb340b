#include "application/bridge_node.hpp"

#include <gtest/gtest.h>
#include "consensus/store_error.hpp"
#include "testutil/consensus/execution_log.hpp"
#include "testutil/outcome.hpp"
#include "testutil/storage/base_fs_test.hpp"

using qstore::application::BridgeConfig;
using qstore::application::BridgeNode;
using qstore::concurrency::Ctx;
using qstore::consensus::StoreError;

namespace {
  BridgeConfig inMemoryConfig() {
    BridgeConfig config;
    config.operator_address[0] = 0x01;
    config.pool_size = 2;
    config.validator_keys.push_back(
        qstore::crypto::ED25519Seed::fromHex(std::string(64, '7')).value());
    return config;
  }
}  // namespace

/**
 * @given a node over an empty in-memory log
 * @when it starts before and after the first block is sealed
 * @then the first start fails with NO_SEALED_BLOCK and the second creates
 * genesis
 */
TEST(BridgeNodeTest, StartCreatesGenesis) {
  auto ctx = Ctx::background();
  EXPECT_OUTCOME_TRUE(node, BridgeNode::create(inMemoryConfig()));
  EXPECT_OUTCOME_ERROR(node->start(ctx), StoreError::NO_SEALED_BLOCK);
  EXPECT_EQ(node->actionQueue(), nullptr);

  test::ExecutionLog log(node->pool());
  ASSERT_TRUE(log.sealBlocks(3));
  EXPECT_OUTCOME_TRUE_1(node->start(ctx));

  EXPECT_OUTCOME_TRUE(state, node->store()->state(ctx));
  ASSERT_TRUE(state);
  EXPECT_EQ(state->first(), 2u);
  EXPECT_EQ(state->first_qc.signatures.size(), 1u);
  node->stop();
}

/**
 * @given a follower node
 * @when it starts
 * @then it owns an action queue of the configured capacity
 */
TEST(BridgeNodeTest, FollowerGetsActionQueue) {
  auto config = inMemoryConfig();
  config.follower = true;
  config.action_queue_capacity = 5;
  EXPECT_OUTCOME_TRUE(node, BridgeNode::create(config));
  test::ExecutionLog log(node->pool());
  ASSERT_TRUE(log.sealBlocks(1));

  EXPECT_OUTCOME_TRUE_1(node->start(Ctx::background()));
  ASSERT_NE(node->actionQueue(), nullptr);
  EXPECT_EQ(node->actionQueue()->capacity(), 5u);
}

/**
 * @given a stopped node
 * @when the store is used
 * @then database access is refused
 */
TEST(BridgeNodeTest, StopClosesPool) {
  EXPECT_OUTCOME_TRUE(node, BridgeNode::create(inMemoryConfig()));
  node->stop();
  EXPECT_OUTCOME_FALSE_1(node->store()->state(Ctx::background()));
}

struct BridgeNodeRocksTest : public test::FSFixture {
  BridgeNodeRocksTest() : test::FSFixture("qstore_bridge_node_test") {}
};

/**
 * @given a node over a RocksDB log
 * @when genesis is created and the node is reopened
 * @then the certified range survives the restart
 */
TEST_F(BridgeNodeRocksTest, GenesisSurvivesRestart) {
  auto config = inMemoryConfig();
  config.database_path = (base_path / "db").string();
  auto ctx = Ctx::background();
  {
    EXPECT_OUTCOME_TRUE(node, BridgeNode::create(config));
    test::ExecutionLog log(node->pool());
    ASSERT_TRUE(log.sealBlocks(2));
    EXPECT_OUTCOME_TRUE_1(node->start(ctx));
    node->stop();
  }
  EXPECT_OUTCOME_TRUE(node, BridgeNode::create(config));
  EXPECT_OUTCOME_TRUE(state, node->store()->state(ctx));
  ASSERT_TRUE(state);
  EXPECT_EQ(state->first(), 1u);
  EXPECT_EQ(state->last(), 1u);
}
