#include "config/engine_config.hpp"
#include "common/config_manager.hpp"
#include "common/errors.hpp"
#include <gtest/gtest.h>

class EngineConfigTest : public ::testing::Test {
protected:
  void SetUp() override { ConfigManager::Clear(); }
  void TearDown() override { ConfigManager::Clear(); }
};

TEST_F(EngineConfigTest, ProviderEntriesSplitKindRegionAndCredential) {
  const auto cfgs = ParseProviderList({"jito:tokyo:my-uuid", "nextblock::token:with:colons", "rpc"});
  ASSERT_EQ(cfgs.size(), 3u);
  EXPECT_EQ(cfgs[0].kind, ProviderKind::Jito);
  EXPECT_EQ(cfgs[0].region, "tokyo");
  EXPECT_EQ(cfgs[0].credential, "my-uuid");
  EXPECT_EQ(cfgs[1].kind, ProviderKind::NextBlock);
  EXPECT_EQ(cfgs[1].region, "");
  EXPECT_EQ(cfgs[1].credential, "token:with:colons");
  EXPECT_EQ(cfgs[2].kind, ProviderKind::Default);
  EXPECT_FALSE(cfgs[2].min_tip.has_value());
}

TEST_F(EngineConfigTest, PerKindOverridesApply) {
  ConfigManager::Set("ZEROSLOT_ENDPOINT", "https://zs.example/tx");
  ConfigManager::Set("ZEROSLOT_AUTH", "api-key: abc");
  ConfigManager::Set("ZEROSLOT_TIP_ACCOUNTS", "a, b");
  ConfigManager::Set("ZEROSLOT_MIN_TIP", "0.002");
  const auto cfgs = ParseProviderList({"zeroslot"});
  ASSERT_EQ(cfgs.size(), 1u);
  EXPECT_EQ(cfgs[0].endpoint, "https://zs.example/tx");
  EXPECT_EQ(cfgs[0].credential, "api-key: abc");
  EXPECT_EQ(cfgs[0].tip_accounts, (std::vector<std::string>{"a", "b"}));
  ASSERT_TRUE(cfgs[0].min_tip.has_value());
  EXPECT_DOUBLE_EQ(*cfgs[0].min_tip, 0.002);
}

TEST_F(EngineConfigTest, LoadsDefaultsAroundTheRequiredUrl) {
  ConfigManager::Set("RPC_URL", "https://rpc.example");
  const EngineConfig cfg = LoadEngineConfig();
  EXPECT_EQ(cfg.rpc_url, "https://rpc.example");
  ASSERT_EQ(cfg.providers.size(), 1u);
  EXPECT_EQ(cfg.providers[0].kind, ProviderKind::Default);
  EXPECT_EQ(cfg.engine.policy, RaceAssignmentPolicy::Broadcast);
  EXPECT_EQ(cfg.engine.tracker.commitment, CommitmentLevel::Confirmed);
  EXPECT_EQ(cfg.fees.max_tx_size, 1232u);
  EXPECT_FALSE(cfg.dynamic_tip.enabled);
}

TEST_F(EngineConfigTest, ReadsEngineSettings) {
  ConfigManager::Set("RPC_URL", "https://rpc.example");
  ConfigManager::Set("PROVIDERS", "jito:ny,bloxroute");
  ConfigManager::Set("PROVIDER_DENYLIST", "bloxroute");
  ConfigManager::Set("RACE_POLICY", "split");
  ConfigManager::Set("COMMITMENT", "finalized");
  ConfigManager::Set("CONFIRM_TIMEOUT_MS", "5000");
  ConfigManager::Set("CU_PRICE", "1_000_000");
  ConfigManager::Set("DYNAMIC_TIP", "true");
  ConfigManager::Set("DYNAMIC_TIP_PERCENTILE", "95TH");
  const EngineConfig cfg = LoadEngineConfig();
  EXPECT_EQ(cfg.providers.size(), 2u);
  EXPECT_EQ(cfg.denylist.count(ProviderKind::Bloxroute), 1u);
  EXPECT_EQ(cfg.engine.policy, RaceAssignmentPolicy::Split);
  EXPECT_EQ(cfg.engine.tracker.commitment, CommitmentLevel::Finalized);
  EXPECT_EQ(cfg.engine.tracker.deadline, std::chrono::milliseconds(5000));
  EXPECT_EQ(cfg.fees.cu_price, 1000000u);
  EXPECT_TRUE(cfg.dynamic_tip.enabled);
  EXPECT_EQ(cfg.dynamic_tip.percentile, TipPercentile::P95);
}

TEST_F(EngineConfigTest, UnknownNamesAreInvalidParameters) {
  ConfigManager::Set("RPC_URL", "https://rpc.example");
  ConfigManager::Set("PROVIDERS", "jito,carrier-pigeon");
  try {
    LoadEngineConfig();
    FAIL() << "expected EngineError";
  } catch (const EngineError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::InvalidParameter);
  }
  ConfigManager::Set("PROVIDERS", "jito");
  ConfigManager::Set("RACE_POLICY", "round-robin");
  EXPECT_THROW(LoadEngineConfig(), EngineError);
  ConfigManager::Set("RACE_POLICY", "broadcast");
  ConfigManager::Set("COMMITMENT", "soon");
  EXPECT_THROW(LoadEngineConfig(), EngineError);
}

TEST_F(EngineConfigTest, MissingRpcUrlThrows) {
  EXPECT_THROW(LoadEngineConfig(), std::runtime_error);
}
