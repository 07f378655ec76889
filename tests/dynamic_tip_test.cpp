#include "gas/dynamic_tip.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>

namespace {
  const char* kTipFloorBody = R"([{
    "time": "2025-01-01T00:00:00Z",
    "landed_tips_25th_percentile": 0.000005,
    "landed_tips_50th_percentile": 0.00002,
    "landed_tips_75th_percentile": 0.0001,
    "landed_tips_95th_percentile": 0.0008,
    "landed_tips_99th_percentile": 0.004,
    "ema_landed_tips_50th_percentile": 0.000019
  }])";
}

TEST(TipPercentile, ParsesOrdinalNames) {
  EXPECT_EQ(ParseTipPercentile("25th"), TipPercentile::P25);
  EXPECT_EQ(ParseTipPercentile("99TH"), TipPercentile::P99);
  EXPECT_FALSE(ParseTipPercentile("median").has_value());
}

TEST(TipFloorClient, ParsesTheFirstArrayElement) {
  const TipFloor f = TipFloorClient::Parse(kTipFloorBody);
  EXPECT_DOUBLE_EQ(f.p50, 0.00002);
  EXPECT_DOUBLE_EQ(f.At(TipPercentile::P95), 0.0008);
  EXPECT_DOUBLE_EQ(f.ema_p50, 0.000019);
  EXPECT_THROW(TipFloorClient::Parse("[]"), std::runtime_error);
  EXPECT_THROW(TipFloorClient::Parse("{oops"), std::runtime_error);
  EXPECT_THROW(TipFloorClient::Parse(R"([{"landed_tips_50th_percentile": 1}])"), std::runtime_error);
}

TEST(TipFloorClient, ComputeTipAppliesMultiplierAndClamps) {
  const TipFloor f = TipFloorClient::Parse(kTipFloorBody);
  DynamicTipConfig cfg;
  cfg.enabled = true;
  cfg.percentile = TipPercentile::P75;
  cfg.multiplier = 2.0;
  EXPECT_DOUBLE_EQ(TipFloorClient::ComputeTip(f, cfg), 0.0002);
  cfg.percentile = TipPercentile::P99;
  EXPECT_DOUBLE_EQ(TipFloorClient::ComputeTip(f, cfg), cfg.max_tip);
  cfg.percentile = TipPercentile::P25;
  cfg.multiplier = 1.0;
  EXPECT_DOUBLE_EQ(TipFloorClient::ComputeTip(f, cfg), cfg.min_tip);
}

TEST(TipFloorClient, DisabledConfigReturnsMinimumWithoutFetching) {
  FakeHttpClient http;
  TipFloorClient client(http);
  DynamicTipConfig cfg;
  EXPECT_DOUBLE_EQ(client.OptimalTip(cfg), cfg.min_tip);
  EXPECT_TRUE(http.Requests().empty());
}

TEST(TipFloorClient, ApplyToUpdatesTheStore) {
  FakeHttpClient http;
  http.SetHandler([](const RecordedRequest&) { return FakeHttpClient::Reply(200, kTipFloorBody); });
  TipFloorClient client(http);
  FeeStrategyStore store;
  store.SetGlobal(TradeDirection::Buy, 200000, 1000, 0.001, 0.001, 1232);

  DynamicTipConfig cfg;
  cfg.enabled = true;
  cfg.percentile = TipPercentile::P75;
  EXPECT_DOUBLE_EQ(client.ApplyTo(store, TradeDirection::Buy, cfg), 0.0001);
  EXPECT_DOUBLE_EQ(store.Lookup(ProviderKind::Jito, TradeDirection::Buy)[0].params.tip, 0.0001);

  const auto requests = http.Requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].method, "GET");
  EXPECT_EQ(requests[0].url, TipFloorClient::kDefaultEndpoint);
}

TEST(TipFloorClient, HttpFailuresThrow) {
  FakeHttpClient http;
  http.SetHandler([](const RecordedRequest&) { return FakeHttpClient::Reply(429, "slow down"); });
  TipFloorClient client(http);
  EXPECT_THROW(client.Fetch(), std::runtime_error);
  http.SetHandler([](const RecordedRequest&) { return FakeHttpClient::Timeout(); });
  EXPECT_THROW(client.Fetch(), std::runtime_error);
}
