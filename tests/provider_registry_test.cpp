#include "swqos/provider_registry.hpp"
#include "swqos/relays.hpp"
#include "utils/text_encoding.hpp"
#include "fakes.hpp"
#include <nlohmann/json.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <set>

namespace {
  std::vector<std::string> RelayTips() {
    return {MakeKey(0x11).ToBase58(), MakeKey(0x12).ToBase58()};
  }

  TransactionVariant SampleVariant(const std::string& sig = "sig-1") {
    TransactionVariant v;
    v.serialized = {1, 2, 3, 4};
    v.signature = sig;
    return v;
  }

  ProviderConfig Config(ProviderKind kind, const std::string& region = "", const std::string& endpoint = "",
                        const std::string& credential = "") {
    ProviderConfig cfg;
    cfg.kind = kind;
    cfg.region = region;
    cfg.endpoint = endpoint;
    cfg.credential = credential;
    if (kind != ProviderKind::Jito && kind != ProviderKind::Default) cfg.tip_accounts = RelayTips();
    return cfg;
  }
}

TEST(ProviderRegistry, ZeroConfigsIsInfrastructureUnavailable) {
  FakeHttpClient http;
  FakeLedger ledger;
  try {
    ProviderRegistry registry(http, ledger, {}, {});
    FAIL() << "expected EngineError";
  } catch (const EngineError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::ProviderUnavailable);
  }
}

TEST(ProviderRegistry, DenylistedKindsBecomeInertProviders) {
  FakeHttpClient http;
  FakeLedger ledger;
  ProviderRegistry registry(http, ledger,
                            {Config(ProviderKind::Jito, "tokyo"),
                             Config(ProviderKind::NextBlock, "", "https://nextblock.test/v1"),
                             Config(ProviderKind::Default)},
                            {ProviderKind::NextBlock});
  EXPECT_EQ(registry.Size(), 3u);
  EXPECT_EQ(registry.DisabledCount(), 1u);
  EXPECT_EQ(registry.Enabled().size(), 2u);

  RelayProvider* disabled = registry.Find("NextBlock");
  ASSERT_NE(disabled, nullptr);
  EXPECT_TRUE(disabled->Disabled());
  const SubmissionOutcome o = disabled->Submit(SampleVariant());
  EXPECT_FALSE(o.Accepted());
  ASSERT_TRUE(o.error.has_value());
  EXPECT_EQ(o.error->kind, ErrorKind::ProviderUnavailable);
  EXPECT_TRUE(http.Requests().empty());
}

TEST(ProviderRegistry, TipAccountIsDrawnFromThePool) {
  FakeHttpClient http;
  FakeLedger ledger;
  ProviderRegistry registry(http, ledger, {Config(ProviderKind::Jito), Config(ProviderKind::Default)}, {});
  RelayProvider* jito = registry.Find("Jito/default");
  ASSERT_NE(jito, nullptr);
  EXPECT_EQ(jito->TipAccounts().size(), JitoTipAccounts().size());
  EXPECT_DOUBLE_EQ(jito->MinTip(), kJitoMinTipSol);

  std::set<std::string> seen;
  for (int i = 0; i < 400; ++i) {
    auto tip = jito->TipAccount();
    ASSERT_TRUE(tip.has_value());
    const std::string b58 = tip->ToBase58();
    EXPECT_NE(std::find(JitoTipAccounts().begin(), JitoTipAccounts().end(), b58), JitoTipAccounts().end());
    seen.insert(b58);
  }
  EXPECT_GT(seen.size(), 1u);

  RelayProvider* rpc = registry.Find("Default");
  ASSERT_NE(rpc, nullptr);
  EXPECT_FALSE(rpc->TipAccount().has_value());
}

TEST(ProviderRegistry, ConfigurationErrorsAreInvalidParameters) {
  FakeHttpClient http;
  FakeLedger ledger;
  auto expect_invalid = [&](const ProviderConfig& cfg) {
    try {
      ProviderRegistry registry(http, ledger, {cfg}, {});
      FAIL() << "expected InvalidParameter for " << ProviderKindName(cfg.kind);
    } catch (const EngineError& e) {
      EXPECT_EQ(e.Kind(), ErrorKind::InvalidParameter);
    }
  };
  expect_invalid(Config(ProviderKind::Jito, "atlantis"));
  expect_invalid(Config(ProviderKind::Temporal)); // no endpoint
  ProviderConfig no_tips = Config(ProviderKind::ZeroSlot, "", "https://zeroslot.test");
  no_tips.tip_accounts.clear();
  expect_invalid(no_tips);
  ProviderConfig bad_tip = Config(ProviderKind::ZeroSlot, "", "https://zeroslot.test");
  bad_tip.tip_accounts = {"not-a-key"};
  expect_invalid(bad_tip);
}

TEST(JitoRelay, SendTransactionWireContract) {
  FakeHttpClient http;
  FakeLedger ledger;
  http.SetHandler([](const RecordedRequest&) { return FakeHttpClient::Reply(200, R"({"jsonrpc":"2.0","result":"sig-1","id":1})"); });
  ProviderRegistry registry(http, ledger, {Config(ProviderKind::Jito, "tokyo", "", "my-uuid")}, {});
  RelayProvider* jito = registry.Find("Jito/tokyo");
  ASSERT_NE(jito, nullptr);

  const TransactionVariant v = SampleVariant();
  const SubmissionOutcome o = jito->Submit(v);
  EXPECT_TRUE(o.Accepted());
  EXPECT_EQ(o.signature.value_or(""), "sig-1");
  EXPECT_EQ(o.provider_id, "Jito/tokyo");

  const auto requests = http.Requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].method, "POST");
  EXPECT_EQ(requests[0].url, "https://tokyo.mainnet.block-engine.jito.wtf/api/v1/transactions?uuid=my-uuid");
  EXPECT_EQ(requests[0].headers.at("x-jito-auth"), "my-uuid");
  const auto body = nlohmann::json::parse(requests[0].body);
  EXPECT_EQ(body["method"], "sendTransaction");
  EXPECT_EQ(body["params"][0], TextEncoding::EncodeBase64(v.serialized));
  EXPECT_EQ(body["params"][1]["encoding"], "base64");
}

TEST(JitoRelay, BundleGoesToTheBundlesEndpoint) {
  FakeHttpClient http;
  FakeLedger ledger;
  http.SetHandler([](const RecordedRequest&) { return FakeHttpClient::Reply(200, R"({"jsonrpc":"2.0","result":"bundle-id","id":1})"); });
  ProviderRegistry registry(http, ledger, {Config(ProviderKind::Jito, "ny")}, {});
  RelayProvider* jito = registry.Find("Jito/ny");
  ASSERT_NE(jito, nullptr);

  const auto outcomes = jito->SubmitBatch({SampleVariant("a"), SampleVariant("b")});
  ASSERT_EQ(outcomes.size(), 2u);
  EXPECT_EQ(outcomes[0].signature.value_or(""), "a");
  EXPECT_EQ(outcomes[1].signature.value_or(""), "b");
  EXPECT_EQ(outcomes[1].variant_index, 1u);

  const auto requests = http.Requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].url, "https://ny.mainnet.block-engine.jito.wtf/api/v1/bundles");
  const auto body = nlohmann::json::parse(requests[0].body);
  EXPECT_EQ(body["method"], "sendBundle");
  EXPECT_EQ(body["params"][0].size(), 2u);
}

TEST(RelayProvider, FailuresAreCapturedInTheOutcome) {
  const std::vector<HttpResponse> failures{
    FakeHttpClient::Timeout(),
    FakeHttpClient::Reply(503, "Service Unavailable"),
    FakeHttpClient::Reply(200, R"({"jsonrpc":"2.0","error":{"code":-32602,"message":"bundle rejected"},"id":1})"),
    FakeHttpClient::Reply(200, "<html>not json</html>"),
  };
  for (const auto& failure : failures) {
    FakeHttpClient http;
    FakeLedger ledger;
    http.SetHandler([failure](const RecordedRequest&) { return failure; });
    ProviderRegistry registry(http, ledger, {Config(ProviderKind::Bloxroute, "", "https://bloxroute.test/submit", "token")}, {});
    const SubmissionOutcome o = registry.All()[0]->Submit(SampleVariant());
    EXPECT_FALSE(o.Accepted());
    ASSERT_TRUE(o.error.has_value());
    EXPECT_EQ(o.error->kind, ErrorKind::ProviderUnavailable);
    EXPECT_EQ(o.error->source, "Bloxroute");
    EXPECT_FALSE(o.signature.has_value());
  }
}

TEST(JsonRpcRelay, SendsBase64PayloadWithCredentialHeader) {
  FakeHttpClient http;
  FakeLedger ledger;
  ProviderRegistry registry(http, ledger,
                            {Config(ProviderKind::Astralane, "fra", "https://astralane.test/iris", "x-api-key: secret")}, {});
  EXPECT_EQ(registry.All()[0]->Id(), "Astralane/fra");
  EXPECT_TRUE(registry.All()[0]->Submit(SampleVariant()).Accepted());

  const auto requests = http.Requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].url, "https://astralane.test/iris");
  EXPECT_EQ(requests[0].headers.at("x-api-key"), "secret");
  const auto body = nlohmann::json::parse(requests[0].body);
  EXPECT_EQ(body["params"][1]["skipPreflight"], true);
}

TEST(RpcRelay, SubmitsThroughTheLedger) {
  FakeHttpClient http;
  FakeLedger ledger;
  ProviderRegistry registry(http, ledger, {Config(ProviderKind::Default)}, {});
  EXPECT_TRUE(registry.All()[0]->Submit(SampleVariant()).Accepted());
  ASSERT_EQ(ledger.Sent().size(), 1u);
  EXPECT_EQ(ledger.Sent()[0], TextEncoding::EncodeBase64(SampleVariant().serialized));

  ledger.RejectSends(true);
  EXPECT_FALSE(registry.All()[0]->Submit(SampleVariant()).Accepted());
}
