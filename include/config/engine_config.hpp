#pragma once
#include "engine/execution_engine.hpp"
#include "gas/dynamic_tip.hpp"
#include "net/http_client.hpp"
#include "node_connection/rpc_client.hpp"
#include "swqos/provider.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

struct GlobalFeeConfig {
  uint32_t cu_limit = 200000;
  uint64_t cu_price = 100000; // micro-lamports per CU
  double buy_tip = 0.0001;    // SOL
  double sell_tip = 0.0001;   // SOL
  size_t max_tx_size = 1232;
};

struct EngineConfig {
  std::string rpc_url;
  std::optional<std::string> rpc_auth_header;
  RpcClientOptions rpc;
  HttpClientTuning http;
  std::vector<ProviderConfig> providers;
  std::set<ProviderKind> denylist;
  int submit_timeout_ms = 3000;
  EngineOptions engine;
  GlobalFeeConfig fees;
  DynamicTipConfig dynamic_tip;
  std::string log_path = "txracer.log";
  std::string log_level = "info";
  std::string metrics_path = "metrics.jsonl";
};

// PROVIDERS entries are kind[:region[:credential]], e.g. "jito:tokyo:uuid,nextblock::token,rpc".
// Per kind, <KIND>_ENDPOINT, <KIND>_AUTH, <KIND>_TIP_ACCOUNTS and <KIND>_MIN_TIP
// override the entry (KIND upper-cased, e.g. NEXTBLOCK_ENDPOINT).
std::vector<ProviderConfig> ParseProviderList(const std::vector<std::string>& entries);

// Reads every setting through ConfigManager. Throws EngineError(InvalidParameter)
// for unknown provider kinds, race policies, commitments or percentiles.
EngineConfig LoadEngineConfig();
