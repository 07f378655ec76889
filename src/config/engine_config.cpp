#include "config/engine_config.hpp"
#include "common/config_manager.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <cctype>
#include <thread>

static std::string Upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
  return s;
}

static ProviderKind RequireKind(const std::string& name) {
  auto kind = ParseProviderKind(name);
  if (!kind) throw InvalidParameter("unknown provider kind '" + name + "'");
  return *kind;
}

std::vector<ProviderConfig> ParseProviderList(const std::vector<std::string>& entries) {
  std::vector<ProviderConfig> out;
  for (const auto& entry : entries) {
    ProviderConfig cfg;
    // kind:region:credential, the credential may itself contain ':'
    const auto first = entry.find(':');
    cfg.kind = RequireKind(entry.substr(0, first));
    if (first != std::string::npos) {
      const auto second = entry.find(':', first + 1);
      cfg.region = entry.substr(first + 1, second == std::string::npos ? std::string::npos : second - first - 1);
      if (second != std::string::npos) cfg.credential = entry.substr(second + 1);
    }
    const std::string prefix = Upper(ProviderKindName(cfg.kind));
    if (auto v = ConfigManager::Get(prefix + "_ENDPOINT"); v && !v->empty()) cfg.endpoint = *v;
    if (auto v = ConfigManager::Get(prefix + "_AUTH"); v && !v->empty()) cfg.credential = *v;
    const auto tips = ConfigManager::GetCsv(prefix + "_TIP_ACCOUNTS");
    if (!tips.empty()) cfg.tip_accounts = tips;
    if (ConfigManager::Get(prefix + "_MIN_TIP")) cfg.min_tip = ConfigManager::GetDoubleOr(prefix + "_MIN_TIP", 0.0);
    out.push_back(std::move(cfg));
  }
  return out;
}

EngineConfig LoadEngineConfig() {
  EngineConfig cfg;
  cfg.rpc_url = ConfigManager::GetOrThrow("RPC_URL");
  if (auto a = ConfigManager::Get("RPC_AUTH_HEADER"); a && !a->empty()) cfg.rpc_auth_header = *a;
  cfg.rpc.timeout_ms = ConfigManager::GetIntOr("RPC_TIMEOUT_MS", cfg.rpc.timeout_ms);
  cfg.rpc.max_attempts = ConfigManager::GetIntOr("RPC_MAX_ATTEMPTS", cfg.rpc.max_attempts);

  cfg.http.num_handles = ConfigManager::GetIntOr("HTTP_POOL_HANDLES", cfg.http.num_handles);
  cfg.http.enable_http2 = ConfigManager::GetBoolOr("HTTP2", cfg.http.enable_http2);
  cfg.http.max_idle_connection_s = ConfigManager::GetIntOr("HTTP_MAX_IDLE_S", cfg.http.max_idle_connection_s);
  cfg.http.connect_timeout_ms = ConfigManager::GetIntOr("HTTP_CONNECT_TIMEOUT_MS", cfg.http.connect_timeout_ms);
  cfg.http.verify_tls = ConfigManager::GetBoolOr("HTTP_VERIFY_TLS", cfg.http.verify_tls);

  auto entries = ConfigManager::GetCsv("PROVIDERS");
  if (entries.empty()) entries.push_back("rpc");
  cfg.providers = ParseProviderList(entries);
  for (const auto& name : ConfigManager::GetCsv("PROVIDER_DENYLIST")) cfg.denylist.insert(RequireKind(name));
  cfg.submit_timeout_ms = ConfigManager::GetIntOr("SUBMIT_TIMEOUT_MS", cfg.submit_timeout_ms);

  const std::string policy = ConfigManager::Get("RACE_POLICY").value_or("broadcast");
  auto parsed_policy = ParseRaceAssignmentPolicy(policy);
  if (!parsed_policy) throw InvalidParameter("unknown RACE_POLICY '" + policy + "'");
  cfg.engine.policy = *parsed_policy;

  cfg.engine.tracker.poll_interval = std::chrono::milliseconds(ConfigManager::GetIntOr("CONFIRM_POLL_MS", 200));
  cfg.engine.tracker.deadline = std::chrono::milliseconds(ConfigManager::GetIntOr("CONFIRM_TIMEOUT_MS", 30000));
  const std::string commitment = ConfigManager::Get("COMMITMENT").value_or("confirmed");
  auto level = ParseCommitmentLevel(commitment);
  if (!level) throw InvalidParameter("unknown COMMITMENT '" + commitment + "'");
  cfg.engine.tracker.commitment = *level;

  const unsigned hw = std::thread::hardware_concurrency();
  cfg.engine.workers = static_cast<size_t>(ConfigManager::GetIntOr("WORKER_THREADS", hw > 0 ? static_cast<int>(hw) * 2 : 16));
  cfg.engine.first_core = ConfigManager::GetIntOr("PIN_FIRST_CORE", -1);
  cfg.engine.sandwich_guard = ConfigManager::GetBoolOr("SANDWICH_GUARD", false);
  cfg.engine.require_durable_for_multi_buy = ConfigManager::GetBoolOr("REQUIRE_DURABLE_FOR_MULTI_BUY", true);

  cfg.fees.cu_limit = static_cast<uint32_t>(ConfigManager::GetUint64Or("CU_LIMIT", cfg.fees.cu_limit));
  cfg.fees.cu_price = ConfigManager::GetUint64Or("CU_PRICE", cfg.fees.cu_price);
  cfg.fees.buy_tip = ConfigManager::GetDoubleOr("BUY_TIP", cfg.fees.buy_tip);
  cfg.fees.sell_tip = ConfigManager::GetDoubleOr("SELL_TIP", cfg.fees.sell_tip);
  cfg.fees.max_tx_size = static_cast<size_t>(ConfigManager::GetUint64Or("MAX_TX_SIZE", cfg.fees.max_tx_size));

  cfg.dynamic_tip.enabled = ConfigManager::GetBoolOr("DYNAMIC_TIP", false);
  const std::string pct = ConfigManager::Get("DYNAMIC_TIP_PERCENTILE").value_or("50th");
  auto percentile = ParseTipPercentile(pct);
  if (!percentile) throw InvalidParameter("unknown DYNAMIC_TIP_PERCENTILE '" + pct + "'");
  cfg.dynamic_tip.percentile = *percentile;
  cfg.dynamic_tip.multiplier = ConfigManager::GetDoubleOr("DYNAMIC_TIP_MULTIPLIER", cfg.dynamic_tip.multiplier);
  cfg.dynamic_tip.min_tip = ConfigManager::GetDoubleOr("DYNAMIC_TIP_MIN", cfg.dynamic_tip.min_tip);
  cfg.dynamic_tip.max_tip = ConfigManager::GetDoubleOr("DYNAMIC_TIP_MAX", cfg.dynamic_tip.max_tip);

  cfg.log_path = ConfigManager::Get("LOG_FILE").value_or(cfg.log_path);
  cfg.log_level = ConfigManager::Get("LOG_LEVEL").value_or(cfg.log_level);
  cfg.metrics_path = ConfigManager::Get("METRICS_FILE").value_or(cfg.metrics_path);
  return cfg;
}
