#include "swqos/provider_registry.hpp"
#include "swqos/relays.hpp"
#include "node_connection/rpc_client.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

static std::vector<PublicKey> ParseTipAccounts(const ProviderConfig& cfg) {
  std::vector<PublicKey> out;
  const auto& source = (cfg.kind == ProviderKind::Jito && cfg.tip_accounts.empty()) ? JitoTipAccounts() : cfg.tip_accounts;
  for (const auto& a : source) {
    try {
      out.push_back(PublicKey::FromBase58(a));
    } catch (const std::invalid_argument& ex) {
      throw InvalidParameter(std::string(ProviderKindName(cfg.kind)) + " tip account: " + ex.what());
    }
  }
  return out;
}

static std::string DescribeId(const ProviderConfig& cfg) {
  std::string id = ProviderKindName(cfg.kind);
  if (!cfg.region.empty()) id += "/" + cfg.region;
  return id;
}

ProviderRegistry::ProviderRegistry(HttpClient& http,
                                   LedgerClient& ledger,
                                   const std::vector<ProviderConfig>& configs,
                                   const std::set<ProviderKind>& denylist,
                                   int submit_timeout_ms) {
  if (configs.empty()) throw EngineError(ErrorKind::ProviderUnavailable, "no relay providers configured");
  for (const auto& cfg : configs) {
    if (denylist.count(cfg.kind)) {
      Logger::Warning("Provider " + DescribeId(cfg) + " is denylisted, keeping it disabled");
      providers_.push_back(std::unique_ptr<RelayProvider>(new DisabledRelay(cfg, DescribeId(cfg))));
      continue;
    }
    if (cfg.kind == ProviderKind::Default) {
      std::string endpoint = cfg.endpoint;
      if (auto* rpc = dynamic_cast<RpcClient*>(&ledger)) endpoint = rpc->Endpoint();
      providers_.push_back(std::unique_ptr<RelayProvider>(new RpcRelay(ledger, endpoint)));
      continue;
    }
    auto tips = ParseTipAccounts(cfg);
    if (tips.empty()) throw InvalidParameter(DescribeId(cfg) + " has an empty tip-account pool");
    if (cfg.kind == ProviderKind::Jito) {
      providers_.push_back(std::unique_ptr<RelayProvider>(new JitoRelay(http, cfg, std::move(tips), submit_timeout_ms)));
    } else {
      providers_.push_back(std::unique_ptr<RelayProvider>(new JsonRpcRelay(http, cfg, std::move(tips), submit_timeout_ms)));
    }
  }
  nlohmann::json j = nlohmann::json::array();
  for (const auto& p : providers_) {
    Logger::Info("Provider " + p->Id() + (p->Disabled() ? " (disabled)" : "") + " -> " + p->Endpoint());
    j.push_back({{"id", p->Id()}, {"disabled", p->Disabled()}, {"tip_accounts", p->TipAccounts().size()}});
  }
  StructuredLogger::Instance().LogEvent("provider_registry", {{"providers", j}});
}

ProviderRegistry::ProviderRegistry(std::vector<std::unique_ptr<RelayProvider>> providers)
  : providers_(std::move(providers)) {
  if (providers_.empty()) throw EngineError(ErrorKind::ProviderUnavailable, "no relay providers configured");
}

std::vector<RelayProvider*> ProviderRegistry::Enabled() const {
  std::vector<RelayProvider*> out;
  for (const auto& p : providers_) if (!p->Disabled()) out.push_back(p.get());
  return out;
}

RelayProvider* ProviderRegistry::Find(const std::string& id) const {
  auto it = std::find_if(providers_.begin(), providers_.end(), [&](const std::unique_ptr<RelayProvider>& p){ return p->Id() == id; });
  return it == providers_.end() ? nullptr : it->get();
}

size_t ProviderRegistry::DisabledCount() const {
  return static_cast<size_t>(std::count_if(providers_.begin(), providers_.end(),
                                           [](const std::unique_ptr<RelayProvider>& p){ return p->Disabled(); }));
}
