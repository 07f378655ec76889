#include "common/logger.hpp"
#include "common/config_manager.hpp"
#include "common/errors.hpp"
#include "config/engine_config.hpp"
#include "encoding/builtin_programs.hpp"
#include "engine/execution_engine.hpp"
#include "gas/dynamic_tip.hpp"
#include "gas/fee_strategy_store.hpp"
#include "net/checkpoint_cache.hpp"
#include "net/http_client.hpp"
#include "node_connection/rpc_client.hpp"
#include "swqos/provider_registry.hpp"
#include "telemetry/structured_logger.hpp"
#include "wallet/nonce_manager.hpp"
#include "wallet/signer.hpp"
#include <iostream>
#include <memory>

static void PrintStrategies(const FeeStrategyStore& store) {
  for (const auto& e : store.Entries()) {
    std::cout << "  " << ProviderKindName(e.provider) << " " << TradeDirectionName(e.direction) << " "
              << StrategyKindName(e.kind) << ": cu_limit=" << e.params.cu_limit << " cu_price=" << e.params.cu_price
              << " tip=" << e.params.tip << " max_tx_size=" << e.params.max_tx_size << std::endl;
  }
}

static ValidityAnchor ResolveAnchor(LedgerClient& ledger, CheckpointCache& checkpoints) {
  if (auto nonce_account = ConfigManager::Get("NONCE_ACCOUNT"); nonce_account && !nonce_account->empty()) {
    NonceManager nonces(ledger);
    const DurableNonceInfo info = nonces.Fetch(PublicKey::FromBase58(*nonce_account));
    Logger::Info("Using durable nonce " + info.nonce.ToBase58() + " from " + info.nonce_account.ToBase58());
    return info.ToAnchor();
  }
  if (!checkpoints.RefreshNow()) throw EngineError(ErrorKind::ProviderUnavailable, "could not fetch a recent blockhash");
  return ValidityAnchor::UsingRecentCheckpoint(*checkpoints.Latest());
}

int main() {
  try {
    std::cout << "=== Starting txracer ===" << std::endl;
    ConfigManager::Initialize(".env");
    const EngineConfig cfg = LoadEngineConfig();
    Logger::Initialize(cfg.log_path, Logger::ParseLevel(cfg.log_level), true);
    StructuredLogger::Instance().Initialize(cfg.metrics_path, {{"app", "txracer"}, {"policy", RaceAssignmentPolicyName(cfg.engine.policy)}});
    Logger::Info("txracer starting, RPC " + cfg.rpc_url);

    std::unique_ptr<HttpClient> http(CreateCurlHttpClientTuned(cfg.http));
    RpcClient rpc(*http, cfg.rpc_url, cfg.rpc_auth_header, cfg.rpc);

    ProviderRegistry registry(*http, rpc, cfg.providers, cfg.denylist, cfg.submit_timeout_ms);
    std::cout << "Providers: " << registry.Size() << " (" << registry.DisabledCount() << " disabled)" << std::endl;
    for (const auto& p : registry.All()) {
      std::cout << "  " << p->Id() << (p->Disabled() ? " [disabled]" : "") << " " << p->Endpoint() << std::endl;
    }

    std::vector<ProviderKind> kinds;
    for (const auto& p : registry.All()) kinds.push_back(p->Kind());
    FeeStrategyStore store(kinds);
    for (TradeDirection d : {TradeDirection::Buy, TradeDirection::Sell, TradeDirection::Create, TradeDirection::CreateAndBuy}) {
      store.SetGlobal(d, cfg.fees.cu_limit, cfg.fees.cu_price, cfg.fees.buy_tip, cfg.fees.sell_tip, cfg.fees.max_tx_size);
    }

    if (cfg.dynamic_tip.enabled) {
      TipFloorClient tip_floor(*http);
      try {
        const double buy = tip_floor.ApplyTo(store, TradeDirection::Buy, cfg.dynamic_tip);
        tip_floor.ApplyTo(store, TradeDirection::CreateAndBuy, cfg.dynamic_tip);
        std::cout << "Dynamic tip applied: " << buy << " SOL" << std::endl;
      } catch (const std::exception& ex) {
        Logger::Warning(std::string("Dynamic tip unavailable, keeping static tips: ") + ex.what());
      }
    }
    std::cout << "Fee strategies:" << std::endl;
    PrintStrategies(store);

    ExecutionEngine engine(registry, store, rpc, cfg.engine);

    const uint64_t lamports = ConfigManager::GetUint64Or("SELF_TRANSFER_LAMPORTS", 0);
    const auto secret = ConfigManager::Get("PAYER_SECRET");
    if (lamports > 0 && secret && !secret->empty()) {
      const Signer payer = Signer::FromBase58(*secret);
      CheckpointCache checkpoints(rpc);
      ExecuteRequest req;
      req.instructions.push_back(SystemProgram::Transfer(payer.Pubkey(), payer.Pubkey(), lamports));
      req.direction = TradeDirection::Sell;
      req.trade_amount = lamports;
      req.anchor = ResolveAnchor(rpc, checkpoints);
      req.payer = &payer;
      req.mode = ConfigManager::GetBoolOr("DISPATCH_ONLY", false) ? ExecutionMode::DispatchOnly : ExecutionMode::WaitForConfirmation;

      std::cout << "Racing self-transfer of " << lamports << " lamports from " << payer.Pubkey().ToBase58() << std::endl;
      const ExecutionResult result = engine.Execute(req);
      std::cout << "Success: " << (result.overall_success ? "true" : "false") << std::endl;
      for (const auto& sig : result.signatures) std::cout << "  " << sig << std::endl;
      if (result.last_error) std::cout << "Last error: " << result.last_error->ToString() << std::endl;
    } else {
      std::cout << "SELF_TRANSFER_LAMPORTS or PAYER_SECRET not set, nothing to send" << std::endl;
    }

    StructuredLogger::Instance().Shutdown();
    Logger::Shutdown();
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "FATAL: " << ex.what() << std::endl;
    Logger::Critical(std::string("Fatal: ") + ex.what());
    StructuredLogger::Instance().Shutdown();
    Logger::Shutdown();
    return 1;
  }
}
