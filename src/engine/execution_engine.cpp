#include "engine/execution_engine.hpp"
#include "encoding/builtin_programs.hpp"
#include "swqos/provider_registry.hpp"
#include "wallet/signer.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>

static MevProtectionConfig GuardConfig(bool enabled) {
  MevProtectionConfig cfg;
  cfg.enable_sandwich_guard = enabled;
  return cfg;
}

ExecutionEngine::ExecutionEngine(ProviderRegistry& registry, FeeStrategyStore& store, LedgerClient& ledger,
                                 EngineOptions options)
  : registry_(registry),
    store_(store),
    options_(options),
    pool_(options.workers, options.first_core, "engine"),
    buffers_(options.buffer_pool_capacity, options.buffer_size),
    assembler_(buffers_, GuardConfig(options.sandwich_guard)),
    coordinator_(pool_, options.policy),
    tracker_(ledger, pool_, options.tracker) {}

std::vector<RelayProvider*> ExecutionEngine::SelectProviders(const ExecuteRequest& request) const {
  std::vector<RelayProvider*> out;
  for (RelayProvider* p : registry_.Enabled()) {
    if (!request.with_tip && p->Kind() != ProviderKind::Default) continue;
    out.push_back(p);
  }
  return out;
}

std::vector<ProviderBatch> ExecutionEngine::Plan(const ExecuteRequest& request) {
  if (!request.payer) throw InvalidParameter("payer signer is required");
  if (request.instructions.empty()) throw InvalidParameter("instruction set is empty");
  if (request.trade_amount == 0) throw InvalidParameter("trade amount must be greater than zero");

  const auto providers = SelectProviders(request);
  if (providers.empty()) {
    throw EngineError(ErrorKind::ProviderUnavailable,
                      request.with_tip ? "no enabled relay provider" : "no enabled Default provider for an untipped call");
  }

  // One snapshot for the whole call so every variant sees the same fees
  const auto table = store_.Snapshot();
  std::vector<ProviderBatch> batches;
  for (RelayProvider* p : providers) {
    auto entries = FeeStrategyStore::Lookup(*table, p->Kind(), request.direction);
    if (entries.empty()) {
      Logger::Warning("No " + std::string(TradeDirectionName(request.direction)) + " fee strategy for " + p->Id() + ", skipping");
      continue;
    }
    const auto tip_account = p->TipAccount();
    if (p->Kind() == ProviderKind::Default) {
      // the plain RPC path never carries a tip transfer
      for (auto& e : entries) e.params.tip = 0.0;
    } else {
      std::vector<StrategyEntry> usable;
      for (const auto& e : entries) {
        if (!tip_account && SolToLamports(e.params.tip) > 0) {
          Logger::Warning(p->Id() + " has no tip account for the " + StrategyKindName(e.kind) + " tip of " +
                          std::to_string(e.params.tip) + " SOL, skipping");
          continue;
        }
        if (e.params.tip < p->MinTip()) {
          Logger::Warning(p->Id() + " " + StrategyKindName(e.kind) + " tip " + std::to_string(e.params.tip) +
                          " SOL is below the provider minimum " + std::to_string(p->MinTip()) + ", skipping");
          continue;
        }
        usable.push_back(e);
      }
      entries = std::move(usable);
      if (entries.empty()) continue;
    }

    AssemblyRequest req;
    req.instructions = request.instructions;
    req.anchor = request.anchor;
    req.strategies = std::move(entries);
    req.payer = request.payer;
    req.extra_signers = request.extra_signers;
    req.tip_account = tip_account;
    req.trade_amount = request.trade_amount;
    req.sandwich_guard = options_.sandwich_guard && p->Kind() == ProviderKind::Jito;
    req.target_provider = p->Kind();

    ProviderBatch batch;
    batch.provider = p;
    batch.variants = assembler_.Assemble(req);
    batches.push_back(std::move(batch));
  }
  if (batches.empty()) {
    throw InvalidParameter(std::string("no usable ") + TradeDirectionName(request.direction) + " fee strategy for any provider");
  }

  const size_t submissions = DispatchCoordinator::Assign(batches, options_.policy).size();
  if (options_.require_durable_for_multi_buy && IsBuySide(request.direction) && submissions > 1 && !request.anchor.IsDurable()) {
    throw InvalidParameter("racing " + std::to_string(submissions) + " copies of a " + TradeDirectionName(request.direction) +
                           " requires a durable nonce anchor");
  }
  return batches;
}

ExecutionResult ExecutionEngine::Execute(const ExecuteRequest& request) {
  const auto start = std::chrono::steady_clock::now();
  const auto batches = Plan(request);

  for (const auto& b : batches) {
    for (const auto& v : b.variants) {
      StructuredLogger::Instance().LogEvent("tx_built", {
        {"provider", b.provider->Id()}, {"strategy", StrategyKindName(v.kind)}, {"signature", v.signature},
        {"size", v.serialized.size()}, {"cu_limit", v.fee.cu_limit}, {"cu_price", v.fee.cu_price}, {"tip", v.fee.tip}});
    }
  }

  const auto outcomes = coordinator_.SubmitAll(batches);
  ExecutionResult result = tracker_.Track(outcomes, request.mode, request.anchor.IsDurable());

  const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
  nlohmann::json j = {
    {"direction", TradeDirectionName(request.direction)},
    {"success", result.overall_success},
    {"signatures", result.signatures},
    {"submissions", outcomes.size()},
    {"elapsed_ms", elapsed_ms},
    {"mode", request.mode == ExecutionMode::DispatchOnly ? "dispatch_only" : "confirm"}};
  if (result.last_error) j["last_error"] = result.last_error->ToString();
  StructuredLogger::Instance().LogEvent("execution_result", j);

  if (result.overall_success) {
    Logger::Info(std::string(TradeDirectionName(request.direction)) + " succeeded with " + std::to_string(result.signatures.size()) +
                 " signature(s) in " + std::to_string(elapsed_ms) + "ms");
  } else {
    Logger::Warning(std::string(TradeDirectionName(request.direction)) + " failed in " + std::to_string(elapsed_ms) + "ms: " +
                    (result.last_error ? result.last_error->ToString() : std::string("unknown error")));
  }
  return result;
}
