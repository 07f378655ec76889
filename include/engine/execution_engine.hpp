#pragma once
#include "assembly/transaction_assembler.hpp"
#include "encoding/buffer_pool.hpp"
#include "gas/fee_strategy_store.hpp"
#include "net/confirmation_tracker.hpp"
#include "net/dispatch_coordinator.hpp"
#include "scheduler/thread_pool.hpp"
#include <vector>

class ProviderRegistry;
class LedgerClient;
class Signer;

struct ExecuteRequest {
  std::vector<Instruction> instructions; // finished business instructions
  TradeDirection direction = TradeDirection::Buy;
  uint64_t trade_amount = 0;
  ValidityAnchor anchor;
  const Signer* payer = nullptr;
  std::vector<const Signer*> extra_signers;
  bool with_tip = true; // false routes through the Default provider only
  ExecutionMode mode = ExecutionMode::WaitForConfirmation;
};

struct EngineOptions {
  RaceAssignmentPolicy policy = RaceAssignmentPolicy::Broadcast;
  TrackerOptions tracker;
  bool sandwich_guard = false;     // Jito submissions only
  size_t workers = 16;
  int first_core = -1;
  // More than one in-flight copy of a buy without a durable nonce could fill twice
  bool require_durable_for_multi_buy = true;
  size_t buffer_pool_capacity = SerializationBufferPool::kDefaultCapacity;
  size_t buffer_size = SerializationBufferPool::kDefaultBufferSize;
};

// Races one logical trade across every enabled relay.
//
// Execute() throws EngineError only for invalid input or when no provider or
// fee strategy is usable. Losing or failing race paths are reported through
// ExecutionResult, never thrown.
class ExecutionEngine {
public:
  ExecutionEngine(ProviderRegistry& registry, FeeStrategyStore& store, LedgerClient& ledger,
                  EngineOptions options = EngineOptions());

  ExecutionResult Execute(const ExecuteRequest& request);
  // Assembles every variant for every usable provider without sending anything
  std::vector<ProviderBatch> Plan(const ExecuteRequest& request);

  void SetOnSigned(OnSignedFn fn, CallbackMode mode) { coordinator_.SetOnSigned(std::move(fn), mode); }

  const EngineOptions& Options() const { return options_; }
  const SerializationBufferPool& BufferPool() const { return buffers_; }

private:
  std::vector<RelayProvider*> SelectProviders(const ExecuteRequest& request) const;

  ProviderRegistry& registry_;
  FeeStrategyStore& store_;
  EngineOptions options_;
  ThreadPool pool_;
  SerializationBufferPool buffers_;
  TransactionAssembler assembler_;
  DispatchCoordinator coordinator_;
  ConfirmationTracker tracker_;
};
