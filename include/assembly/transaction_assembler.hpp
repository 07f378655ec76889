#pragma once
#include "assembly/transaction_variant.hpp"
#include "assembly/validity_anchor.hpp"
#include "mev/protection.hpp"
#include <optional>
#include <vector>

class SerializationBufferPool;
class Signer;

struct AssemblyRequest {
  std::vector<Instruction> instructions;      // business instructions, kept in order
  ValidityAnchor anchor;
  std::vector<StrategyEntry> strategies;      // one entry, or the Low/High race pair
  const Signer* payer = nullptr;
  std::vector<const Signer*> extra_signers;
  std::optional<PublicKey> tip_account;       // no tip transfer when absent
  uint64_t trade_amount = 0;
  bool sandwich_guard = false;
  ProviderKind target_provider = ProviderKind::Default;
};

// Builds [advance nonce] + compute budget + [tip] + business instructions,
// signs, and serializes through the buffer pool. Throws EngineError with
// InvalidParameter or SerializationFailure before anything is sent.
class TransactionAssembler {
public:
  TransactionAssembler(SerializationBufferPool& pool, MevProtectionConfig mev = MevProtectionConfig());

  std::vector<TransactionVariant> Assemble(const AssemblyRequest& request) const;
  static void Validate(const AssemblyRequest& request);

  // Instruction list for one strategy entry, before compilation
  std::vector<Instruction> BuildInstructions(const AssemblyRequest& request, const FeeParameters& fee) const;
private:
  TransactionVariant BuildVariant(const AssemblyRequest& request, const StrategyEntry& entry) const;

  SerializationBufferPool& pool_;
  MevProtector mev_;
};
