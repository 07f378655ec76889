#pragma once
#include "encoding/tx_codec.hpp"
#include <cstdint>
#include <optional>

namespace SystemProgram {
  const PublicKey& Id();
  const PublicKey& RecentBlockhashesSysvar();
  Instruction Transfer(const PublicKey& from, const PublicKey& to, uint64_t lamports);
  Instruction AdvanceNonceAccount(const PublicKey& nonce_account, const PublicKey& authority);
  bool IsAdvanceNonce(const Instruction& ix);
  // Lamport amount of a transfer instruction, 0 for anything else
  uint64_t TransferLamports(const Instruction& ix);
}

namespace ComputeBudgetProgram {
  const PublicKey& Id();
  Instruction SetComputeUnitLimit(uint32_t units);
  Instruction SetComputeUnitPrice(uint64_t micro_lamports);
  std::optional<uint32_t> ReadComputeUnitLimit(const Instruction& ix);
  std::optional<uint64_t> ReadComputeUnitPrice(const Instruction& ix);
}

constexpr uint64_t kLamportsPerSol = 1'000'000'000ULL;
uint64_t SolToLamports(double sol);
double LamportsToSol(uint64_t lamports);
