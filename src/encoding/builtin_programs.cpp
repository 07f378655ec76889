#include "encoding/builtin_programs.hpp"
#include <cmath>

namespace {
  constexpr uint32_t kSystemTransfer = 2;
  constexpr uint32_t kSystemAdvanceNonce = 4;
  constexpr unsigned char kSetComputeUnitLimit = 2;
  constexpr unsigned char kSetComputeUnitPrice = 3;

  void PutLe(Bytes& out, uint64_t v, int width) {
    for (int i = 0; i < width; ++i) out.push_back(static_cast<unsigned char>((v >> (8 * i)) & 0xFF));
  }

  uint64_t GetLe(const Bytes& in, size_t offset, int width) {
    uint64_t v = 0;
    for (int i = 0; i < width; ++i) v |= static_cast<uint64_t>(in[offset + i]) << (8 * i);
    return v;
  }
}

namespace SystemProgram {
  const PublicKey& Id() {
    static const PublicKey id = PublicKey::FromBase58("11111111111111111111111111111111");
    return id;
  }

  const PublicKey& RecentBlockhashesSysvar() {
    static const PublicKey id = PublicKey::FromBase58("SysvarRecentB1ockHashes11111111111111111111");
    return id;
  }

  Instruction Transfer(const PublicKey& from, const PublicKey& to, uint64_t lamports) {
    Instruction ix;
    ix.program_id = Id();
    ix.accounts = {AccountMeta{from, true, true}, AccountMeta{to, false, true}};
    PutLe(ix.data, kSystemTransfer, 4);
    PutLe(ix.data, lamports, 8);
    return ix;
  }

  Instruction AdvanceNonceAccount(const PublicKey& nonce_account, const PublicKey& authority) {
    Instruction ix;
    ix.program_id = Id();
    ix.accounts = {
      AccountMeta{nonce_account, false, true},
      AccountMeta{RecentBlockhashesSysvar(), false, false},
      AccountMeta{authority, true, false},
    };
    PutLe(ix.data, kSystemAdvanceNonce, 4);
    return ix;
  }

  bool IsAdvanceNonce(const Instruction& ix) {
    return ix.program_id == Id() && ix.data.size() == 4 && GetLe(ix.data, 0, 4) == kSystemAdvanceNonce;
  }

  uint64_t TransferLamports(const Instruction& ix) {
    if (ix.program_id != Id() || ix.data.size() != 12 || GetLe(ix.data, 0, 4) != kSystemTransfer) return 0;
    return GetLe(ix.data, 4, 8);
  }
}

namespace ComputeBudgetProgram {
  const PublicKey& Id() {
    static const PublicKey id = PublicKey::FromBase58("ComputeBudget111111111111111111111111111111");
    return id;
  }

  Instruction SetComputeUnitLimit(uint32_t units) {
    Instruction ix;
    ix.program_id = Id();
    ix.data.push_back(kSetComputeUnitLimit);
    PutLe(ix.data, units, 4);
    return ix;
  }

  Instruction SetComputeUnitPrice(uint64_t micro_lamports) {
    Instruction ix;
    ix.program_id = Id();
    ix.data.push_back(kSetComputeUnitPrice);
    PutLe(ix.data, micro_lamports, 8);
    return ix;
  }

  std::optional<uint32_t> ReadComputeUnitLimit(const Instruction& ix) {
    if (ix.program_id != Id() || ix.data.size() != 5 || ix.data[0] != kSetComputeUnitLimit) return std::nullopt;
    return static_cast<uint32_t>(GetLe(ix.data, 1, 4));
  }

  std::optional<uint64_t> ReadComputeUnitPrice(const Instruction& ix) {
    if (ix.program_id != Id() || ix.data.size() != 9 || ix.data[0] != kSetComputeUnitPrice) return std::nullopt;
    return GetLe(ix.data, 1, 8);
  }
}

uint64_t SolToLamports(double sol) {
  if (!(sol > 0.0)) return 0;
  return static_cast<uint64_t>(std::llround(sol * static_cast<double>(kLamportsPerSol)));
}

double LamportsToSol(uint64_t lamports) {
  return static_cast<double>(lamports) / static_cast<double>(kLamportsPerSol);
}
