#include "assembly/transaction_assembler.hpp"
#include "encoding/buffer_pool.hpp"
#include "encoding/builtin_programs.hpp"
#include "wallet/signer.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "utils/text_encoding.hpp"
#include <algorithm>

static const Signer* FindSigner(const AssemblyRequest& req, const PublicKey& key) {
  if (req.payer && req.payer->Pubkey() == key) return req.payer;
  for (const Signer* s : req.extra_signers) {
    if (s && s->Pubkey() == key) return s;
  }
  return nullptr;
}

TransactionAssembler::TransactionAssembler(SerializationBufferPool& pool, MevProtectionConfig mev)
  : pool_(pool), mev_(std::move(mev)) {}

void TransactionAssembler::Validate(const AssemblyRequest& req) {
  if (!req.payer) throw InvalidParameter("payer signer is required");
  if (req.instructions.empty()) throw InvalidParameter("instruction set is empty");
  if (req.trade_amount == 0) throw InvalidParameter("trade amount must be greater than zero");
  if (req.anchor.hash.IsZero()) throw InvalidParameter("validity anchor hash is missing");
  if (req.anchor.IsDurable()) {
    if (req.anchor.nonce_account.IsZero()) throw InvalidParameter("durable anchor requires a nonce account");
    if (!FindSigner(req, req.anchor.nonce_authority)) {
      throw InvalidParameter("nonce authority " + req.anchor.nonce_authority.ToBase58() + " has no signer");
    }
  }
  for (size_t i = 0; i < req.instructions.size(); ++i) {
    for (const auto& meta : req.instructions[i].accounts) {
      if (meta.is_signer && !FindSigner(req, meta.pubkey)) {
        throw InvalidParameter("instruction " + std::to_string(i) + " requires signer " + meta.pubkey.ToBase58());
      }
    }
  }
  if (req.strategies.empty()) throw InvalidParameter("no fee strategy selected");
  if (req.strategies.size() > 2) throw InvalidParameter("at most two fee strategies per assembly");
  if (req.strategies.size() == 2) {
    const bool paired = req.strategies[0].kind == StrategyKind::LowTipHighPriorityFee &&
                        req.strategies[1].kind == StrategyKind::HighTipLowPriorityFee;
    if (!paired) throw InvalidParameter("two strategies must be the low-tip/high-tip race pair");
  }
  for (const auto& s : req.strategies) {
    if (s.params.cu_limit == 0) throw InvalidParameter(std::string("compute unit limit is zero for ") + StrategyKindName(s.kind));
    if (s.params.tip < 0.0) throw InvalidParameter("tip must not be negative");
    if (!req.tip_account && SolToLamports(s.params.tip) > 0) {
      throw InvalidParameter(std::string(StrategyKindName(s.kind)) + " tip of " + std::to_string(s.params.tip) +
                             " SOL has no tip account");
    }
  }
}

std::vector<Instruction> TransactionAssembler::BuildInstructions(const AssemblyRequest& req, const FeeParameters& fee) const {
  std::vector<Instruction> ixs;
  ixs.reserve(req.instructions.size() + 4);
  if (req.anchor.IsDurable()) {
    ixs.push_back(SystemProgram::AdvanceNonceAccount(req.anchor.nonce_account, req.anchor.nonce_authority));
  }
  ixs.push_back(ComputeBudgetProgram::SetComputeUnitLimit(fee.cu_limit));
  ixs.push_back(ComputeBudgetProgram::SetComputeUnitPrice(fee.cu_price));
  const uint64_t tip_lamports = SolToLamports(fee.tip);
  if (req.tip_account && tip_lamports > 0) {
    Instruction tip = SystemProgram::Transfer(req.payer->Pubkey(), *req.tip_account, tip_lamports);
    if (req.sandwich_guard) mev_.ApplySandwichGuard(tip);
    ixs.push_back(std::move(tip));
  }
  ixs.insert(ixs.end(), req.instructions.begin(), req.instructions.end());
  return ixs;
}

TransactionVariant TransactionAssembler::BuildVariant(const AssemblyRequest& req, const StrategyEntry& entry) const {
  const auto ixs = BuildInstructions(req, entry.params);
  const Message msg = TxCodec::CompileMessage(req.payer->Pubkey(), ixs, req.anchor.hash);

  BufferLease message_lease = pool_.Borrow();
  Bytes& message_bytes = message_lease.Buffer();
  TxCodec::EncodeMessage(msg, message_bytes);

  std::vector<Signature> signatures;
  signatures.reserve(msg.header.num_required_signatures);
  for (size_t i = 0; i < msg.header.num_required_signatures; ++i) {
    const Signer* signer = FindSigner(req, msg.account_keys[i]);
    if (!signer) throw InvalidParameter("missing signer for " + msg.account_keys[i].ToBase58());
    signatures.push_back(signer->Sign(message_bytes));
  }

  BufferLease tx_lease = pool_.Borrow();
  Bytes& wire = tx_lease.Buffer();
  TxCodec::EncodeTransaction(signatures, message_bytes, wire);
  if (entry.params.max_tx_size > 0 && wire.size() > entry.params.max_tx_size) {
    throw EngineError(ErrorKind::SerializationFailure,
                      "transaction is " + std::to_string(wire.size()) + " bytes, limit " + std::to_string(entry.params.max_tx_size));
  }

  TransactionVariant v;
  v.serialized.assign(wire.begin(), wire.end());
  v.signature = TextEncoding::EncodeBase58(signatures.front().data(), signatures.front().size());
  v.kind = entry.kind;
  v.fee = entry.params;
  v.target_provider = req.target_provider;
  const bool tipped = req.tip_account && SolToLamports(entry.params.tip) > 0;
  if (tipped) v.tip_account = req.tip_account->ToBase58();
  else v.fee.tip = 0.0;
  return v;
}

std::vector<TransactionVariant> TransactionAssembler::Assemble(const AssemblyRequest& request) const {
  Validate(request);
  std::vector<TransactionVariant> out;
  out.reserve(request.strategies.size());
  for (const auto& entry : request.strategies) {
    out.push_back(BuildVariant(request, entry));
    Logger::Debug(std::string("Assembled ") + StrategyKindName(entry.kind) + " variant for " +
                  ProviderKindName(request.target_provider) + " sig=" + out.back().signature +
                  " size=" + std::to_string(out.back().serialized.size()));
  }
  return out;
}
