#include "assembly/transaction_assembler.hpp"
#include "encoding/buffer_pool.hpp"
#include "encoding/builtin_programs.hpp"
#include "gas/fee_strategy_store.hpp"
#include "common/errors.hpp"
#include "utils/text_encoding.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>

namespace {
  class TransactionAssemblerTest : public ::testing::Test {
  protected:
    TransactionAssemblerTest() : pool_(8, 1024), assembler_(pool_), payer_(MakeSigner(1)) {}

    Instruction Business() const {
      Instruction ix;
      ix.program_id = MakeKey(0x77);
      ix.accounts = {AccountMeta{payer_.Pubkey(), true, true}, AccountMeta{MakeKey(0x20), false, true}};
      ix.data = {1, 2, 3};
      return ix;
    }

    AssemblyRequest Request(std::vector<StrategyEntry> strategies) const {
      AssemblyRequest req;
      req.instructions = {Business()};
      req.anchor = ValidityAnchor::UsingRecentCheckpoint(MakeKey(3));
      req.strategies = std::move(strategies);
      req.payer = &payer_;
      req.tip_account = MakeKey(0x55);
      req.trade_amount = 1000;
      req.target_provider = ProviderKind::Jito;
      return req;
    }

    static std::vector<Instruction> Decode(const TransactionVariant& v) {
      const DecodedTransaction tx = TxCodec::DecodeTransaction(v.serialized);
      std::vector<Instruction> out;
      for (size_t i = 0; i < tx.message.instructions.size(); ++i) out.push_back(TxCodec::DecompileInstruction(tx.message, i));
      return out;
    }

    static StrategyEntry Normal(double tip, uint64_t price = 1000, size_t max_size = 1232) {
      return StrategyEntry{ProviderKind::Jito, TradeDirection::Buy, StrategyKind::Normal, FeeParameters{200000, price, tip, max_size}};
    }

    SerializationBufferPool pool_;
    TransactionAssembler assembler_;
    Signer payer_;
  };
}

TEST_F(TransactionAssemblerTest, NormalStrategyYieldsOneVariantInInstructionOrder) {
  const auto variants = assembler_.Assemble(Request({Normal(0.001)}));
  ASSERT_EQ(variants.size(), 1u);
  const auto& v = variants[0];
  EXPECT_EQ(v.kind, StrategyKind::Normal);
  EXPECT_EQ(v.target_provider, ProviderKind::Jito);
  EXPECT_EQ(v.tip_account, MakeKey(0x55).ToBase58());
  EXPECT_FALSE(v.signature.empty());

  const auto ixs = Decode(v);
  ASSERT_EQ(ixs.size(), 4u);
  EXPECT_EQ(ComputeBudgetProgram::ReadComputeUnitLimit(ixs[0]).value_or(0), 200000u);
  EXPECT_EQ(ComputeBudgetProgram::ReadComputeUnitPrice(ixs[1]).value_or(0), 1000u);
  EXPECT_EQ(SystemProgram::TransferLamports(ixs[2]), 1000000u);
  EXPECT_EQ(ixs[2].accounts[1].pubkey, MakeKey(0x55));
  EXPECT_EQ(ixs[3].program_id, MakeKey(0x77));
  EXPECT_EQ(ixs[3].data, (Bytes{1, 2, 3}));

  // signature field is the payer signature of the wire transaction
  const DecodedTransaction tx = TxCodec::DecodeTransaction(v.serialized);
  EXPECT_EQ(TextEncoding::EncodeBase58(tx.signatures[0].data(), 64), v.signature);
  EXPECT_TRUE(Crypto::Ed25519Verify(payer_.Pubkey().bytes, tx.message_bytes.data(), tx.message_bytes.size(), tx.signatures[0]));
}

TEST_F(TransactionAssemblerTest, RacePairHasInverseFeesAndSameBusinessInstructions) {
  FeeStrategyStore store;
  store.SetRace(ProviderKind::Jito, TradeDirection::Sell, 150000, 500, 50000, 0.0001, 0.01, 262144);
  const auto variants = assembler_.Assemble(Request(store.Lookup(ProviderKind::Jito, TradeDirection::Sell)));
  ASSERT_EQ(variants.size(), 2u);

  EXPECT_EQ(variants[0].kind, StrategyKind::LowTipHighPriorityFee);
  EXPECT_DOUBLE_EQ(variants[0].fee.tip, 0.0001);
  EXPECT_EQ(variants[0].fee.cu_price, 50000u);
  EXPECT_EQ(variants[1].kind, StrategyKind::HighTipLowPriorityFee);
  EXPECT_DOUBLE_EQ(variants[1].fee.tip, 0.01);
  EXPECT_EQ(variants[1].fee.cu_price, 500u);
  EXPECT_NE(variants[0].signature, variants[1].signature);

  const auto low = Decode(variants[0]);
  const auto high = Decode(variants[1]);
  ASSERT_EQ(low.size(), high.size());
  EXPECT_EQ(SystemProgram::TransferLamports(low[2]), 100000u);
  EXPECT_EQ(SystemProgram::TransferLamports(high[2]), 10000000u);
  EXPECT_EQ(ComputeBudgetProgram::ReadComputeUnitPrice(low[1]).value_or(0), 50000u);
  EXPECT_EQ(ComputeBudgetProgram::ReadComputeUnitPrice(high[1]).value_or(0), 500u);
  EXPECT_EQ(low.back().program_id, high.back().program_id);
  EXPECT_EQ(low.back().data, high.back().data);
  EXPECT_EQ(TxCodec::DecodeTransaction(variants[0].serialized).message.recent_blockhash,
            TxCodec::DecodeTransaction(variants[1].serialized).message.recent_blockhash);
}

TEST_F(TransactionAssemblerTest, AssemblyIsDeterministicExceptForTheAnchor) {
  const auto req = Request({Normal(0.001)});
  const auto a = assembler_.Assemble(req);
  const auto b = assembler_.Assemble(req);
  EXPECT_EQ(a[0].serialized, b[0].serialized);
  EXPECT_EQ(a[0].signature, b[0].signature);

  auto moved = req;
  moved.anchor = ValidityAnchor::UsingRecentCheckpoint(MakeKey(4));
  EXPECT_NE(assembler_.Assemble(moved)[0].serialized, a[0].serialized);
}

TEST_F(TransactionAssemblerTest, DurableAnchorPrependsAdvanceNonce) {
  auto req = Request({Normal(0.001)});
  req.anchor = ValidityAnchor::UsingDurableAnchor(MakeKey(0x40), payer_.Pubkey(), MakeKey(0x41));
  const auto durable = Decode(assembler_.Assemble(req)[0]);
  ASSERT_EQ(durable.size(), 5u);
  EXPECT_TRUE(SystemProgram::IsAdvanceNonce(durable[0]));
  EXPECT_EQ(durable[0].accounts[0].pubkey, MakeKey(0x40));
  EXPECT_EQ(TxCodec::DecodeTransaction(assembler_.Assemble(req)[0].serialized).message.recent_blockhash, MakeKey(0x41));

  const auto recent = Decode(assembler_.Assemble(Request({Normal(0.001)}))[0]);
  for (const auto& ix : recent) EXPECT_FALSE(SystemProgram::IsAdvanceNonce(ix));
}

TEST_F(TransactionAssemblerTest, DurableAnchorNeedsAuthoritySigner) {
  auto req = Request({Normal(0.001)});
  req.anchor = ValidityAnchor::UsingDurableAnchor(MakeKey(0x40), MakeKey(0x42), MakeKey(0x41));
  EXPECT_THROW(assembler_.Assemble(req), EngineError);

  const Signer authority = MakeSigner(9);
  req.anchor = ValidityAnchor::UsingDurableAnchor(MakeKey(0x40), authority.Pubkey(), MakeKey(0x41));
  req.extra_signers = {&authority};
  const auto variants = assembler_.Assemble(req);
  EXPECT_EQ(TxCodec::DecodeTransaction(variants[0].serialized).signatures.size(), 2u);
}

TEST_F(TransactionAssemblerTest, InvalidInputsFailBeforeSerialization) {
  auto expect_invalid = [this](const AssemblyRequest& req) {
    try {
      assembler_.Assemble(req);
      FAIL() << "expected InvalidParameter";
    } catch (const EngineError& e) {
      EXPECT_EQ(e.Kind(), ErrorKind::InvalidParameter);
    }
  };
  auto req = Request({Normal(0.001)});
  req.instructions.clear();
  expect_invalid(req);

  req = Request({Normal(0.001)});
  req.trade_amount = 0;
  expect_invalid(req);

  req = Request({Normal(0.001)});
  req.payer = nullptr;
  expect_invalid(req);

  req = Request({Normal(0.001)});
  req.instructions[0].accounts.push_back(AccountMeta{MakeKey(0x66), true, false});
  expect_invalid(req);

  req = Request({Normal(0.001), Normal(0.002)});
  expect_invalid(req);

  req = Request({});
  expect_invalid(req);

  req = Request({Normal(0.001)});
  req.anchor = ValidityAnchor();
  expect_invalid(req);

  EXPECT_EQ(pool_.Stats().available, 8u);
}

TEST_F(TransactionAssemblerTest, OversizedTransactionIsASerializationFailure) {
  try {
    assembler_.Assemble(Request({Normal(0.001, 1000, 100)}));
    FAIL() << "expected SerializationFailure";
  } catch (const EngineError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::SerializationFailure);
  }
  // leases went back to the pool
  EXPECT_EQ(pool_.Stats().available, 8u);
}

TEST_F(TransactionAssemblerTest, TipWithoutTipAccountIsRejected) {
  auto req = Request({Normal(0.001)});
  req.tip_account.reset();
  try {
    assembler_.Assemble(req);
    FAIL() << "expected InvalidParameter";
  } catch (const EngineError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::InvalidParameter);
  }
  EXPECT_EQ(pool_.Stats().available, 8u);
}

TEST_F(TransactionAssemblerTest, UntippedStrategyNeedsNoTipAccount) {
  auto req = Request({Normal(0.0)});
  req.tip_account.reset();
  const auto v = assembler_.Assemble(req)[0];
  EXPECT_DOUBLE_EQ(v.fee.tip, 0.0);
  EXPECT_TRUE(v.tip_account.empty());
  const auto ixs = Decode(v);
  ASSERT_EQ(ixs.size(), 3u);
  EXPECT_EQ(ixs[2].program_id, MakeKey(0x77));
}

TEST_F(TransactionAssemblerTest, SandwichGuardMarksTheTipTransfer) {
  auto req = Request({Normal(0.001)});
  req.sandwich_guard = true;
  const auto ixs = Decode(assembler_.Assemble(req)[0]);
  const PublicKey marker = PublicKey::FromBase58(kJitoDontFrontAccount);
  EXPECT_TRUE(MevProtector::HasSandwichGuard(ixs[2], marker));
  EXPECT_FALSE(MevProtector::HasSandwichGuard(ixs[3], marker));
}
