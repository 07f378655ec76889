#pragma once
#include "encoding/tx_codec.hpp"
#include "gas/fee_strategy_store.hpp"
#include <string>

// One signed, serialized transaction ready for a relay.
struct TransactionVariant {
  Bytes serialized;
  std::string signature;     // base58 of the payer signature
  StrategyKind kind = StrategyKind::Normal;
  FeeParameters fee;         // tip reflects what was actually paid
  ProviderKind target_provider = ProviderKind::Default;
  std::string tip_account;   // base58, empty when no tip transfer was added
};
