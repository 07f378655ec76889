#pragma once
#include "assembly/validity_anchor.hpp"
#include <cstdint>
#include <vector>

class LedgerClient;

struct DurableNonceInfo {
  PublicKey nonce_account;
  PublicKey authority;
  Blockhash nonce;
  uint64_t lamports_per_signature = 0;

  ValidityAnchor ToAnchor() const {
    return ValidityAnchor::UsingDurableAnchor(nonce_account, authority, nonce);
  }
};

// Reads durable nonce accounts through the ledger interface.
class NonceManager {
public:
  static constexpr size_t kNonceAccountSize = 80;

  explicit NonceManager(LedgerClient& ledger) : ledger_(ledger) {}
  // Throws EngineError(InvalidParameter) when the account is missing or not an initialized nonce
  DurableNonceInfo Fetch(const PublicKey& nonce_account);
  // Layout: version u32, state u32, authority [32], nonce [32], lamports_per_signature u64
  static DurableNonceInfo Parse(const PublicKey& nonce_account, const std::vector<unsigned char>& data);
private:
  LedgerClient& ledger_;
};
