#include "wallet/nonce_manager.hpp"
#include "node_connection/ledger_client.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>

static uint64_t ReadLe(const std::vector<unsigned char>& data, size_t offset, int width) {
  uint64_t v = 0;
  for (int i = 0; i < width; ++i) v |= static_cast<uint64_t>(data[offset + i]) << (8 * i);
  return v;
}

DurableNonceInfo NonceManager::Parse(const PublicKey& nonce_account, const std::vector<unsigned char>& data) {
  if (data.size() < kNonceAccountSize) {
    throw InvalidParameter("account " + nonce_account.ToBase58() + " is too small to be a nonce account");
  }
  const uint64_t state = ReadLe(data, 4, 4);
  if (state != 1) {
    throw InvalidParameter("nonce account " + nonce_account.ToBase58() + " is not initialized");
  }
  DurableNonceInfo info;
  info.nonce_account = nonce_account;
  std::copy(data.begin() + 8, data.begin() + 40, info.authority.bytes.begin());
  std::copy(data.begin() + 40, data.begin() + 72, info.nonce.bytes.begin());
  info.lamports_per_signature = ReadLe(data, 72, 8);
  return info;
}

DurableNonceInfo NonceManager::Fetch(const PublicKey& nonce_account) {
  auto data = ledger_.GetAccountData(nonce_account.ToBase58());
  if (!data) throw InvalidParameter("nonce account " + nonce_account.ToBase58() + " does not exist");
  auto info = Parse(nonce_account, *data);
  Logger::Debug("Durable nonce " + nonce_account.ToBase58() + " -> " + info.nonce.ToBase58());
  return info;
}
