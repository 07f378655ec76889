#include "wallet/signer.hpp"
#include "utils/text_encoding.hpp"
#include <algorithm>
#include <stdexcept>

Signer::Signer(const Crypto::Ed25519Seed& seed) : seed_(seed) {
  pubkey_.bytes = Crypto::Ed25519PublicKeyFromSeed(seed_);
}

Signer Signer::FromBase58(const std::string& secret) {
  if (secret.empty()) throw std::invalid_argument("empty secret key");
  auto raw = TextEncoding::DecodeBase58(secret);
  if (raw.size() != 32 && raw.size() != 64) throw std::invalid_argument("invalid secret key length");
  Crypto::Ed25519Seed seed{};
  std::copy(raw.begin(), raw.begin() + 32, seed.begin());
  Signer signer(seed);
  if (raw.size() == 64 && !std::equal(raw.begin() + 32, raw.end(), signer.pubkey_.bytes.begin())) {
    throw std::invalid_argument("keypair public half does not match its seed");
  }
  return signer;
}

Signature Signer::Sign(const Bytes& message) const {
  return Crypto::Ed25519Sign(seed_, message.data(), message.size());
}
