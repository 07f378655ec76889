#pragma once
#include "crypto/ed25519.hpp"
#include "encoding/tx_codec.hpp"
#include <string>

// ed25519 signing key supplied by the caller. The engine never creates or stores keys.
class Signer {
public:
  explicit Signer(const Crypto::Ed25519Seed& seed);
  // Base58 of either the 32-byte seed or the 64-byte seed||pubkey keypair form
  static Signer FromBase58(const std::string& secret);

  const PublicKey& Pubkey() const { return pubkey_; }
  Signature Sign(const Bytes& message) const;
private:
  Crypto::Ed25519Seed seed_;
  PublicKey pubkey_;
};
