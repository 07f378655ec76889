#pragma once
#include <array>
#include <cstddef>
#include <vector>

namespace Crypto {
  using Ed25519Seed = std::array<unsigned char, 32>;
  using Ed25519PublicKey = std::array<unsigned char, 32>;
  using Ed25519Signature = std::array<unsigned char, 64>;

  Ed25519PublicKey Ed25519PublicKeyFromSeed(const Ed25519Seed& seed);
  // Deterministic: the same seed and message always produce the same signature
  Ed25519Signature Ed25519Sign(const Ed25519Seed& seed, const unsigned char* message, size_t len);
  bool Ed25519Verify(const Ed25519PublicKey& pub, const unsigned char* message, size_t len, const Ed25519Signature& sig);
}
