#include "crypto/ed25519.hpp"
#include <cryptopp/xed25519.h>
#include <cryptopp/cryptlib.h>
#include <algorithm>
#include <stdexcept>

namespace Crypto {
  Ed25519PublicKey Ed25519PublicKeyFromSeed(const Ed25519Seed& seed) {
    CryptoPP::ed25519::Signer signer(seed.data());
    const auto& priv = dynamic_cast<const CryptoPP::ed25519PrivateKey&>(signer.GetPrivateKey());
    Ed25519PublicKey pub{};
    std::copy(priv.GetPublicKeyBytePtr(), priv.GetPublicKeyBytePtr() + pub.size(), pub.begin());
    return pub;
  }

  Ed25519Signature Ed25519Sign(const Ed25519Seed& seed, const unsigned char* message, size_t len) {
    CryptoPP::ed25519::Signer signer(seed.data());
    Ed25519Signature sig{};
    size_t written = signer.SignMessage(CryptoPP::NullRNG(), message, len, sig.data());
    if (written != sig.size()) throw std::runtime_error("ed25519 signature has unexpected length");
    return sig;
  }

  bool Ed25519Verify(const Ed25519PublicKey& pub, const unsigned char* message, size_t len, const Ed25519Signature& sig) {
    CryptoPP::ed25519::Verifier verifier(pub.data());
    return verifier.VerifyMessage(message, len, sig.data(), sig.size());
  }
}
