#pragma once
#include "encoding/tx_codec.hpp"
#include <string>

constexpr const char* kJitoDontFrontAccount = "jitodontfront111111111111111111111111111111";

struct MevProtectionConfig {
  // Block engines refuse to bundle a transaction that references the marker
  // account anywhere but first in the bundle, which rules out sandwiching.
  bool enable_sandwich_guard = false;
  std::string dont_front_account = kJitoDontFrontAccount;
};

class MevProtector {
public:
  explicit MevProtector(MevProtectionConfig cfg);
  bool Enabled() const { return cfg_.enable_sandwich_guard; }
  const PublicKey& MarkerAccount() const { return marker_; }
  // Appends the marker as a read-only, non-signer account of ix
  void ApplySandwichGuard(Instruction& ix) const;
  static bool HasSandwichGuard(const Instruction& ix, const PublicKey& marker);
private:
  MevProtectionConfig cfg_;
  PublicKey marker_;
};
