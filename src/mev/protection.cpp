#include "mev/protection.hpp"
#include <algorithm>

MevProtector::MevProtector(MevProtectionConfig cfg)
  : cfg_(std::move(cfg)), marker_(PublicKey::FromBase58(cfg_.dont_front_account)) {}

void MevProtector::ApplySandwichGuard(Instruction& ix) const {
  if (HasSandwichGuard(ix, marker_)) return;
  ix.accounts.push_back(AccountMeta{marker_, false, false});
}

bool MevProtector::HasSandwichGuard(const Instruction& ix, const PublicKey& marker) {
  return std::any_of(ix.accounts.begin(), ix.accounts.end(),
                     [&](const AccountMeta& m){ return m.pubkey == marker && !m.is_signer && !m.is_writable; });
}
