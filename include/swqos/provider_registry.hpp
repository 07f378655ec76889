#pragma once
#include "swqos/provider.hpp"
#include <memory>
#include <set>
#include <vector>

class HttpClient;
class LedgerClient;

// Relay clients built once from configuration and read-only afterwards.
// Denylisted kinds become DisabledRelay objects instead of disappearing.
class ProviderRegistry {
public:
  ProviderRegistry(HttpClient& http,
                   LedgerClient& ledger,
                   const std::vector<ProviderConfig>& configs,
                   const std::set<ProviderKind>& denylist,
                   int submit_timeout_ms = 3000);
  // Takes prebuilt providers, mainly for tests and embedding
  explicit ProviderRegistry(std::vector<std::unique_ptr<RelayProvider>> providers);

  const std::vector<std::unique_ptr<RelayProvider>>& All() const { return providers_; }
  std::vector<RelayProvider*> Enabled() const;
  RelayProvider* Find(const std::string& id) const;
  size_t Size() const { return providers_.size(); }
  size_t DisabledCount() const;
private:
  std::vector<std::unique_ptr<RelayProvider>> providers_;
};
