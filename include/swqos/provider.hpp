#pragma once
#include "assembly/transaction_variant.hpp"
#include "common/errors.hpp"
#include "swqos/provider_kind.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct ProviderConfig {
  ProviderKind kind = ProviderKind::Default;
  std::string region;                     // Jito block-engine region, empty for default
  std::string endpoint;                   // overrides the region endpoint when set
  std::string credential;                 // auth token or "Header: value"
  std::vector<std::string> tip_accounts;  // overrides the built-in pool when set
  std::optional<double> min_tip;          // SOL, strategies below it are skipped
};

struct SubmissionOutcome {
  std::string provider_id;
  ProviderKind provider_kind = ProviderKind::Default;
  std::optional<std::string> signature;
  std::optional<ErrorInfo> error;
  std::chrono::system_clock::time_point timestamp;
  size_t variant_index = 0;
  StrategyKind strategy = StrategyKind::Normal;

  bool Accepted() const { return signature.has_value() && !error.has_value(); }
};

// One relay service. Submit() never throws: every failure ends up in the
// outcome. Concrete relays are final and live in swqos/relays.hpp.
class RelayProvider {
public:
  virtual ~RelayProvider() = default;

  SubmissionOutcome Submit(const TransactionVariant& variant, size_t variant_index = 0);
  virtual std::vector<SubmissionOutcome> SubmitBatch(const std::vector<TransactionVariant>& variants);

  // Uniformly random entry of the tip-account pool, nullopt for an empty pool
  std::optional<PublicKey> TipAccount() const;
  const std::vector<PublicKey>& TipAccounts() const { return tip_accounts_; }

  const std::string& Id() const { return id_; }
  ProviderKind Kind() const { return kind_; }
  const std::string& Endpoint() const { return endpoint_; }
  bool Disabled() const { return disabled_; }
  double MinTip() const { return min_tip_; }

protected:
  RelayProvider(ProviderKind kind, std::string id, std::string endpoint,
                std::vector<PublicKey> tip_accounts, double min_tip, bool disabled);

  // Performs the network call. May throw; Submit() converts exceptions into outcome errors.
  virtual void Send(const TransactionVariant& variant, SubmissionOutcome& outcome) = 0;

  SubmissionOutcome MakeOutcome(const TransactionVariant& variant, size_t variant_index) const;
  static ErrorInfo Unavailable(const std::string& source, const std::string& message);

private:
  ProviderKind kind_;
  std::string id_;
  std::string endpoint_;
  std::vector<PublicKey> tip_accounts_;
  double min_tip_;
  bool disabled_;
};
