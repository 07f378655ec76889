#include "swqos/provider.hpp"
#include "common/logger.hpp"
#include <random>

RelayProvider::RelayProvider(ProviderKind kind, std::string id, std::string endpoint,
                             std::vector<PublicKey> tip_accounts, double min_tip, bool disabled)
  : kind_(kind), id_(std::move(id)), endpoint_(std::move(endpoint)),
    tip_accounts_(std::move(tip_accounts)), min_tip_(min_tip), disabled_(disabled) {}

SubmissionOutcome RelayProvider::MakeOutcome(const TransactionVariant& variant, size_t variant_index) const {
  SubmissionOutcome outcome;
  outcome.provider_id = id_;
  outcome.provider_kind = kind_;
  outcome.variant_index = variant_index;
  outcome.strategy = variant.kind;
  return outcome;
}

ErrorInfo RelayProvider::Unavailable(const std::string& source, const std::string& message) {
  ErrorInfo e;
  e.kind = ErrorKind::ProviderUnavailable;
  e.source = source;
  e.message = message;
  return e;
}

SubmissionOutcome RelayProvider::Submit(const TransactionVariant& variant, size_t variant_index) {
  SubmissionOutcome outcome = MakeOutcome(variant, variant_index);
  if (disabled_) {
    outcome.error = Unavailable(id_, "provider is disabled");
  } else {
    try {
      Send(variant, outcome);
    } catch (const std::exception& ex) {
      outcome.signature.reset();
      outcome.error = Unavailable(id_, ex.what());
    }
  }
  outcome.timestamp = std::chrono::system_clock::now();
  if (outcome.error) {
    Logger::Warning("Submit via " + id_ + " failed: " + outcome.error->message);
  } else {
    Logger::Debug("Submit via " + id_ + " accepted " + outcome.signature.value_or(""));
  }
  return outcome;
}

std::vector<SubmissionOutcome> RelayProvider::SubmitBatch(const std::vector<TransactionVariant>& variants) {
  std::vector<SubmissionOutcome> out;
  out.reserve(variants.size());
  for (size_t i = 0; i < variants.size(); ++i) out.push_back(Submit(variants[i], i));
  return out;
}

std::optional<PublicKey> RelayProvider::TipAccount() const {
  if (tip_accounts_.empty()) return std::nullopt;
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<size_t> pick(0, tip_accounts_.size() - 1);
  return tip_accounts_[pick(rng)];
}
