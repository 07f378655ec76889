#pragma once
#include "swqos/provider.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

class ThreadPool;

// How the two race variants are spread over race-capable providers.
// Broadcast: every provider sends both. Split: providers alternate between the
// low-tip and high-tip variant in registry order; a lone provider sends both.
enum class RaceAssignmentPolicy { Broadcast, Split };

const char* RaceAssignmentPolicyName(RaceAssignmentPolicy policy);
std::optional<RaceAssignmentPolicy> ParseRaceAssignmentPolicy(const std::string& name);

// Sync: runs before the send, a throw blocks that one submission.
// Async: runs on the pool, failures are only logged.
enum class CallbackMode { Sync, Async };

struct SignedTransactionContext {
  std::string provider_id;
  ProviderKind provider_kind = ProviderKind::Default;
  std::string signature;
  StrategyKind strategy = StrategyKind::Normal;
  FeeParameters fee;
  std::string tip_account;
  std::string base64_tx;
  int64_t timestamp_ns = 0;
};

using OnSignedFn = std::function<void(const SignedTransactionContext&)>;

struct ProviderBatch {
  RelayProvider* provider = nullptr;
  std::vector<TransactionVariant> variants; // one Normal variant or the Low/High pair
};

struct Assignment {
  RelayProvider* provider = nullptr;
  const TransactionVariant* variant = nullptr;
  size_t variant_index = 0;
};

class DispatchCoordinator {
public:
  DispatchCoordinator(ThreadPool& pool, RaceAssignmentPolicy policy = RaceAssignmentPolicy::Broadcast);

  void SetOnSigned(OnSignedFn fn, CallbackMode mode);
  RaceAssignmentPolicy Policy() const { return policy_; }

  static std::vector<Assignment> Assign(const std::vector<ProviderBatch>& batches, RaceAssignmentPolicy policy);

  // One concurrent task per assignment. Waits for all of them and returns every
  // outcome in completion order. A failing provider never stops the others.
  std::vector<SubmissionOutcome> SubmitAll(const std::vector<ProviderBatch>& batches);

private:
  SubmissionOutcome RunOne(const Assignment& a);

  ThreadPool& pool_;
  RaceAssignmentPolicy policy_;
  OnSignedFn on_signed_;
  CallbackMode callback_mode_ = CallbackMode::Async;
};
