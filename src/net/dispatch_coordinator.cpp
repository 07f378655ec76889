#include "net/dispatch_coordinator.hpp"
#include "scheduler/thread_pool.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"
#include "utils/text_encoding.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <future>
#include <mutex>

const char* RaceAssignmentPolicyName(RaceAssignmentPolicy policy) {
  switch (policy) {
    case RaceAssignmentPolicy::Broadcast: return "broadcast";
    case RaceAssignmentPolicy::Split: return "split";
  }
  return "unknown";
}

std::optional<RaceAssignmentPolicy> ParseRaceAssignmentPolicy(const std::string& name) {
  if (name == "broadcast") return RaceAssignmentPolicy::Broadcast;
  if (name == "split") return RaceAssignmentPolicy::Split;
  return std::nullopt;
}

namespace {
  // Outcomes in the order the submissions finished
  class OutcomeCollector {
  public:
    void Push(SubmissionOutcome o) {
      std::lock_guard<std::mutex> lock(mutex_);
      outcomes_.push_back(std::move(o));
    }
    std::vector<SubmissionOutcome> Take() {
      std::lock_guard<std::mutex> lock(mutex_);
      return std::move(outcomes_);
    }
  private:
    std::mutex mutex_;
    std::vector<SubmissionOutcome> outcomes_;
  };

  int64_t NowNs() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
  }
}

DispatchCoordinator::DispatchCoordinator(ThreadPool& pool, RaceAssignmentPolicy policy)
  : pool_(pool), policy_(policy) {}

void DispatchCoordinator::SetOnSigned(OnSignedFn fn, CallbackMode mode) {
  on_signed_ = std::move(fn);
  callback_mode_ = mode;
}

std::vector<Assignment> DispatchCoordinator::Assign(const std::vector<ProviderBatch>& batches, RaceAssignmentPolicy policy) {
  size_t race_count = 0;
  for (const auto& b : batches) {
    if (b.provider && !b.provider->Disabled() && b.variants.size() == 2) ++race_count;
  }
  std::vector<Assignment> out;
  size_t race_index = 0;
  for (const auto& b : batches) {
    if (!b.provider || b.provider->Disabled() || b.variants.empty()) continue;
    if (b.variants.size() == 2 && policy == RaceAssignmentPolicy::Split && race_count > 1) {
      const size_t pick = race_index % 2;
      out.push_back(Assignment{b.provider, &b.variants[pick], pick});
    } else {
      for (size_t i = 0; i < b.variants.size(); ++i) out.push_back(Assignment{b.provider, &b.variants[i], i});
    }
    if (b.variants.size() == 2) ++race_index;
  }
  return out;
}

SubmissionOutcome DispatchCoordinator::RunOne(const Assignment& a) {
  const TransactionVariant& v = *a.variant;
  if (on_signed_) {
    SignedTransactionContext ctx;
    ctx.provider_id = a.provider->Id();
    ctx.provider_kind = a.provider->Kind();
    ctx.signature = v.signature;
    ctx.strategy = v.kind;
    ctx.fee = v.fee;
    ctx.tip_account = v.tip_account;
    ctx.base64_tx = TextEncoding::EncodeBase64(v.serialized);
    ctx.timestamp_ns = NowNs();
    if (callback_mode_ == CallbackMode::Sync) {
      try {
        on_signed_(ctx);
      } catch (const std::exception& ex) {
        SubmissionOutcome blocked;
        blocked.provider_id = a.provider->Id();
        blocked.provider_kind = a.provider->Kind();
        blocked.variant_index = a.variant_index;
        blocked.strategy = v.kind;
        blocked.timestamp = std::chrono::system_clock::now();
        blocked.error = ErrorInfo{ErrorKind::ProviderUnavailable, std::string("signed-transaction callback failed: ") + ex.what(), a.provider->Id()};
        Logger::Warning("Submission via " + a.provider->Id() + " blocked by callback: " + ex.what());
        return blocked;
      }
    } else {
      OnSignedFn fn = on_signed_;
      pool_.Enqueue([fn, ctx]{
        try {
          fn(ctx);
        } catch (const std::exception& ex) {
          Logger::Warning("Async signed-transaction callback failed for " + ctx.signature + ": " + ex.what());
        }
      });
    }
  }
  return a.provider->Submit(v, a.variant_index);
}

std::vector<SubmissionOutcome> DispatchCoordinator::SubmitAll(const std::vector<ProviderBatch>& batches) {
  const auto assignments = Assign(batches, policy_);
  OutcomeCollector collector;
  std::vector<std::future<void>> pending;
  pending.reserve(assignments.size());
  pool_.EnsureIdleWorkers(assignments.size());
  const auto start = std::chrono::steady_clock::now();
  for (const auto& a : assignments) {
    pending.push_back(pool_.Submit([this, a, &collector]{ collector.Push(RunOne(a)); }));
  }
  for (auto& f : pending) f.get();
  auto outcomes = collector.Take();

  const auto elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start).count();
  size_t accepted = 0;
  for (const auto& o : outcomes) {
    if (o.Accepted()) ++accepted;
    nlohmann::json j = {{"provider", o.provider_id}, {"strategy", StrategyKindName(o.strategy)}, {"accepted", o.Accepted()}};
    if (o.signature) j["signature"] = *o.signature;
    if (o.error) j["error"] = o.error->ToString();
    StructuredLogger::Instance().LogEvent("tx_submitted", j);
  }
  Logger::Info("Dispatched " + std::to_string(outcomes.size()) + " submissions (" + std::to_string(accepted) +
               " accepted, policy=" + RaceAssignmentPolicyName(policy_) + ") in " + std::to_string(elapsed_us) + "us");
  return outcomes;
}
