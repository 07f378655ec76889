#include "net/confirmation_tracker.hpp"
#include "scheduler/thread_pool.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <condition_variable>
#include <future>
#include <mutex>

namespace {
  // Shared between the polling tasks of one Track() call
  struct PollState {
    std::mutex mutex;
    std::condition_variable cv;
    bool stop = false;
    bool confirmed = false;
    std::optional<ErrorInfo> last_error;

    void Fail(ErrorInfo info, bool stop_all) {
      {
        std::lock_guard<std::mutex> lock(mutex);
        last_error = std::move(info);
        if (stop_all) stop = true;
      }
      if (stop_all) cv.notify_all();
    }

    void Confirm(bool stop_all) {
      {
        std::lock_guard<std::mutex> lock(mutex);
        confirmed = true;
        if (stop_all) stop = true;
      }
      if (stop_all) cv.notify_all();
    }

    bool Stopped() {
      std::lock_guard<std::mutex> lock(mutex);
      return stop;
    }

    // Sleeps up to d; returns true when polling should end
    bool WaitFor(std::chrono::milliseconds d) {
      std::unique_lock<std::mutex> lock(mutex);
      return cv.wait_for(lock, d, [this]{ return stop; });
    }
  };

  std::vector<std::string> AcceptedSignatures(const std::vector<SubmissionOutcome>& outcomes) {
    std::vector<std::string> sigs;
    for (const auto& o : outcomes) {
      if (!o.Accepted()) continue;
      if (std::find(sigs.begin(), sigs.end(), *o.signature) == sigs.end()) sigs.push_back(*o.signature);
    }
    return sigs;
  }

  std::optional<ErrorInfo> LastSubmissionError(const std::vector<SubmissionOutcome>& outcomes) {
    std::optional<ErrorInfo> last;
    for (const auto& o : outcomes) if (o.error) last = o.error;
    return last;
  }
}

ConfirmationTracker::ConfirmationTracker(LedgerClient& ledger, ThreadPool& pool, TrackerOptions options)
  : ledger_(ledger), pool_(pool), options_(options) {}

ExecutionResult ConfirmationTracker::CollectDispatchOnly(const std::vector<SubmissionOutcome>& outcomes) const {
  ExecutionResult result;
  result.signatures = AcceptedSignatures(outcomes);
  result.overall_success = !result.signatures.empty();
  result.last_error = LastSubmissionError(outcomes);
  if (!result.overall_success && !result.last_error) {
    result.last_error = ErrorInfo{ErrorKind::ProviderUnavailable, "no submission was attempted", ""};
  }
  return result;
}

ExecutionResult ConfirmationTracker::Track(const std::vector<SubmissionOutcome>& outcomes, ExecutionMode mode, bool durable) {
  if (mode == ExecutionMode::DispatchOnly) return CollectDispatchOnly(outcomes);

  ExecutionResult result;
  result.signatures = AcceptedSignatures(outcomes);
  if (result.signatures.empty()) {
    result.last_error = LastSubmissionError(outcomes);
    if (!result.last_error) result.last_error = ErrorInfo{ErrorKind::ProviderUnavailable, "no submission was accepted", ""};
    return result;
  }

  PollState state;
  state.last_error = LastSubmissionError(outcomes);
  const auto timeout = options_.deadline;
  const bool stop_on_confirm = options_.stop_on_first_confirmation;
  const CommitmentLevel wanted = options_.commitment;
  const auto interval = options_.poll_interval;

  std::vector<std::future<void>> pending;
  pending.reserve(result.signatures.size());
  pool_.EnsureIdleWorkers(result.signatures.size());
  for (const auto& sig : result.signatures) {
    pending.push_back(pool_.Submit([this, sig, timeout, stop_on_confirm, wanted, interval, durable, &state]{
      const auto started = std::chrono::steady_clock::now();
      const auto deadline = started + timeout;
      while (!state.Stopped()) {
        try {
          const auto statuses = ledger_.GetSignatureStatuses({sig});
          if (!statuses.empty() && statuses[0]) {
            const SignatureStatus& st = *statuses[0];
            if (st.err) {
              Logger::Warning("Transaction " + sig + " rejected: " + *st.err);
              StructuredLogger::Instance().LogEvent("tx_failed", {{"signature", sig}, {"error", *st.err}});
              state.Fail(ErrorInfo{ErrorKind::LedgerRejection, *st.err, sig}, durable);
              return;
            }
            if (st.Reached(wanted)) {
              const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
              Logger::Info("Transaction " + sig + " confirmed after " + std::to_string(ms) + "ms");
              StructuredLogger::Instance().LogEvent("tx_confirmed", {{"signature", sig}, {"elapsed_ms", ms}, {"commitment", CommitmentLevelName(wanted)}});
              state.Confirm(stop_on_confirm);
              return;
            }
          }
        } catch (const std::exception& ex) {
          Logger::Debug(std::string("Status poll for ") + sig + " failed: " + ex.what());
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (state.WaitFor(std::min(interval, remaining))) return;
      }
      if (state.Stopped()) return;
      Logger::Warning("Transaction " + sig + " not confirmed before deadline");
      StructuredLogger::Instance().LogEvent("tx_failed", {{"signature", sig}, {"error", "confirmation timeout"}});
      state.Fail(ErrorInfo{ErrorKind::ConfirmationTimeout, "not confirmed within " + std::to_string(timeout.count()) + "ms", sig}, false);
    }));
  }
  for (auto& f : pending) f.get();

  std::lock_guard<std::mutex> lock(state.mutex);
  result.overall_success = state.confirmed;
  result.last_error = state.last_error;
  return result;
}
