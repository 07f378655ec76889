#pragma once
#include "common/errors.hpp"
#include "node_connection/ledger_client.hpp"
#include "swqos/provider.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

class ThreadPool;

enum class ExecutionMode { WaitForConfirmation, DispatchOnly };

struct TrackerOptions {
  std::chrono::milliseconds poll_interval{200};
  std::chrono::milliseconds deadline{30000};
  CommitmentLevel commitment = CommitmentLevel::Confirmed;
  bool stop_on_first_confirmation = true;
};

struct ExecutionResult {
  bool overall_success = false;
  std::vector<std::string> signatures; // in the order they finished
  std::optional<ErrorInfo> last_error;
};

// Turns submission outcomes into an ExecutionResult. In confirmation mode each
// distinct accepted signature is polled concurrently until it confirms, is
// rejected on chain, or the deadline passes.
class ConfirmationTracker {
public:
  ConfirmationTracker(LedgerClient& ledger, ThreadPool& pool, TrackerOptions options = {});

  // durable: all variants share one nonce, a rejection of one ends the race for all
  ExecutionResult Track(const std::vector<SubmissionOutcome>& outcomes, ExecutionMode mode, bool durable);

  const TrackerOptions& Options() const { return options_; }

private:
  ExecutionResult CollectDispatchOnly(const std::vector<SubmissionOutcome>& outcomes) const;

  LedgerClient& ledger_;
  ThreadPool& pool_;
  TrackerOptions options_;
};
