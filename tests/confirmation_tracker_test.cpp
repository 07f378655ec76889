#include "net/confirmation_tracker.hpp"
#include "scheduler/thread_pool.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>

namespace {
  SubmissionOutcome Accepted(const std::string& provider, const std::string& sig) {
    SubmissionOutcome o;
    o.provider_id = provider;
    o.signature = sig;
    return o;
  }

  SubmissionOutcome Failed(const std::string& provider, const std::string& message) {
    SubmissionOutcome o;
    o.provider_id = provider;
    o.error = ErrorInfo{ErrorKind::ProviderUnavailable, message, provider};
    return o;
  }

  TrackerOptions Fast() {
    TrackerOptions opts;
    opts.poll_interval = std::chrono::milliseconds(5);
    opts.deadline = std::chrono::milliseconds(300);
    return opts;
  }
}

TEST(ConfirmationTracker, AllSubmissionsFailed) {
  FakeLedger ledger;
  ThreadPool pool(2);
  ConfirmationTracker tracker(ledger, pool, Fast());
  const auto result = tracker.Track({Failed("A", "HTTP 503"), Failed("B", "timeout")}, ExecutionMode::WaitForConfirmation, false);
  EXPECT_FALSE(result.overall_success);
  EXPECT_TRUE(result.signatures.empty());
  ASSERT_TRUE(result.last_error.has_value());
  EXPECT_EQ(result.last_error->kind, ErrorKind::ProviderUnavailable);
  EXPECT_EQ(ledger.StatusCalls(), 0);
}

TEST(ConfirmationTracker, OneConfirmedSignatureIsSuccess) {
  FakeLedger ledger;
  ledger.SetStatus("sig-b", SignatureStatus{CommitmentLevel::Confirmed, std::nullopt});
  ThreadPool pool(2);
  ConfirmationTracker tracker(ledger, pool, Fast());
  const auto result = tracker.Track({Failed("A", "HTTP 503"), Accepted("B", "sig-b")}, ExecutionMode::WaitForConfirmation, false);
  EXPECT_TRUE(result.overall_success);
  ASSERT_EQ(result.signatures.size(), 1u);
  EXPECT_EQ(result.signatures[0], "sig-b");
  // a winning call can still report the losing path
  ASSERT_TRUE(result.last_error.has_value());
  EXPECT_EQ(result.last_error->source, "A");
}

TEST(ConfirmationTracker, SignaturesKeepCompletionOrderAndAreDeduplicated) {
  FakeLedger ledger;
  ledger.ConfirmEverything(true);
  ThreadPool pool(2);
  ConfirmationTracker tracker(ledger, pool, Fast());
  const auto result = tracker.Track({Accepted("B", "s2"), Accepted("A", "s1"), Accepted("C", "s2")},
                                    ExecutionMode::WaitForConfirmation, false);
  EXPECT_TRUE(result.overall_success);
  EXPECT_EQ(result.signatures, (std::vector<std::string>{"s2", "s1"}));
}

TEST(ConfirmationTracker, TimeoutWhenNeverSeen) {
  FakeLedger ledger;
  ThreadPool pool(2);
  ConfirmationTracker tracker(ledger, pool, Fast());
  const auto start = std::chrono::steady_clock::now();
  const auto result = tracker.Track({Accepted("A", "lost")}, ExecutionMode::WaitForConfirmation, false);
  EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(300));
  EXPECT_FALSE(result.overall_success);
  EXPECT_EQ(result.signatures, (std::vector<std::string>{"lost"}));
  ASSERT_TRUE(result.last_error.has_value());
  EXPECT_EQ(result.last_error->kind, ErrorKind::ConfirmationTimeout);
}

TEST(ConfirmationTracker, OnChainErrorIsLedgerRejection) {
  FakeLedger ledger;
  ledger.SetStatus("bad", SignatureStatus{CommitmentLevel::Processed, std::string(R"({"InstructionError":[3,{"Custom":6001}]})")});
  ThreadPool pool(2);
  ConfirmationTracker tracker(ledger, pool, Fast());
  const auto result = tracker.Track({Accepted("A", "bad")}, ExecutionMode::WaitForConfirmation, false);
  EXPECT_FALSE(result.overall_success);
  ASSERT_TRUE(result.last_error.has_value());
  EXPECT_EQ(result.last_error->kind, ErrorKind::LedgerRejection);
  EXPECT_EQ(result.last_error->source, "bad");
}

TEST(ConfirmationTracker, DurableRejectionStopsTheOtherPolls) {
  FakeLedger ledger;
  ledger.SetStatus("bad", SignatureStatus{CommitmentLevel::Processed, std::string("AlreadyProcessed")});
  ThreadPool pool(4);
  TrackerOptions opts = Fast();
  opts.deadline = std::chrono::milliseconds(5000);
  ConfirmationTracker tracker(ledger, pool, opts);
  const auto start = std::chrono::steady_clock::now();
  const auto result = tracker.Track({Accepted("A", "bad"), Accepted("B", "pending")}, ExecutionMode::WaitForConfirmation, true);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(4000));
  EXPECT_FALSE(result.overall_success);
  EXPECT_EQ(result.last_error->kind, ErrorKind::LedgerRejection);
}

TEST(ConfirmationTracker, TransientLedgerFailuresAreRetried) {
  FakeLedger ledger;
  ledger.FailNextStatusReads(3);
  ledger.SetStatus("s", SignatureStatus{CommitmentLevel::Finalized, std::nullopt});
  ThreadPool pool(1);
  ConfirmationTracker tracker(ledger, pool, Fast());
  const auto result = tracker.Track({Accepted("A", "s")}, ExecutionMode::WaitForConfirmation, false);
  EXPECT_TRUE(result.overall_success);
  EXPECT_GE(ledger.StatusCalls(), 4);
}

TEST(ConfirmationTracker, CommitmentLevelIsRespected) {
  FakeLedger ledger;
  ledger.SetStatus("s", SignatureStatus{CommitmentLevel::Processed, std::nullopt});
  ThreadPool pool(1);
  TrackerOptions opts = Fast();
  opts.deadline = std::chrono::milliseconds(100);
  ConfirmationTracker tracker(ledger, pool, opts);
  EXPECT_FALSE(tracker.Track({Accepted("A", "s")}, ExecutionMode::WaitForConfirmation, false).overall_success);
  opts.commitment = CommitmentLevel::Processed;
  ConfirmationTracker relaxed(ledger, pool, opts);
  EXPECT_TRUE(relaxed.Track({Accepted("A", "s")}, ExecutionMode::WaitForConfirmation, false).overall_success);
}

TEST(ConfirmationTracker, DispatchOnlySkipsPolling) {
  FakeLedger ledger;
  ThreadPool pool(1);
  ConfirmationTracker tracker(ledger, pool, Fast());
  const auto result = tracker.Track({Accepted("A", "s"), Failed("B", "HTTP 500")}, ExecutionMode::DispatchOnly, false);
  EXPECT_TRUE(result.overall_success);
  EXPECT_EQ(result.signatures, (std::vector<std::string>{"s"}));
  EXPECT_EQ(ledger.StatusCalls(), 0);

  const auto failed = tracker.Track({Failed("B", "HTTP 500")}, ExecutionMode::DispatchOnly, false);
  EXPECT_FALSE(failed.overall_success);
  EXPECT_TRUE(failed.last_error.has_value());
}

TEST(ConfirmationTracker, MoreSignaturesThanWorkersStillPollConcurrently) {
  FakeLedger ledger;
  ledger.SetStatus("s4", SignatureStatus{CommitmentLevel::Confirmed, std::nullopt});
  ThreadPool pool(3);
  TrackerOptions opts;
  opts.poll_interval = std::chrono::milliseconds(10);
  opts.deadline = std::chrono::milliseconds(2000);
  ConfirmationTracker tracker(ledger, pool, opts);

  const auto start = std::chrono::steady_clock::now();
  const auto result = tracker.Track({Accepted("A", "s1"), Accepted("B", "s2"), Accepted("C", "s3"), Accepted("D", "s4")},
                                    ExecutionMode::WaitForConfirmation, false);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
  EXPECT_TRUE(result.overall_success);
  EXPECT_EQ(result.signatures.size(), 4u);
  EXPECT_LT(ms, 500);
  EXPECT_GE(pool.Size(), 4u);
}
