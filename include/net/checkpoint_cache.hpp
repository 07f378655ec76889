#pragma once
#include "encoding/tx_codec.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <thread>

class LedgerClient;

// Keeps the latest checkpoint hash fresh on a background thread so the hot path
// reads a cached anchor instead of calling the ledger.
class CheckpointCache {
public:
  CheckpointCache(LedgerClient& ledger, std::chrono::milliseconds refresh_interval = std::chrono::milliseconds(400));
  ~CheckpointCache();

  void Start();
  void Stop();
  // Fetches once on the calling thread; returns false on ledger failure
  bool RefreshNow();

  std::optional<Blockhash> Latest() const;
  // Time since the last successful refresh, nullopt before the first one
  std::optional<std::chrono::milliseconds> Age() const;

private:
  void Run();

  LedgerClient& ledger_;
  std::chrono::milliseconds refresh_interval_;
  mutable std::mutex mutex_;
  std::optional<Blockhash> latest_;
  std::chrono::steady_clock::time_point updated_at_;
  std::atomic<bool> running_{false};
  std::thread worker_;
};
