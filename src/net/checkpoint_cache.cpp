#include "net/checkpoint_cache.hpp"
#include "node_connection/ledger_client.hpp"
#include "common/logger.hpp"
#include <algorithm>

CheckpointCache::CheckpointCache(LedgerClient& ledger, std::chrono::milliseconds refresh_interval)
  : ledger_(ledger), refresh_interval_(refresh_interval) {}

CheckpointCache::~CheckpointCache() { Stop(); }

void CheckpointCache::Start() {
  if (running_.exchange(true)) return;
  worker_ = std::thread([this]{ Run(); });
}

void CheckpointCache::Stop() {
  running_.store(false, std::memory_order_relaxed);
  if (worker_.joinable()) worker_.join();
}

bool CheckpointCache::RefreshNow() {
  try {
    const Blockhash hash = Blockhash::FromBase58(ledger_.GetLatestBlockhash());
    std::lock_guard<std::mutex> lock(mutex_);
    latest_ = hash;
    updated_at_ = std::chrono::steady_clock::now();
    return true;
  } catch (const std::exception& ex) {
    Logger::Warning(std::string("CheckpointCache refresh failed: ") + ex.what());
    return false;
  }
}

std::optional<Blockhash> CheckpointCache::Latest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latest_;
}

std::optional<std::chrono::milliseconds> CheckpointCache::Age() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!latest_) return std::nullopt;
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - updated_at_);
}

void CheckpointCache::Run() {
  const auto backoff_max = std::chrono::milliseconds(5000);
  auto sleep = refresh_interval_;
  while (running_.load(std::memory_order_relaxed)) {
    if (RefreshNow()) {
      sleep = refresh_interval_;
    } else {
      sleep = std::min(sleep * 2, backoff_max);
    }
    // Short slices so Stop() does not wait a whole interval
    const auto until = std::chrono::steady_clock::now() + sleep;
    while (running_.load(std::memory_order_relaxed) && std::chrono::steady_clock::now() < until) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
}
