#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

// JSON-lines event sink for race telemetry (tx_built, tx_submitted,
// tx_confirmed, tx_failed, execution_result, strategy_update). Events are
// written by a background thread; LogEvent never blocks on disk.
class StructuredLogger {
public:
  static StructuredLogger& Instance();

  // Starts the writer. Fields in `static_fields` are stamped onto every event.
  void Initialize(const std::string& file_path = "metrics.jsonl",
                  const nlohmann::json& static_fields = nlohmann::json::object(),
                  size_t max_queue = 65536);
  // Flushes pending lines and joins the writer
  void Shutdown();
  bool Running();

  // Stamps "event" and "ts_ms" onto fields and enqueues the object. Dropped
  // when not running or when the queue is full.
  void LogEvent(const std::string& event, const nlohmann::json& fields);
  void LogJsonLine(const std::string& json_line);

  uint64_t Dropped() const { return dropped_.load(); }

private:
  StructuredLogger() = default;
  ~StructuredLogger();
  void Worker();

  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  std::thread worker_;
  bool running_ = false;
  std::string file_path_;
  nlohmann::json static_fields_ = nlohmann::json::object();
  size_t max_queue_ = 65536;
  std::atomic<uint64_t> dropped_{0};
};
