#include "telemetry/structured_logger.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <fstream>

StructuredLogger& StructuredLogger::Instance() {
  static StructuredLogger inst;
  return inst;
}

StructuredLogger::~StructuredLogger() { Shutdown(); }

void StructuredLogger::Initialize(const std::string& file_path, const nlohmann::json& static_fields, size_t max_queue) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) return;
  file_path_ = file_path;
  static_fields_ = static_fields.is_object() ? static_fields : nlohmann::json::object();
  max_queue_ = max_queue > 0 ? max_queue : 1;
  dropped_ = 0;
  running_ = true;
  worker_ = std::thread(&StructuredLogger::Worker, this);
}

void StructuredLogger::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
  if (dropped_.load() > 0) Logger::Warning("Structured logger dropped " + std::to_string(dropped_.load()) + " events");
}

bool StructuredLogger::Running() {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

void StructuredLogger::LogJsonLine(const std::string& json_line) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    if (queue_.size() >= max_queue_) {
      dropped_.fetch_add(1);
      return;
    }
    queue_.push(json_line);
  }
  cv_.notify_one();
}

void StructuredLogger::LogEvent(const std::string& event, const nlohmann::json& fields) {
  nlohmann::json j;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    j = static_fields_;
  }
  if (fields.is_object()) {
    for (auto it = fields.begin(); it != fields.end(); ++it) j[it.key()] = it.value();
  }
  j["event"] = event;
  j["ts_ms"] = std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now()).time_since_epoch().count();
  LogJsonLine(j.dump());
}

void StructuredLogger::Worker() {
  std::ofstream out(file_path_, std::ios::app | std::ios::out);
  if (!out.is_open()) Logger::Error("Cannot open metrics file " + file_path_);
  std::string batch;
  batch.reserve(8192);
  while (true) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(80), [&]{ return !queue_.empty() || !running_; });
    if (!running_ && queue_.empty()) break;
    while (!queue_.empty() && batch.size() <= 4096) {
      batch.append(queue_.front());
      batch.push_back('\n');
      queue_.pop();
    }
    lock.unlock();
    if (!batch.empty() && out.is_open()) {
      out << batch;
      out.flush();
    }
    batch.clear();
  }
}
