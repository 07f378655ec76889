#include "scheduler/thread_pool.hpp"
#include "scheduler/cpu_affinity.hpp"
#include "common/logger.hpp"
#include <stdexcept>

ThreadPool::ThreadPool(size_t threads, int first_core, std::string name)
  : name_(std::move(name)), first_core_(first_core) {
  if (threads == 0) threads = 1;
  std::lock_guard<std::mutex> lock(mutex_);
  workers_.reserve(threads);
  for (size_t i = 0; i < threads; ++i) {
    workers_.emplace_back(&ThreadPool::WorkerLoop, this, i, first_core_);
  }
  Logger::Debug("Thread pool '" + name_ + "' started with " + std::to_string(threads) + " workers");
}

ThreadPool::~ThreadPool() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto& w : workers_) if (w.joinable()) w.join();
}

void ThreadPool::WorkerLoop(size_t index, int first_core) {
  if (first_core >= 0) {
    const unsigned int core = CoreForWorker(first_core, index);
    if (!PinCurrentThreadToCore(core)) Logger::Warning(name_ + " worker " + std::to_string(index) + " could not be pinned to core " + std::to_string(core));
  }
  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this]{ return stopping_ || !tasks_.empty(); });
      // drain queued work before exiting
      if (stopping_ && tasks_.empty()) return;
      task = std::move(tasks_.front());
      tasks_.pop();
      ++busy_;
    }
    try {
      task();
    } catch (const std::exception& ex) {
      Logger::Error(name_ + " worker " + std::to_string(index) + " task failed: " + ex.what());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    --busy_;
  }
}

void ThreadPool::Enqueue(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) throw std::runtime_error("enqueue on stopped thread pool '" + name_ + "'");
    tasks_.push(std::move(task));
  }
  cv_.notify_one();
}

void ThreadPool::EnsureIdleWorkers(size_t n) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stopping_) throw std::runtime_error("thread pool '" + name_ + "' is stopping");
  const size_t committed = busy_ + tasks_.size();
  const size_t idle = workers_.size() > committed ? workers_.size() - committed : 0;
  if (idle >= n) return;
  const size_t grow = n - idle;
  for (size_t i = 0; i < grow; ++i) {
    workers_.emplace_back(&ThreadPool::WorkerLoop, this, workers_.size(), first_core_);
  }
  Logger::Debug("Thread pool '" + name_ + "' grew by " + std::to_string(grow) + " to " + std::to_string(workers_.size()) + " workers");
}

size_t ThreadPool::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return workers_.size();
}
