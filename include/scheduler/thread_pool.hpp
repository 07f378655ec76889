#pragma once
#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <type_traits>

// Fixed worker pool shared by relay submissions, confirmation polling and
// async signed-transaction callbacks.
class ThreadPool {
public:
  // first_core >= 0 pins worker i to CoreForWorker(first_core, i)
  explicit ThreadPool(size_t threads, int first_core = -1, std::string name = "pool");
  ~ThreadPool();

  // Fire and forget. A std::exception escaping the task is logged, not rethrown.
  // Throws std::runtime_error once the pool is shutting down.
  void Enqueue(std::function<void()> task);

  // Runs fn on a worker; exceptions surface through the future.
  template <typename Fn>
  auto Submit(Fn&& fn) -> std::future<typename std::invoke_result<Fn>::type> {
    using R = typename std::invoke_result<Fn>::type;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
    auto fut = task->get_future();
    Enqueue([task]{ (*task)(); });
    return fut;
  }

  // Grows the pool until at least n workers are neither running nor owed a
  // queued task, so a fan-out of n tasks starts without waiting on earlier work.
  void EnsureIdleWorkers(size_t n);

  size_t Size() const;
  const std::string& Name() const { return name_; }

private:
  void WorkerLoop(size_t index, int first_core);

  std::string name_;
  int first_core_;
  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  size_t busy_ = 0;
  bool stopping_ = false;
};
