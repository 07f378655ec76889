#include "scheduler/thread_pool.hpp"
#include "scheduler/cpu_affinity.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <vector>
#include <stdexcept>

TEST(ThreadPool, SubmitReturnsResultsAndExceptions) {
  ThreadPool pool(2, -1, "test");
  auto ok = pool.Submit([]{ return 42; });
  auto bad = pool.Submit([]() -> int { throw std::runtime_error("boom"); });
  EXPECT_EQ(ok.get(), 42);
  EXPECT_THROW(bad.get(), std::runtime_error);
  EXPECT_EQ(pool.Name(), "test");
}

TEST(ThreadPool, FailingEnqueuedTaskDoesNotKillTheWorker) {
  ThreadPool pool(1);
  pool.Enqueue([]{ throw std::runtime_error("ignored"); });
  EXPECT_EQ(pool.Submit([]{ return 7; }).get(), 7);
}

TEST(ThreadPool, DestructorDrainsQueuedWork) {
  std::atomic<int> done{0};
  {
    ThreadPool pool(1);
    for (int i = 0; i < 50; ++i) pool.Enqueue([&done]{ done.fetch_add(1); });
  }
  EXPECT_EQ(done.load(), 50);
}

TEST(CpuAffinity, WorkersWrapAroundTheCoreCount) {
  const unsigned int cores = std::thread::hardware_concurrency() > 0 ? std::thread::hardware_concurrency() : 1;
  EXPECT_EQ(CoreForWorker(0, 0), 0u);
  EXPECT_EQ(CoreForWorker(0, cores), 0u);
  EXPECT_EQ(CoreForWorker(1, cores - 1), 0u);
}

TEST(ThreadPool, EnsureIdleWorkersCountsBusyAndQueuedWork) {
  ThreadPool pool(2);
  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();
  std::promise<void> started;
  pool.Enqueue([gate, &started]{ started.set_value(); gate.wait(); });
  started.get_future().wait();

  pool.EnsureIdleWorkers(1);
  EXPECT_EQ(pool.Size(), 2u);
  pool.EnsureIdleWorkers(3);
  EXPECT_EQ(pool.Size(), 4u);

  std::vector<std::future<int>> results;
  for (int i = 0; i < 3; ++i) results.push_back(pool.Submit([i]{ return i; }));
  for (int i = 0; i < 3; ++i) EXPECT_EQ(results[i].get(), i);
  release.set_value();
}
