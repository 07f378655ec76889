#pragma once
#include <pthread.h>
#include <sched.h>
#include <thread>

// Core for pool worker `index` when workers are pinned from first_core upwards,
// wrapping around the online core count.
inline unsigned int CoreForWorker(int first_core, size_t index) {
  const unsigned int cores = std::thread::hardware_concurrency() > 0 ? std::thread::hardware_concurrency() : 1;
  return static_cast<unsigned int>((static_cast<size_t>(first_core) + index) % cores);
}

// Returns false when the kernel refuses the mask.
inline bool PinCurrentThreadToCore(unsigned int core_index) {
  if (core_index >= CPU_SETSIZE) return false;
  cpu_set_t cpuset;
  CPU_ZERO(&cpuset);
  CPU_SET(core_index, &cpuset);
  return pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset) == 0;
}
