// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "util/threadpool.hpp"
#include "util/logging.hpp"

namespace statesync {
namespace util {

namespace {

// hardware_concurrency() may report 0
constexpr size_t kFallbackThreads = 4;

size_t ResolveThreadCount(size_t requested) {
  if (requested != 0) {
    return requested;
  }
  size_t hardware = std::thread::hardware_concurrency();
  return hardware != 0 ? hardware : kFallbackThreads;
}

} // namespace

ThreadPool::ThreadPool(size_t num_threads) : stop_(false) {
  const size_t count = ResolveThreadCount(num_threads);
  workers_.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    workers_.emplace_back(&ThreadPool::WorkerLoop, this);
  }
  LOG_DEBUG("Started thread pool with {} workers", count);
}

ThreadPool::~ThreadPool() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    stop_ = true;
  }
  condition_.notify_all();

  // Workers drain the queue before exiting
  for (std::thread &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

std::function<void()> ThreadPool::NextTask() {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
  if (tasks_.empty()) {
    return nullptr;
  }
  std::function<void()> task = std::move(tasks_.front());
  tasks_.pop();
  return task;
}

void ThreadPool::WorkerLoop() {
  // packaged_task stores exceptions in the caller's future
  while (std::function<void()> task = NextTask()) {
    task();
  }
}

} // namespace util
} // namespace statesync
