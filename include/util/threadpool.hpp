#ifndef STATESYNC_UTIL_THREADPOOL_HPP
#define STATESYNC_UTIL_THREADPOOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace statesync {
namespace util {

/**
 * Bounded thread pool for CPU-bound work (manifest hashing)
 *
 * Usage:
 *   ThreadPool pool(4);  // 4 worker threads
 *   auto future = pool.enqueue([](){ return 42; });
 *   int result = future.get();
 *
 * The pool keeps no per-call state: callers fan out, then join their own
 * futures (see JoinAll) before returning.
 */
class ThreadPool {
public:
  /**
   * Constructor - create pool with specified number of threads
   * If num_threads == 0, uses hardware concurrency
   */
  explicit ThreadPool(size_t num_threads = 0);

  /**
   * Destructor - waits for all queued tasks to complete
   */
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  /**
   * Enqueue a task for execution
   * Returns a future that will contain the result (or the exception)
   */
  template <class F, class... Args>
  auto enqueue(F &&f, Args &&...args)
      -> std::future<typename std::invoke_result<F, Args...>::type>;

  /**
   * Get number of worker threads
   */
  size_t size() const { return workers_.size(); }

private:
  // Blocks for the next task; empty once stopped and drained
  std::function<void()> NextTask();
  void WorkerLoop();

  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;

  std::mutex queue_mutex_;
  std::condition_variable condition_;
  bool stop_;
};

template <class F, class... Args>
auto ThreadPool::enqueue(F &&f, Args &&...args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
  using return_type = typename std::invoke_result<F, Args...>::type;

  auto task = std::make_shared<std::packaged_task<return_type()>>(
      std::bind(std::forward<F>(f), std::forward<Args>(args)...));

  std::future<return_type> res = task->get_future();
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);

    if (stop_)
      throw std::runtime_error("enqueue on stopped ThreadPool");

    tasks_.emplace([task]() { (*task)(); });
  }
  condition_.notify_one();
  return res;
}

/**
 * Wait for every future, then rethrow the first stored exception (if any).
 * All futures are drained even when an early one failed, so no task still
 * references caller-owned data after this returns.
 */
template <class T>
std::vector<T> JoinAll(std::vector<std::future<T>> &futures) {
  std::vector<T> results;
  results.reserve(futures.size());
  std::exception_ptr first_error;
  for (auto &f : futures) {
    try {
      results.push_back(f.get());
    } catch (...) {
      if (!first_error) {
        first_error = std::current_exception();
      }
    }
  }
  if (first_error) {
    std::rethrow_exception(first_error);
  }
  return results;
}

} // namespace util
} // namespace statesync

#endif // STATESYNC_UTIL_THREADPOOL_HPP
