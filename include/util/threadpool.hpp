// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_UTIL_THREADPOOL_HPP
#define STAKENODE_UTIL_THREADPOOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace stakenode {
namespace util {

/**
 * Fixed-size worker pool
 *
 * Usage:
 *   ThreadPool pool(4);  // 4 worker threads
 *   auto future = pool.enqueue([](){ return 42; });
 *   int result = future.get();
 *
 * The pool never grows; excess work waits in the FIFO task queue.
 */
class ThreadPool {
public:
  // num_threads == 0 uses hardware concurrency
  explicit ThreadPool(size_t num_threads = 0);

  // Drains queued tasks, then joins the workers
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  /**
   * Enqueue a task for execution
   * Returns a future that will contain the result (or the thrown exception)
   */
  template <class F, class... Args>
  auto enqueue(F &&f, Args &&...args)
      -> std::future<typename std::invoke_result<F, Args...>::type>;

  size_t size() const { return workers_.size(); }

  // Tasks waiting for a worker
  size_t pending() const;

private:
  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;

  mutable std::mutex queue_mutex_;
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

} // namespace util
} // namespace stakenode

#endif // STAKENODE_UTIL_THREADPOOL_HPP
