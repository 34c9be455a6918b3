#ifndef CRYSTAL_UTILS_WORKER_POOL_HPP
#define CRYSTAL_UTILS_WORKER_POOL_HPP

#include <cstddef>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace crystal {
namespace utils {

// Fixed size pool running independent per-fragment tasks.
// Exceptions thrown by a task are delivered through its future.
class WorkerPool {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // thread_count 0 selects the hardware concurrency
  explicit WorkerPool(std::size_t thread_count = 0);
  // Waits for queued tasks to finish
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;


  // ---- TASK SUBMISSION ----
  template <typename Fn>
  auto submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
    using Result = std::invoke_result_t<std::decay_t<Fn>>;
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
    std::future<Result> result = task->get_future();
    boost::asio::post(pool_, [task]() { (*task)(); });
    return result;
  }

  // Blocks until every future has completed. Returns the results in submission
  // order, rethrowing the first stored exception only after all tasks are done.
  template <typename T>
  static std::vector<T> wait_all(std::vector<std::future<T>>& futures) {
    for (auto& future : futures) {
      future.wait();
    }
    std::vector<T> results;
    results.reserve(futures.size());
    for (auto& future : futures) {
      results.push_back(future.get());
    }
    return results;
  }


  // ---- GETTERS ----
  std::size_t thread_count() const { return thread_count_; }

private:
  std::size_t thread_count_;
  boost::asio::thread_pool pool_;
};

} // namespace utils
} // namespace crystal

#endif // CRYSTAL_UTILS_WORKER_POOL_HPP
