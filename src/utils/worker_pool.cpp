#include "utils/worker_pool.hpp"
#include <thread>
#include <boost/log/trivial.hpp>

namespace crystal {
namespace utils {

namespace {

std::size_t resolve_thread_count(std::size_t requested) {
  if (requested > 0) {
    return requested;
  }
  unsigned int hardware = std::thread::hardware_concurrency();
  return hardware > 0 ? hardware : 2;
}

} // namespace

WorkerPool::WorkerPool(std::size_t thread_count)
  : thread_count_(resolve_thread_count(thread_count)),
    pool_(thread_count_) {
  BOOST_LOG_TRIVIAL(debug) << "Worker pool: Started with " << thread_count_ << " thread(s)";
}

WorkerPool::~WorkerPool() {
  pool_.join();
  BOOST_LOG_TRIVIAL(trace) << "Worker pool: Stopped";
}

} // namespace utils
} // namespace crystal
