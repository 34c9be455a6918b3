#ifndef CRYSTAL_UTILS_RETRY_HPP
#define CRYSTAL_UTILS_RETRY_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <boost/log/trivial.hpp>
#include "config/config_error.hpp"

namespace crystal {
namespace utils {

struct RetryPolicy {
  uint32_t max_attempts = 4;
  std::chrono::milliseconds initial_backoff{50};
  double multiplier = 2.0;
  std::chrono::milliseconds max_backoff{2000};

  // Throws ConfigurationError when the policy cannot terminate sensibly
  void validate() const {
    if (max_attempts == 0) {
      throw config::ConfigurationError("retry max_attempts must be at least 1");
    }
    if (initial_backoff.count() < 0 || max_backoff.count() < 0) {
      throw config::ConfigurationError("retry backoff must not be negative");
    }
    if (multiplier < 1.0) {
      throw config::ConfigurationError("retry multiplier must be at least 1.0");
    }
  }

  // Delay before attempt number `attempt` (1 based, attempt 1 has no delay)
  std::chrono::milliseconds backoff_before(uint32_t attempt) const {
    if (attempt <= 1) {
      return std::chrono::milliseconds(0);
    }
    double delay = static_cast<double>(initial_backoff.count());
    for (uint32_t i = 2; i < attempt; ++i) {
      delay *= multiplier;
      if (delay >= static_cast<double>(max_backoff.count())) {
        return max_backoff;
      }
    }
    return std::min(std::chrono::milliseconds(static_cast<int64_t>(delay)), max_backoff);
  }
};

// Runs fn, retrying only on Transient exceptions with exponential backoff.
// The last Transient exception is rethrown once attempts are exhausted,
// anything else propagates immediately.
template <typename Transient, typename Fn>
auto with_retry(const RetryPolicy& policy, const std::string& description, Fn&& fn)
    -> decltype(fn()) {
  for (uint32_t attempt = 1;; ++attempt) {
    auto delay = policy.backoff_before(attempt);
    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }

    try {
      return fn();
    } catch (const Transient& e) {
      if (attempt >= policy.max_attempts) {
        BOOST_LOG_TRIVIAL(error) << "Retry: " << description << " failed after "
                                 << attempt << " attempt(s): " << e.what();
        throw;
      }
      BOOST_LOG_TRIVIAL(warning) << "Retry: " << description << " failed (attempt "
                                 << attempt << "/" << policy.max_attempts << "): " << e.what();
    }
  }
}

} // namespace utils
} // namespace crystal

#endif // CRYSTAL_UTILS_RETRY_HPP
