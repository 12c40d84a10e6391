#ifndef MATHMARK_CONCURRENCY_HPP
#define MATHMARK_CONCURRENCY_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace mathmark {

/**
 * @brief Run fn(i) for every i in [0, count) on at most maxThreads threads
 *
 * Workers pull the next index from a shared counter. The first exception
 * thrown by fn is rethrown once every worker has finished.
 */
template <typename Fn>
void parallelFor(size_t count, int maxThreads, Fn fn) {
  if (count == 0) {
    return;
  }
  int threadCount =
      static_cast<int>(std::min<size_t>(std::max(1, maxThreads), count));
  if (threadCount == 1) {
    for (size_t i = 0; i < count; i++) {
      fn(i);
    }
    return;
  }

  std::atomic<size_t> next{0};
  std::exception_ptr firstError;
  std::mutex errorMutex;

  auto worker = [&]() {
    while (true) {
      size_t i = next.fetch_add(1);
      if (i >= count)
        break;
      try {
        fn(i);
      } catch (...) {
        std::lock_guard<std::mutex> lock(errorMutex);
        if (!firstError) {
          firstError = std::current_exception();
        }
      }
    }
  };

  std::vector<std::thread> workers;
  workers.reserve(threadCount);
  for (int t = 0; t < threadCount; ++t) {
    workers.emplace_back(worker);
  }
  for (auto &thread : workers) {
    thread.join();
  }

  if (firstError) {
    std::rethrow_exception(firstError);
  }
}

/**
 * @brief Client-side request throttle shared by concurrent callers
 *
 * wait() blocks until at least 1/requestsPerSecond has passed since the
 * previous caller was let through. A rate of zero or less disables it.
 */
class RateLimiter {
public:
  explicit RateLimiter(double requestsPerSecond)
      : m_interval(requestsPerSecond > 0
                       ? std::chrono::duration_cast<
                             std::chrono::steady_clock::duration>(
                             std::chrono::duration<double>(1.0 /
                                                           requestsPerSecond))
                       : std::chrono::steady_clock::duration::zero()),
        m_nextSlot(std::chrono::steady_clock::now()) {}

  void wait() {
    if (m_interval == std::chrono::steady_clock::duration::zero()) {
      return;
    }
    std::unique_lock<std::mutex> lock(m_mutex);
    auto now = std::chrono::steady_clock::now();
    if (now < m_nextSlot)
      std::this_thread::sleep_until(m_nextSlot);
    m_nextSlot = std::chrono::steady_clock::now() + m_interval;
  }

private:
  std::mutex m_mutex;
  std::chrono::steady_clock::duration m_interval;
  std::chrono::steady_clock::time_point m_nextSlot;
};

} // namespace mathmark

#endif // MATHMARK_CONCURRENCY_HPP
