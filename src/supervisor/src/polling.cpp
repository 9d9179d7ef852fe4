#include "../include/polling.hpp"

#include <algorithm>
#include <thread>

bool pollUntil(const std::function<bool()> &condition,
               std::chrono::milliseconds timeout,
               std::chrono::milliseconds interval) {
  if (interval.count() <= 0) interval = std::chrono::milliseconds(1);

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  const long long max_iterations = timeout.count() / interval.count() + 1;

  for (long long i = 0; i < max_iterations; ++i) {
    if (condition()) return true;

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) break;

    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
        interval, deadline - now));
  }

  // Последняя проверка на границе таймаута
  return condition();
}
