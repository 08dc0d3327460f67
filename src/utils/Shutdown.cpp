#include "utils/Shutdown.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

namespace rf::runtime {

namespace {
std::atomic_bool g_shutdown_requested{false};
constexpr std::chrono::milliseconds kPollSlice{100};
} // namespace

void request_shutdown() noexcept {
  g_shutdown_requested.store(true, std::memory_order_relaxed);
}

bool should_shutdown() noexcept {
  return g_shutdown_requested.load(std::memory_order_relaxed);
}

bool wait_for_shutdown(std::chrono::milliseconds timeout) noexcept {
  auto const deadline = std::chrono::steady_clock::now() + timeout;
  while (!should_shutdown()) {
    auto const now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      break;
    }
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(remaining, kPollSlice));
  }
  return should_shutdown();
}

} // namespace rf::runtime
