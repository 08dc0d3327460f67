#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace rf::engine
{

// Named fixed-interval timers driven by the reconciliation loop. A timer
// whose callback throws is logged and stays scheduled. Only the loop thread
// touches an instance.
class SchedulerService
{
  public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void()>;

    // First run is one interval after now.
    void every(std::string name, std::chrono::milliseconds interval,
               Callback callback, Clock::time_point now = Clock::now());

    // Runs every timer that is due. Returns how many callbacks completed.
    std::size_t tick(Clock::time_point now);

    // How long the loop may sleep before a timer is due.
    std::chrono::milliseconds time_until_next_task(Clock::time_point now) const;

    std::size_t size() const noexcept
    {
        return timers_.size();
    }

  private:
    struct Timer
    {
        std::string name;
        std::chrono::milliseconds interval;
        Clock::time_point next_run;
        Callback callback;
    };

    std::vector<Timer> timers_;
};

} // namespace rf::engine
