#include "engine/SchedulerService.hpp"

#include "utils/Log.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace rf::engine
{

void SchedulerService::every(std::string name,
                             std::chrono::milliseconds interval,
                             Callback callback, Clock::time_point now)
{
    interval = std::max(interval, std::chrono::milliseconds(1));
    timers_.push_back(
        {std::move(name), interval, now + interval, std::move(callback)});
}

std::size_t SchedulerService::tick(Clock::time_point now)
{
    std::size_t completed = 0;
    for (auto &timer : timers_)
    {
        if (timer.next_run > now)
        {
            continue;
        }
        // a late loop runs the timer once, not once per missed interval
        timer.next_run = now + timer.interval;
        if (!timer.callback)
        {
            continue;
        }
        try
        {
            timer.callback();
            ++completed;
        }
        catch (std::exception const &ex)
        {
            RF_LOG_ERROR("{} failed: {}", timer.name, ex.what());
        }
    }
    return completed;
}

std::chrono::milliseconds
SchedulerService::time_until_next_task(Clock::time_point now) const
{
    if (timers_.empty())
    {
        return std::chrono::hours(24);
    }
    auto next = timers_.front().next_run;
    for (auto const &timer : timers_)
    {
        next = std::min(next, timer.next_run);
    }
    if (now >= next)
    {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(next - now);
}

} // namespace rf::engine
