#include "engine/AsyncTaskService.hpp"

#include "utils/Log.hpp"

#include <exception>
#include <utility>

namespace rf::engine
{

AsyncTaskService::AsyncTaskService() = default;

AsyncTaskService::~AsyncTaskService()
{
    cancel_requested_.store(true, std::memory_order_release);
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        workers.swap(workers_);
    }
    for (auto &worker : workers)
    {
        if (worker.thread.joinable())
        {
            worker.thread.join();
        }
    }
}

bool AsyncTaskService::submit(std::function<void()> task)
{
    if (!task)
    {
        return false;
    }
    std::lock_guard<std::mutex> guard(mutex_);
    if (cancel_requested_.load(std::memory_order_acquire))
    {
        return false;
    }
    reap_finished_locked();
    auto done = std::make_shared<std::atomic<bool>>(false);
    ++running_;
    std::thread thread(
        [this, done, task = std::move(task)]()
        {
            try
            {
                task();
            }
            catch (std::exception const &ex)
            {
                RF_LOG_ERROR("async task exception: {}", ex.what());
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                --running_;
                done->store(true, std::memory_order_release);
            }
            idle_cv_.notify_all();
        });
    workers_.push_back(Worker{std::move(thread), std::move(done)});
    return true;
}

bool AsyncTaskService::stop(std::chrono::milliseconds grace)
{
    cancel_requested_.store(true, std::memory_order_release);
    std::vector<Worker> finished;
    bool drained = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        drained = idle_cv_.wait_for(lock, grace,
                                    [this] { return running_ == 0; });
        for (auto it = workers_.begin(); it != workers_.end();)
        {
            if (it->done->load(std::memory_order_acquire))
            {
                finished.push_back(std::move(*it));
                it = workers_.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }
    for (auto &worker : finished)
    {
        if (worker.thread.joinable())
        {
            worker.thread.join();
        }
    }
    if (!drained)
    {
        RF_LOG_WARN("{} background task(s) still running after {} ms",
                    in_flight(), grace.count());
    }
    return drained;
}

bool AsyncTaskService::cancel_requested() const noexcept
{
    return cancel_requested_.load(std::memory_order_acquire);
}

std::size_t AsyncTaskService::in_flight() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return running_;
}

void AsyncTaskService::reap_finished_locked()
{
    for (auto it = workers_.begin(); it != workers_.end();)
    {
        if (it->done->load(std::memory_order_acquire))
        {
            // the worker only has its final notify left
            if (it->thread.joinable())
            {
                it->thread.join();
            }
            it = workers_.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

} // namespace rf::engine
