#include "engine/ResumeDataService.hpp"

#include "utils/Log.hpp"
#include "utils/StateStore.hpp"

namespace rf::engine
{

ResumeDataService::ResumeDataService(storage::Database *database,
                                     std::chrono::milliseconds alert_timeout)
    : database_(database), alert_timeout_(alert_timeout)
{
}

void ResumeDataService::expect(std::string const &job_id)
{
    if (job_id.empty())
    {
        return;
    }
    pending_.insert(job_id);
    extend_deadline();
}

bool ResumeDataService::persist(std::string const &job_id,
                                std::vector<std::uint8_t> const &blob)
{
    bool stored = false;
    if (database_ && database_->is_valid() && !blob.empty())
    {
        stored = database_->update_job_resume_data(job_id, blob);
        if (!stored)
        {
            RF_LOG_WARN("failed to store resume data for job {}", job_id);
        }
    }
    mark_completed(job_id);
    return stored;
}

void ResumeDataService::mark_completed(std::string const &job_id)
{
    if (job_id.empty())
    {
        return;
    }
    pending_.erase(job_id);
    if (!pending_.empty())
    {
        extend_deadline();
    }
}

bool ResumeDataService::pending(std::string const &job_id) const
{
    return pending_.count(job_id) != 0;
}

void ResumeDataService::extend_deadline()
{
    if (pending_.empty())
    {
        deadline_ = Clock::time_point::min();
        return;
    }
    deadline_ = Clock::now() + alert_timeout_;
}

bool ResumeDataService::in_progress(Clock::time_point now) const
{
    if (pending_.empty())
    {
        return false;
    }
    return now < deadline_;
}

void ResumeDataService::clear()
{
    pending_.clear();
    deadline_ = Clock::time_point::min();
}

} // namespace rf::engine
