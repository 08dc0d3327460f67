#pragma once

#include "engine/Job.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace rf::engine
{

struct JobStateChangedEvent
{
    std::string job_id;
    JobState previous = JobState::Queued;
    JobState current = JobState::Queued;
    double progress = 0.0;
};

struct JobRemovedEvent
{
    std::string job_id;
    bool files_deleted = false;
};

struct ScheduleExecutedEvent
{
    std::string schedule_id;
    std::string status;
    std::vector<std::string> job_ids;
};

} // namespace rf::engine
