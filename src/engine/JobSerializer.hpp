#pragma once

#include "engine/Job.hpp"

#include <optional>
#include <string>

namespace rf::engine
{

// Metrics as stored in the jobs.metadata column: known numeric fields plus
// the extra map flattened as string members.
std::string serialize_metrics(JobMetrics const &metrics);
JobMetrics deserialize_metrics(std::string const &payload);

// Snapshot of a job for log files and external consumers.
std::string serialize_job_status(JobStatus const &status);
std::optional<JobStatus> deserialize_job_status(std::string const &payload);

} // namespace rf::engine
