#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rf::engine
{

enum class JobState
{
    Queued,
    Checking,
    DownloadingMetadata,
    Downloading,
    Finished,
    Seeding,
    Allocating,
    CheckingFastresume,
    Paused,
    Stopped,
    Error,
};

std::string_view to_string(JobState state) noexcept;
std::optional<JobState> job_state_from_string(std::string_view name) noexcept;

// Engine state ordinals 0..7 in libtorrent order. Anything else reads as
// std::nullopt.
std::optional<JobState> job_state_from_engine(int ordinal) noexcept;

// States reached while the job is attached and the engine drives it.
bool is_engine_state(JobState state) noexcept;

// Repository-active: not finished, error or stopped.
bool is_active_state(JobState state) noexcept;

bool can_transition(JobState from, JobState to) noexcept;

struct JobMetrics
{
    std::optional<double> download_rate; // kB/s
    std::optional<double> upload_rate;   // kB/s
    std::optional<int> peers;
    std::optional<std::int64_t> eta; // seconds
    std::optional<std::int64_t> total_downloaded;
    std::optional<std::int64_t> total_uploaded;
    std::map<std::string, std::string> extra;
};

struct JobStatus
{
    std::string id;
    std::string title;
    std::string quality;
    JobState state = JobState::Queued;
    double progress = 0.0;
    std::string magnet;
    std::string source_url;
    std::string save_path;
    std::vector<std::string> sizes;
    std::optional<std::string> error_message;
    JobMetrics metrics;
    bool streaming = false;
    bool attached = false;
    std::int64_t created_at = 0;
    std::int64_t updated_at = 0;
};

struct JobRequest
{
    std::string title;
    std::string quality;
    std::string magnet;
    std::string source_url;
    std::vector<std::string> sizes;
    std::optional<int> year;
    std::string genre;
    std::optional<std::string> save_path;
};

struct VideoFileInfo
{
    std::string path;
    std::string name;
    std::int64_t size = 0;
    std::int64_t downloaded = 0;
    double progress = 0.0;
};

bool is_video_file(std::string_view path) noexcept;

} // namespace rf::engine
