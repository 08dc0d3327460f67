#include "engine/Job.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace rf::engine
{

namespace
{

struct StateName
{
    JobState state;
    std::string_view name;
};

constexpr std::array<StateName, 11> kStateNames = {{
    {JobState::Queued, "queued"},
    {JobState::Checking, "checking"},
    {JobState::DownloadingMetadata, "downloading_metadata"},
    {JobState::Downloading, "downloading"},
    {JobState::Finished, "finished"},
    {JobState::Seeding, "seeding"},
    {JobState::Allocating, "allocating"},
    {JobState::CheckingFastresume, "checking_fastresume"},
    {JobState::Paused, "paused"},
    {JobState::Stopped, "stopped"},
    {JobState::Error, "error"},
}};

constexpr std::array<std::string_view, 8> kVideoExtensions = {
    ".mp4", ".mkv", ".avi", ".mov", ".webm", ".ogv", ".wmv", ".flv"};

} // namespace

std::string_view to_string(JobState state) noexcept
{
    for (auto const &entry : kStateNames)
    {
        if (entry.state == state)
        {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<JobState> job_state_from_string(std::string_view name) noexcept
{
    for (auto const &entry : kStateNames)
    {
        if (entry.name == name)
        {
            return entry.state;
        }
    }
    return std::nullopt;
}

std::optional<JobState> job_state_from_engine(int ordinal) noexcept
{
    switch (ordinal)
    {
    case 0:
        return JobState::Queued;
    case 1:
        return JobState::Checking;
    case 2:
        return JobState::DownloadingMetadata;
    case 3:
        return JobState::Downloading;
    case 4:
        return JobState::Finished;
    case 5:
        return JobState::Seeding;
    case 6:
        return JobState::Allocating;
    case 7:
        return JobState::CheckingFastresume;
    default:
        return std::nullopt;
    }
}

bool is_engine_state(JobState state) noexcept
{
    switch (state)
    {
    case JobState::Paused:
    case JobState::Stopped:
    case JobState::Error:
        return false;
    default:
        return true;
    }
}

bool is_active_state(JobState state) noexcept
{
    return state != JobState::Finished && state != JobState::Error &&
           state != JobState::Stopped;
}

bool can_transition(JobState from, JobState to) noexcept
{
    if (from == to)
    {
        return true;
    }
    switch (from)
    {
    case JobState::Error:
    case JobState::Finished:
        return false;
    case JobState::Stopped:
        // re-attach, or a re-attach that failed
        return to == JobState::Queued || to == JobState::Error;
    case JobState::Paused:
        return to != JobState::Finished;
    default:
        // attached: any engine-observed state, or pause/stop/error
        return true;
    }
}

bool is_video_file(std::string_view path) noexcept
{
    auto const dot = path.rfind('.');
    if (dot == std::string_view::npos)
    {
        return false;
    }
    auto const slash = path.find_last_of("/\\");
    if (slash != std::string_view::npos && slash > dot)
    {
        return false;
    }
    std::string extension(path.substr(dot));
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    return std::find(kVideoExtensions.begin(), kVideoExtensions.end(),
                     extension) != kVideoExtensions.end();
}

} // namespace rf::engine
