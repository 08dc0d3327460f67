#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace rf::storage
{
class Database;
}

namespace rf::engine
{

// Tracks outstanding resume-data requests per job and stores the blobs the
// engine hands back. Driven from the reconciliation thread only.
class ResumeDataService
{
  public:
    using Clock = std::chrono::steady_clock;

    explicit ResumeDataService(
        storage::Database *database,
        std::chrono::milliseconds alert_timeout = std::chrono::seconds(5));

    // A save was requested for this job; (re)arms the deadline.
    void expect(std::string const &job_id);

    // Writes the blob and completes the job's request. Returns false when
    // the repository rejected it.
    bool persist(std::string const &job_id,
                 std::vector<std::uint8_t> const &blob);

    // Save failed or the job went away.
    void mark_completed(std::string const &job_id);

    bool pending(std::string const &job_id) const;

    // True while any request is outstanding and the deadline has not passed.
    bool in_progress(Clock::time_point now) const;

    void clear();

  private:
    void extend_deadline();

    storage::Database *database_ = nullptr;
    std::unordered_set<std::string> pending_;
    Clock::time_point deadline_{};
    std::chrono::milliseconds alert_timeout_{};
};

} // namespace rf::engine
