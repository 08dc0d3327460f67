#pragma once

#include "catalog/CatalogProvider.hpp"
#include "engine/AsyncTaskService.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace rf::storage
{
class Database;
struct PersistedSchedule;
struct ScheduleLogRecord;
} // namespace rf::storage

namespace rf::engine
{
class EventBus;
class TorrentManager;
} // namespace rf::engine

namespace rf::schedule
{

struct ScheduleConfig
{
    std::optional<std::string> name;
    std::string cron_expression;
    catalog::SearchCriteria criteria;
    std::string quality = "1080p";
    int max_downloads = 1;
    bool enabled = true;
};

struct Schedule
{
    std::string id;
    ScheduleConfig config;
    std::optional<std::int64_t> last_run;
    std::optional<std::int64_t> next_run;
    std::optional<std::string> last_run_status;
    std::int64_t created_at = 0;
    std::int64_t updated_at = 0;
};

struct ExecutionSummary
{
    std::size_t candidates_found = 0;
    std::size_t candidates_selected = 0;
    std::vector<std::string> selected_titles;
    std::size_t jobs_started = 0;
    std::vector<std::string> job_ids;
};

enum class ExecutionOutcome
{
    Completed,
    NoCandidates,
    AlreadyRunning,
    NotFound,
    Interrupted,
    Failed,
};

struct ExecutionResult
{
    ExecutionOutcome outcome = ExecutionOutcome::Completed;
    ExecutionSummary summary;
    std::string message;
};

struct ScheduleManagerOptions
{
    std::chrono::milliseconds poll_interval{std::chrono::seconds(30)};
    std::chrono::milliseconds launch_stagger{std::chrono::seconds(2)};
    std::chrono::milliseconds error_backoff{std::chrono::seconds(60)};
    std::chrono::milliseconds shutdown_grace{std::chrono::seconds(10)};
    // Advisory cap on downloads that are not paused; 0 disables it.
    std::size_t max_active_downloads = 0;
};

inline constexpr char const *kStatusRunning = "running";
inline constexpr char const *kStatusCompleted = "completed";
inline constexpr char const *kStatusNoCandidates = "completed (no movies found)";
inline constexpr char const *kStatusInterrupted = "interrupted";
inline constexpr char const *kInterruptedMessage =
    "Execution interrupted by application shutdown";

bool is_supported_quality(std::string const &quality) noexcept;

// Cron-driven launcher of download jobs. Each execution runs on its own
// thread; a schedule executes at most once at a time, guarded in-process and
// by the "running" status in the repository.
class ScheduleManager
{
  public:
    ScheduleManager(storage::Database *database,
                    engine::TorrentManager *torrents,
                    catalog::CatalogProvider *catalog,
                    engine::EventBus *events = nullptr,
                    ScheduleManagerOptions options = {});
    ScheduleManager(ScheduleManager const &) = delete;
    ScheduleManager &operator=(ScheduleManager const &) = delete;
    ~ScheduleManager();

    // Throws rf::Error{Validation} for a bad cron expression, quality or
    // max_downloads; rf::Error{Repository} when the row cannot be written.
    std::string add_schedule(ScheduleConfig config);
    // False when the id is unknown. Validation as for add_schedule.
    bool update_schedule(std::string const &id, ScheduleConfig config);
    bool delete_schedule(std::string const &id);

    std::optional<Schedule> schedule(std::string const &id) const;
    std::vector<Schedule> schedules() const;
    std::vector<storage::ScheduleLogRecord> logs(std::string const &id,
                                                 int limit = 50) const;

    // Runs one execution on the calling thread.
    ExecutionResult execute_schedule(std::string const &id);
    // With background set, hands the execution to its own thread and
    // returns whether it was launched.
    bool run_now(std::string const &id, bool background = true);

    // Launches every schedule due at now; returns how many were launched.
    std::size_t poll_once(std::int64_t now);

    void start();
    void shutdown();

    bool running() const noexcept;
    bool is_executing(std::string const &id) const;

  private:
    class Claim
    {
      public:
        Claim(ScheduleManager &owner, std::string id) noexcept;
        Claim(Claim const &) = delete;
        Claim &operator=(Claim const &) = delete;
        ~Claim();

      private:
        ScheduleManager &owner_;
        std::string id_;
    };

    bool claim(std::string const &id);
    void release(std::string const &id);
    bool launch(std::string const &id);

    ExecutionResult execute_claimed(std::string const &id);
    ExecutionResult run_selection(storage::PersistedSchedule const &row);
    // False when the running mark was already cleared elsewhere, e.g. by an
    // interrupted shutdown; the caller then skips its log entry.
    bool finish_run(storage::PersistedSchedule const &row, std::int64_t when,
                    std::string const &status);
    void append_log(std::string const &id, std::int64_t when,
                    std::string const &status,
                    std::optional<std::string> message,
                    std::optional<std::string> results);
    bool cancelled() const noexcept;

    void run_loop();
    // True when shutdown was requested before the wait elapsed.
    bool wait_for_stop(std::chrono::milliseconds duration);

    storage::Database *database_ = nullptr;
    engine::TorrentManager *torrents_ = nullptr;
    catalog::CatalogProvider *catalog_ = nullptr;
    engine::EventBus *events_ = nullptr;
    ScheduleManagerOptions options_;

    mutable std::mutex executing_mutex_;
    std::unordered_set<std::string> executing_;

    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    std::thread loop_thread_;
    std::atomic<bool> loop_started_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> shut_down_{false};

    // Declared last: its destructor joins units that still reference the
    // members above.
    engine::AsyncTaskService tasks_;
};

} // namespace rf::schedule
