#pragma once

#include <filesystem>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <sqlite3.h>

namespace rf::storage {

struct PersistedJob {
  std::string id;
  std::string title;
  std::string quality;
  std::string magnet;
  std::string source_url;
  std::string save_path;
  std::vector<std::string> sizes;
  std::string state = "queued";
  double progress = 0.0;
  std::optional<std::string> error_message;
  std::vector<std::uint8_t> resume_data;
  std::string metadata; // JSON object text
  bool streaming = false;
  bool user_paused = false;
  std::int64_t created_at = 0;
  std::int64_t updated_at = 0;
};

// One reconciliation write: state, progress and the metrics JSON.
struct JobProgressUpdate {
  std::string id;
  std::string state;
  double progress = 0.0;
  std::string metadata;
};

struct JobLogRecord {
  std::int64_t id = 0;
  std::string job_id;
  std::int64_t timestamp = 0;
  std::string message;
  std::string level = "INFO";
  std::optional<std::string> state;
  std::optional<double> progress;
  std::optional<double> download_rate;
};

struct PersistedSchedule {
  std::string id;
  std::optional<std::string> name;
  std::string cron_expression;
  std::string criteria; // JSON object text
  std::string quality;
  int max_downloads = 1;
  bool enabled = true;
  std::optional<std::int64_t> last_run;
  std::optional<std::int64_t> next_run;
  std::optional<std::string> last_run_status;
  std::int64_t created_at = 0;
  std::int64_t updated_at = 0;
};

struct ScheduleLogRecord {
  std::int64_t id = 0;
  std::string schedule_id;
  std::int64_t execution_time = 0;
  std::string status;
  std::optional<std::string> message;
  std::optional<std::string> results; // JSON object text
};

std::string serialize_string_list(std::vector<std::string> const &values);
std::vector<std::string> deserialize_string_list(std::string const &payload);

// sqlite-backed job repository. Every public call is serialized on an
// internal mutex, so one instance may be shared between threads.
class Database {
public:
  explicit Database(std::filesystem::path path);
  ~Database();

  Database(Database const &) = delete;
  Database &operator=(Database const &) = delete;

  bool is_valid() const noexcept { return db_ != nullptr; }
  std::filesystem::path const &path() const noexcept { return path_; }

  std::optional<std::string> get_setting(std::string const &key) const;
  bool set_setting(std::string const &key, std::string const &value);
  bool remove_setting(std::string const &key);

  bool insert_job(PersistedJob const &job);
  std::optional<PersistedJob> job(std::string const &id) const;
  std::vector<PersistedJob> jobs() const;
  // Jobs whose state is not finished, error or stopped.
  std::vector<PersistedJob> active_jobs() const;
  // Same filter, ids only; std::nullopt when the query itself failed.
  std::optional<std::vector<std::string>> active_job_ids() const;
  bool update_job_progress(JobProgressUpdate const &update);
  bool update_job_state(std::string const &id, std::string const &state,
                        std::optional<std::string> const &error_message);
  bool update_job_metadata(std::string const &id, std::string const &metadata);
  bool update_job_resume_data(std::string const &id,
                              std::vector<std::uint8_t> const &data);
  bool set_job_streaming(std::string const &id, bool streaming);
  bool set_job_user_paused(std::string const &id, bool user_paused);
  // Returns true only when a row was deleted; logs go with it.
  bool delete_job(std::string const &id);

  bool append_job_log(JobLogRecord const &record);
  // Newest first.
  std::vector<JobLogRecord> job_logs(std::string const &job_id,
                                     int limit) const;

  bool insert_schedule(PersistedSchedule const &schedule);
  // Rewrites the user-editable columns and next_run. False when no row
  // matched.
  bool update_schedule(PersistedSchedule const &schedule);
  bool delete_schedule(std::string const &id);
  std::optional<PersistedSchedule> schedule(std::string const &id) const;
  std::vector<PersistedSchedule> schedules() const;
  // Enabled schedules with next_run <= now that are not marked running.
  std::vector<PersistedSchedule> due_schedules(std::int64_t now) const;
  // Compare-and-swap: sets last_run_status to "running" only if it is not
  // already "running". True when this caller won.
  bool try_mark_schedule_running(std::string const &id);
  // Clears the running mark. False when the schedule is not marked running.
  bool record_schedule_run(std::string const &id, std::int64_t last_run,
                           std::string const &status,
                           std::optional<std::int64_t> next_run);
  // Flips every "running" schedule to "interrupted" and logs it. Returns the
  // affected ids.
  std::vector<std::string>
  mark_running_schedules_interrupted(std::int64_t now,
                                     std::string const &message);

  bool append_schedule_log(ScheduleLogRecord const &record);
  // Newest first.
  std::vector<ScheduleLogRecord> schedule_logs(std::string const &schedule_id,
                                               int limit) const;

private:
  bool ensure_schema();
  bool run_migrations();
  bool ensure_schema_version_row() const;
  std::optional<int> schema_version() const;
  bool set_schema_version(int version) const;
  bool apply_migration_v1() const;
  bool execute(std::string const &sql) const;
  sqlite3_stmt *prepare_cached(std::string const &sql) const;
  bool begin_transaction() const;
  bool commit_transaction() const;
  bool rollback_transaction() const;
  std::vector<PersistedJob> query_jobs(char const *sql) const;
  std::vector<PersistedSchedule> query_schedules(sqlite3_stmt *stmt) const;
  bool append_schedule_log_locked(ScheduleLogRecord const &record) const;

  std::filesystem::path path_;
  sqlite3 *db_ = nullptr;
  mutable std::mutex mutex_;
  mutable std::unordered_map<std::string, sqlite3_stmt *> stmt_cache_;
};

} // namespace rf::storage
