#include "utils/StateStore.hpp"

#include "utils/Json.hpp"
#include "utils/Log.hpp"
#include "utils/Time.hpp"
#include <yyjson.h>

#include <filesystem>
#include <system_error>

namespace rf::storage
{

std::string serialize_string_list(std::vector<std::string> const &values)
{
    rf::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "[]";
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_arr(native);
    yyjson_mut_doc_set_root(native, root);
    for (auto const &value : values)
    {
        yyjson_mut_arr_add_strncpy(native, root, value.data(), value.size());
    }
    return doc.write("[]");
}

std::vector<std::string> deserialize_string_list(std::string const &payload)
{
    auto doc = rf::json::Document::parse(payload);
    if (!doc.is_valid())
    {
        return {};
    }
    return rf::json::string_array(doc.root());
}

namespace
{

constexpr int kDatabaseBusyTimeoutMs = 5000;

constexpr char const *kJobColumns =
    "id, title, quality, magnet, source_url, save_path, sizes, state, "
    "progress, error_message, resume_data, metadata, streaming, user_paused, "
    "created_at, updated_at";

constexpr char const *kScheduleColumns =
    "id, name, cron_expression, criteria, quality, max_downloads, enabled, "
    "last_run, next_run, last_run_status, created_at, updated_at";

std::vector<std::uint8_t> copy_column_blob(sqlite3_stmt *stmt, int index)
{
    auto size = sqlite3_column_bytes(stmt, index);
    if (size <= 0)
    {
        return {};
    }
    auto data = sqlite3_column_blob(stmt, index);
    if (data == nullptr)
    {
        return {};
    }
    return std::vector<std::uint8_t>(
        reinterpret_cast<std::uint8_t const *>(data),
        reinterpret_cast<std::uint8_t const *>(data) +
            static_cast<std::size_t>(size));
}

std::optional<std::string> column_text(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL)
    {
        return std::nullopt;
    }
    auto *text = reinterpret_cast<char const *>(sqlite3_column_text(stmt, index));
    if (text == nullptr)
    {
        return std::nullopt;
    }
    return std::string(text, static_cast<std::size_t>(
                                 sqlite3_column_bytes(stmt, index)));
}

std::optional<std::int64_t> column_int64(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL)
    {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt, index));
}

std::optional<double> column_double(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL)
    {
        return std::nullopt;
    }
    return sqlite3_column_double(stmt, index);
}

void bind_text(sqlite3_stmt *stmt, int index, std::string const &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(),
                      static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void bind_optional_text(sqlite3_stmt *stmt, int index,
                        std::optional<std::string> const &value)
{
    if (value)
    {
        bind_text(stmt, index, *value);
    }
    else
    {
        sqlite3_bind_null(stmt, index);
    }
}

void bind_optional_int64(sqlite3_stmt *stmt, int index,
                         std::optional<std::int64_t> const &value)
{
    if (value)
    {
        sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(*value));
    }
    else
    {
        sqlite3_bind_null(stmt, index);
    }
}

void bind_optional_double(sqlite3_stmt *stmt, int index,
                          std::optional<double> const &value)
{
    if (value)
    {
        sqlite3_bind_double(stmt, index, *value);
    }
    else
    {
        sqlite3_bind_null(stmt, index);
    }
}

void finish(sqlite3_stmt *stmt)
{
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
}

PersistedJob read_job_row(sqlite3_stmt *stmt)
{
    PersistedJob job;
    job.id = column_text(stmt, 0).value_or("");
    job.title = column_text(stmt, 1).value_or("");
    job.quality = column_text(stmt, 2).value_or("");
    job.magnet = column_text(stmt, 3).value_or("");
    job.source_url = column_text(stmt, 4).value_or("");
    job.save_path = column_text(stmt, 5).value_or("");
    if (auto sizes = column_text(stmt, 6))
    {
        job.sizes = deserialize_string_list(*sizes);
    }
    job.state = column_text(stmt, 7).value_or("queued");
    job.progress = column_double(stmt, 8).value_or(0.0);
    job.error_message = column_text(stmt, 9);
    job.resume_data = copy_column_blob(stmt, 10);
    job.metadata = column_text(stmt, 11).value_or("");
    job.streaming = sqlite3_column_int(stmt, 12) != 0;
    job.user_paused = sqlite3_column_int(stmt, 13) != 0;
    job.created_at = column_int64(stmt, 14).value_or(0);
    job.updated_at = column_int64(stmt, 15).value_or(0);
    return job;
}

PersistedSchedule read_schedule_row(sqlite3_stmt *stmt)
{
    PersistedSchedule schedule;
    schedule.id = column_text(stmt, 0).value_or("");
    schedule.name = column_text(stmt, 1);
    schedule.cron_expression = column_text(stmt, 2).value_or("");
    schedule.criteria = column_text(stmt, 3).value_or("{}");
    schedule.quality = column_text(stmt, 4).value_or("");
    schedule.max_downloads = sqlite3_column_int(stmt, 5);
    schedule.enabled = sqlite3_column_int(stmt, 6) != 0;
    schedule.last_run = column_int64(stmt, 7);
    schedule.next_run = column_int64(stmt, 8);
    schedule.last_run_status = column_text(stmt, 9);
    schedule.created_at = column_int64(stmt, 10).value_or(0);
    schedule.updated_at = column_int64(stmt, 11).value_or(0);
    return schedule;
}

} // namespace

Database::Database(std::filesystem::path path) : path_(std::move(path))
{
    if (path_.empty())
    {
        return;
    }
    auto parent = path_.parent_path();
    if (!parent.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            RF_LOG_ERROR("failed to create database directory {}: {}",
                         parent.string(), ec.message());
            return;
        }
    }
    int rc = sqlite3_open_v2(path_.string().c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                 SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK)
    {
        RF_LOG_ERROR("failed to open sqlite database {}: {}", path_.string(),
                     sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    char *err_msg = nullptr;
    rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr,
                      &err_msg);
    if (rc != SQLITE_OK && err_msg != nullptr)
    {
        RF_LOG_WARN("failed to enable WAL journal mode: {}", err_msg);
    }
    if (err_msg != nullptr)
    {
        sqlite3_free(err_msg);
    }
    sqlite3_busy_timeout(db_, kDatabaseBusyTimeoutMs);
    if (!execute("PRAGMA foreign_keys=ON;") || !ensure_schema())
    {
        for (auto &entry : stmt_cache_)
        {
            sqlite3_finalize(entry.second);
        }
        stmt_cache_.clear();
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Database::~Database()
{
    for (auto &entry : stmt_cache_)
    {
        if (entry.second != nullptr)
        {
            sqlite3_finalize(entry.second);
        }
    }
    stmt_cache_.clear();
    if (db_)
    {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Database::ensure_schema()
{
    if (!db_)
    {
        return false;
    }
    constexpr char const *kSchemaVersionSql =
        "CREATE TABLE IF NOT EXISTS schema_version ("
        "id INTEGER PRIMARY KEY CHECK(id = 1),"
        "version INTEGER NOT NULL);";
    if (!execute(kSchemaVersionSql))
    {
        return false;
    }
    return run_migrations();
}

bool Database::execute(std::string const &sql) const
{
    if (!db_)
    {
        return false;
    }
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        if (err_msg != nullptr)
        {
            RF_LOG_ERROR("sqlite error: {}", err_msg);
            sqlite3_free(err_msg);
        }
        return false;
    }
    return true;
}

bool Database::run_migrations()
{
    if (!ensure_schema_version_row())
    {
        return false;
    }
    auto current = schema_version().value_or(0);
    struct Migration
    {
        int version;
        bool (Database::*apply)() const;
    };
    static constexpr Migration kMigrations[] = {
        {1, &Database::apply_migration_v1},
    };
    for (auto const &migration : kMigrations)
    {
        if (current >= migration.version)
        {
            continue;
        }
        if (!begin_transaction())
        {
            return false;
        }
        if (!(this->*migration.apply)() ||
            !set_schema_version(migration.version))
        {
            RF_LOG_ERROR("schema migration v{} failed", migration.version);
            rollback_transaction();
            return false;
        }
        if (!commit_transaction())
        {
            return false;
        }
        current = migration.version;
    }
    return true;
}

bool Database::ensure_schema_version_row() const
{
    constexpr char const *sql =
        "INSERT OR IGNORE INTO schema_version (id, version) VALUES (1, 0);";
    return execute(sql);
}

std::optional<int> Database::schema_version() const
{
    constexpr char const *sql =
        "SELECT version FROM schema_version WHERE id = 1 LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    std::optional<int> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result = static_cast<int>(sqlite3_column_int(stmt, 0));
    }
    finish(stmt);
    return result;
}

bool Database::set_schema_version(int version) const
{
    constexpr char const *sql =
        "INSERT OR REPLACE INTO schema_version (id, version) VALUES (1, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_int(stmt, 1, version);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE;
}

bool Database::apply_migration_v1() const
{
    constexpr char const *kSettingsSql = "CREATE TABLE IF NOT EXISTS settings ("
                                         "key TEXT PRIMARY KEY,"
                                         "value TEXT NOT NULL);";
    constexpr char const *kJobsSql =
        "CREATE TABLE IF NOT EXISTS jobs ("
        "id TEXT PRIMARY KEY,"
        "title TEXT NOT NULL,"
        "quality TEXT NOT NULL,"
        "magnet TEXT NOT NULL,"
        "source_url TEXT NOT NULL,"
        "save_path TEXT NOT NULL,"
        "sizes TEXT,"
        "state TEXT NOT NULL DEFAULT 'queued',"
        "progress REAL NOT NULL DEFAULT 0,"
        "error_message TEXT,"
        "resume_data BLOB,"
        "metadata TEXT,"
        "streaming INTEGER NOT NULL DEFAULT 0,"
        "user_paused INTEGER NOT NULL DEFAULT 0,"
        "created_at INTEGER NOT NULL,"
        "updated_at INTEGER NOT NULL);";
    constexpr char const *kJobLogsSql =
        "CREATE TABLE IF NOT EXISTS job_logs ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "job_id TEXT NOT NULL REFERENCES jobs(id) ON DELETE CASCADE,"
        "timestamp INTEGER NOT NULL,"
        "message TEXT NOT NULL,"
        "level TEXT NOT NULL DEFAULT 'INFO',"
        "state TEXT,"
        "progress REAL,"
        "download_rate REAL);";
    constexpr char const *kSchedulesSql =
        "CREATE TABLE IF NOT EXISTS schedules ("
        "id TEXT PRIMARY KEY,"
        "name TEXT,"
        "cron_expression TEXT NOT NULL,"
        "criteria TEXT NOT NULL,"
        "quality TEXT NOT NULL,"
        "max_downloads INTEGER NOT NULL DEFAULT 1,"
        "enabled INTEGER NOT NULL DEFAULT 1,"
        "last_run INTEGER,"
        "next_run INTEGER,"
        "last_run_status TEXT,"
        "created_at INTEGER NOT NULL,"
        "updated_at INTEGER NOT NULL);";
    constexpr char const *kScheduleLogsSql =
        "CREATE TABLE IF NOT EXISTS schedule_logs ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "schedule_id TEXT NOT NULL REFERENCES schedules(id) ON DELETE CASCADE,"
        "execution_time INTEGER NOT NULL,"
        "status TEXT NOT NULL,"
        "message TEXT,"
        "results TEXT);";
    constexpr char const *kIndexesSql =
        "CREATE INDEX IF NOT EXISTS idx_jobs_state ON jobs(state);"
        "CREATE INDEX IF NOT EXISTS idx_job_logs_job ON job_logs(job_id);"
        "CREATE INDEX IF NOT EXISTS idx_schedule_logs_schedule "
        "ON schedule_logs(schedule_id);";
    return execute(kSettingsSql) && execute(kJobsSql) &&
           execute(kJobLogsSql) && execute(kSchedulesSql) &&
           execute(kScheduleLogsSql) && execute(kIndexesSql);
}

sqlite3_stmt *Database::prepare_cached(std::string const &sql) const
{
    if (!db_)
    {
        return nullptr;
    }
    auto it = stmt_cache_.find(sql);
    if (it != stmt_cache_.end())
    {
        if (it->second != nullptr)
        {
            sqlite3_reset(it->second);
            sqlite3_clear_bindings(it->second);
        }
        return it->second;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        RF_LOG_ERROR("sqlite prepare failed: {}", sqlite3_errmsg(db_));
        return nullptr;
    }
    stmt_cache_.emplace(sql, stmt);
    return stmt;
}

bool Database::begin_transaction() const
{
    return execute("BEGIN TRANSACTION;");
}

bool Database::commit_transaction() const
{
    return execute("COMMIT;");
}

bool Database::rollback_transaction() const
{
    return execute("ROLLBACK;");
}

std::optional<std::string> Database::get_setting(std::string const &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr char const *sql =
        "SELECT value FROM settings WHERE key = ? LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    bind_text(stmt, 1, key);
    std::optional<std::string> value;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        value = column_text(stmt, 0);
    }
    finish(stmt);
    return value;
}

bool Database::set_setting(std::string const &key, std::string const &value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr char const *sql =
        "INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, key);
    bind_text(stmt, 2, value);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE;
}

bool Database::remove_setting(std::string const &key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr char const *sql = "DELETE FROM settings WHERE key = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, key);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE;
}

bool Database::insert_job(PersistedJob const &job)
{
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr char const *sql =
        "INSERT INTO jobs (id, title, quality, magnet, source_url, save_path, "
        "sizes, state, progress, error_message, resume_data, metadata, "
        "streaming, user_paused, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    auto const now = rf::utils::unix_now();
    bind_text(stmt, 1, job.id);
    bind_text(stmt, 2, job.title);
    bind_text(stmt, 3, job.quality);
    bind_text(stmt, 4, job.magnet);
    bind_text(stmt, 5, job.source_url);
    bind_text(stmt, 6, job.save_path);
    bind_text(stmt, 7, serialize_string_list(job.sizes));
    bind_text(stmt, 8, job.state);
    sqlite3_bind_double(stmt, 9, job.progress);
    bind_optional_text(stmt, 10, job.error_message);
    if (job.resume_data.empty())
    {
        sqlite3_bind_null(stmt, 11);
    }
    else
    {
        sqlite3_bind_blob(stmt, 11, job.resume_data.data(),
                          static_cast<int>(job.resume_data.size()),
                          SQLITE_TRANSIENT);
    }
    bind_text(stmt, 12, job.metadata.empty() ? std::string("{}") : job.metadata);
    sqlite3_bind_int(stmt, 13, job.streaming ? 1 : 0);
    sqlite3_bind_int(stmt, 14, job.user_paused ? 1 : 0);
    sqlite3_bind_int64(stmt, 15, job.created_at != 0 ? job.created_at : now);
    sqlite3_bind_int64(stmt, 16, now);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    if (rc != SQLITE_DONE)
    {
        RF_LOG_ERROR("failed to insert job {}: {}", job.id, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<PersistedJob> Database::query_jobs(char const *sql) const
{
    std::vector<PersistedJob> result;
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return result;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result.push_back(read_job_row(stmt));
    }
    finish(stmt);
    return result;
}

std::optional<PersistedJob> Database::job(std::string const &id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    static std::string const sql =
        std::string("SELECT ") + kJobColumns + " FROM jobs WHERE id = ? LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    bind_text(stmt, 1, id);
    std::optional<PersistedJob> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result = read_job_row(stmt);
    }
    finish(stmt);
    return result;
}

std::vector<PersistedJob> Database::jobs() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    static std::string const sql = std::string("SELECT ") + kJobColumns +
                                   " FROM jobs ORDER BY created_at, rowid;";
    return query_jobs(sql.c_str());
}

std::vector<PersistedJob> Database::active_jobs() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    static std::string const sql =
        std::string("SELECT ") + kJobColumns +
        " FROM jobs WHERE state NOT IN ('finished', 'error', 'stopped') "
        "ORDER BY created_at, rowid;";
    return query_jobs(sql.c_str());
}

std::optional<std::vector<std::string>> Database::active_job_ids() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr char const *sql =
        "SELECT id FROM jobs WHERE state NOT IN ('finished', 'error', "
        "'stopped');";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    std::vector<std::string> ids;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
    {
        if (auto id = column_text(stmt, 0))
        {
            ids.push_back(std::move(*id));
        }
    }
    finish(stmt);
    if (rc != SQLITE_DONE)
    {
        return std::nullopt;
    }
    return ids;
}

bool Database::update_job_progress(JobProgressUpdate const &update)
{
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr char const *sql =
        "UPDATE jobs SET state = ?, progress = ?, metadata = ?, "
        "updated_at = ? WHERE id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, update.state);
    sqlite3_bind_double(stmt, 2, update.progress);
    bind_text(stmt, 3, update.metadata);
    sqlite3_bind_int64(stmt, 4, rf::utils::unix_now());
    bind_text(stmt, 5, update.id);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE;
}

bool Database::update_job_state(std::string const &id, std::string const &state,
                                std::optional<std::string> const &error_message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr char const *sql =
        "UPDATE jobs SET state = ?, error_message = ?, updated_at = ? "
        "WHERE id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, state);
    bind_optional_text(stmt, 2, error_message);
    sqlite3_bind_int64(stmt, 3, rf::utils::unix_now());
    bind_text(stmt, 4, id);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE;
}

bool Database::update_job_metadata(std::string const &id,
                                   std::string const &metadata)
{
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr char const *sql =
        "UPDATE jobs SET metadata = ?, updated_at = ? WHERE id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, metadata);
    sqlite3_bind_int64(stmt, 2, rf::utils::unix_now());
    bind_text(stmt, 3, id);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE;
}

bool Database::update_job_resume_data(std::string const &id,
                                      std::vector<std::uint8_t> const &data)
{
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr char const *sql =
        "UPDATE jobs SET resume_data = ? WHERE id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    if (data.empty())
    {
        sqlite3_bind_null(stmt, 1);
    }
    else
    {
        sqlite3_bind_blob(stmt, 1, data.data(), static_cast<int>(data.size()),
                          SQLITE_TRANSIENT);
    }
    bind_text(stmt, 2, id);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

bool Database::set_job_streaming(std::string const &id, bool streaming)
{
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr char const *sql = "UPDATE jobs SET streaming = ? WHERE id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_int(stmt, 1, streaming ? 1 : 0);
    bind_text(stmt, 2, id);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE;
}

bool Database::set_job_user_paused(std::string const &id, bool user_paused)
{
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr char const *sql = "UPDATE jobs SET user_paused = ? WHERE id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_int(stmt, 1, user_paused ? 1 : 0);
    bind_text(stmt, 2, id);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE;
}

bool Database::delete_job(std::string const &id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr char const *sql = "DELETE FROM jobs WHERE id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, id);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

bool Database::append_job_log(JobLogRecord const &record)
{
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr char const *sql =
        "INSERT INTO job_logs (job_id, timestamp, message, level, state, "
        "progress, download_rate) VALUES (?, ?, ?, ?, ?, ?, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, record.job_id);
    sqlite3_bind_int64(stmt, 2, record.timestamp != 0 ? record.timestamp
                                                      : rf::utils::unix_now());
    bind_text(stmt, 3, record.message);
    bind_text(stmt, 4, record.level);
    bind_optional_text(stmt, 5, record.state);
    bind_optional_double(stmt, 6, record.progress);
    bind_optional_double(stmt, 7, record.download_rate);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE;
}

std::vector<JobLogRecord> Database::job_logs(std::string const &job_id,
                                             int limit) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JobLogRecord> result;
    constexpr char const *sql =
        "SELECT id, job_id, timestamp, message, level, state, progress, "
        "download_rate FROM job_logs WHERE job_id = ? "
        "ORDER BY id DESC LIMIT ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return result;
    }
    bind_text(stmt, 1, job_id);
    sqlite3_bind_int(stmt, 2, limit > 0 ? limit : -1);
    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        JobLogRecord record;
        record.id = column_int64(stmt, 0).value_or(0);
        record.job_id = column_text(stmt, 1).value_or("");
        record.timestamp = column_int64(stmt, 2).value_or(0);
        record.message = column_text(stmt, 3).value_or("");
        record.level = column_text(stmt, 4).value_or("INFO");
        record.state = column_text(stmt, 5);
        record.progress = column_double(stmt, 6);
        record.download_rate = column_double(stmt, 7);
        result.push_back(std::move(record));
    }
    finish(stmt);
    return result;
}

bool Database::insert_schedule(PersistedSchedule const &schedule)
{
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr char const *sql =
        "INSERT INTO schedules (id, name, cron_expression, criteria, quality, "
        "max_downloads, enabled, last_run, next_run, last_run_status, "
        "created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    auto const now = rf::utils::unix_now();
    bind_text(stmt, 1, schedule.id);
    bind_optional_text(stmt, 2, schedule.name);
    bind_text(stmt, 3, schedule.cron_expression);
    bind_text(stmt, 4, schedule.criteria);
    bind_text(stmt, 5, schedule.quality);
    sqlite3_bind_int(stmt, 6, schedule.max_downloads);
    sqlite3_bind_int(stmt, 7, schedule.enabled ? 1 : 0);
    bind_optional_int64(stmt, 8, schedule.last_run);
    bind_optional_int64(stmt, 9, schedule.next_run);
    bind_optional_text(stmt, 10, schedule.last_run_status);
    sqlite3_bind_int64(stmt, 11,
                       schedule.created_at != 0 ? schedule.created_at : now);
    sqlite3_bind_int64(stmt, 12, now);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    if (rc != SQLITE_DONE)
    {
        RF_LOG_ERROR("failed to insert schedule {}: {}", schedule.id,
                     sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool Database::update_schedule(PersistedSchedule const &schedule)
{
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr char const *sql =
        "UPDATE schedules SET name = ?, cron_expression = ?, criteria = ?, "
        "quality = ?, max_downloads = ?, enabled = ?, next_run = ?, "
        "updated_at = ? WHERE id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_optional_text(stmt, 1, schedule.name);
    bind_text(stmt, 2, schedule.cron_expression);
    bind_text(stmt, 3, schedule.criteria);
    bind_text(stmt, 4, schedule.quality);
    sqlite3_bind_int(stmt, 5, schedule.max_downloads);
    sqlite3_bind_int(stmt, 6, schedule.enabled ? 1 : 0);
    bind_optional_int64(stmt, 7, schedule.next_run);
    sqlite3_bind_int64(stmt, 8, rf::utils::unix_now());
    bind_text(stmt, 9, schedule.id);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

bool Database::delete_schedule(std::string const &id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr char const *sql = "DELETE FROM schedules WHERE id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, id);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

std::vector<PersistedSchedule>
Database::query_schedules(sqlite3_stmt *stmt) const
{
    std::vector<PersistedSchedule> result;
    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result.push_back(read_schedule_row(stmt));
    }
    finish(stmt);
    return result;
}

std::optional<PersistedSchedule>
Database::schedule(std::string const &id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    static std::string const sql = std::string("SELECT ") + kScheduleColumns +
                                   " FROM schedules WHERE id = ? LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    bind_text(stmt, 1, id);
    auto rows = query_schedules(stmt);
    if (rows.empty())
    {
        return std::nullopt;
    }
    return std::move(rows.front());
}

std::vector<PersistedSchedule> Database::schedules() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    static std::string const sql = std::string("SELECT ") + kScheduleColumns +
                                   " FROM schedules ORDER BY created_at, rowid;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return {};
    }
    return query_schedules(stmt);
}

std::vector<PersistedSchedule> Database::due_schedules(std::int64_t now) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    static std::string const sql =
        std::string("SELECT ") + kScheduleColumns +
        " FROM schedules WHERE enabled = 1 AND next_run IS NOT NULL "
        "AND next_run <= ? AND (last_run_status IS NULL OR "
        "last_run_status != 'running') ORDER BY next_run, rowid;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return {};
    }
    sqlite3_bind_int64(stmt, 1, now);
    return query_schedules(stmt);
}

bool Database::try_mark_schedule_running(std::string const &id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr char const *sql =
        "UPDATE schedules SET last_run_status = 'running', updated_at = ? "
        "WHERE id = ? AND (last_run_status IS NULL OR "
        "last_run_status != 'running');";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_int64(stmt, 1, rf::utils::unix_now());
    bind_text(stmt, 2, id);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(db_) == 1;
}

bool Database::record_schedule_run(std::string const &id, std::int64_t last_run,
                                   std::string const &status,
                                   std::optional<std::int64_t> next_run)
{
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr char const *sql =
        "UPDATE schedules SET last_run = ?, last_run_status = ?, next_run = ?, "
        "updated_at = ? WHERE id = ? AND last_run_status = 'running';";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_int64(stmt, 1, last_run);
    bind_text(stmt, 2, status);
    bind_optional_int64(stmt, 3, next_run);
    sqlite3_bind_int64(stmt, 4, rf::utils::unix_now());
    bind_text(stmt, 5, id);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

std::vector<std::string>
Database::mark_running_schedules_interrupted(std::int64_t now,
                                             std::string const &message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    if (!begin_transaction())
    {
        return ids;
    }
    constexpr char const *select_sql =
        "SELECT id FROM schedules WHERE last_run_status = 'running';";
    auto *select = prepare_cached(select_sql);
    if (select == nullptr)
    {
        rollback_transaction();
        return ids;
    }
    while (sqlite3_step(select) == SQLITE_ROW)
    {
        if (auto id = column_text(select, 0))
        {
            ids.push_back(std::move(*id));
        }
    }
    finish(select);
    if (ids.empty())
    {
        commit_transaction();
        return ids;
    }
    constexpr char const *update_sql =
        "UPDATE schedules SET last_run_status = 'interrupted', updated_at = ? "
        "WHERE last_run_status = 'running';";
    auto *update = prepare_cached(update_sql);
    bool ok = update != nullptr;
    if (ok)
    {
        sqlite3_bind_int64(update, 1, now);
        ok = sqlite3_step(update) == SQLITE_DONE;
        finish(update);
    }
    for (auto const &id : ids)
    {
        if (!ok)
        {
            break;
        }
        ScheduleLogRecord record;
        record.schedule_id = id;
        record.execution_time = now;
        record.status = "interrupted";
        record.message = message;
        ok = append_schedule_log_locked(record);
    }
    if (!ok || !commit_transaction())
    {
        rollback_transaction();
        return {};
    }
    return ids;
}

bool Database::append_schedule_log_locked(ScheduleLogRecord const &record) const
{
    constexpr char const *sql =
        "INSERT INTO schedule_logs (schedule_id, execution_time, status, "
        "message, results) VALUES (?, ?, ?, ?, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, record.schedule_id);
    sqlite3_bind_int64(stmt, 2, record.execution_time != 0
                                    ? record.execution_time
                                    : rf::utils::unix_now());
    bind_text(stmt, 3, record.status);
    bind_optional_text(stmt, 4, record.message);
    bind_optional_text(stmt, 5, record.results);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE;
}

bool Database::append_schedule_log(ScheduleLogRecord const &record)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return append_schedule_log_locked(record);
}

std::vector<ScheduleLogRecord>
Database::schedule_logs(std::string const &schedule_id, int limit) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ScheduleLogRecord> result;
    constexpr char const *sql =
        "SELECT id, schedule_id, execution_time, status, message, results "
        "FROM schedule_logs WHERE schedule_id = ? ORDER BY id DESC LIMIT ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return result;
    }
    bind_text(stmt, 1, schedule_id);
    sqlite3_bind_int(stmt, 2, limit > 0 ? limit : -1);
    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        ScheduleLogRecord record;
        record.id = column_int64(stmt, 0).value_or(0);
        record.schedule_id = column_text(stmt, 1).value_or("");
        record.execution_time = column_int64(stmt, 2).value_or(0);
        record.status = column_text(stmt, 3).value_or("");
        record.message = column_text(stmt, 4);
        record.results = column_text(stmt, 5);
        result.push_back(std::move(record));
    }
    finish(stmt);
    return result;
}

} // namespace rf::storage
