#include "schedule/ScheduleManager.hpp"

#include "engine/Error.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/Job.hpp"
#include "engine/TorrentManager.hpp"
#include "schedule/CronExpression.hpp"
#include "utils/Id.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"
#include "utils/StateStore.hpp"
#include "utils/Time.hpp"

#include <yyjson.h>

#include <array>
#include <exception>
#include <utility>

namespace rf::schedule
{

namespace
{

constexpr std::array<char const *, 4> kQualities = {"720p", "1080p", "2160p",
                                                    "3D"};

CronExpression validate(ScheduleConfig const &config)
{
    auto expr = CronExpression::parse(config.cron_expression);
    if (!is_supported_quality(config.quality))
    {
        throw rf::Error(rf::ErrorKind::Validation,
                        "Unsupported quality: " + config.quality);
    }
    if (config.max_downloads < 1)
    {
        throw rf::Error(rf::ErrorKind::Validation,
                        "max_downloads must be at least 1");
    }
    return expr;
}

std::string describe_run(std::optional<std::int64_t> when)
{
    return when ? rf::utils::format_local_time(*when) : std::string("never");
}

Schedule to_schedule(storage::PersistedSchedule const &row)
{
    Schedule schedule;
    schedule.id = row.id;
    schedule.config.name = row.name;
    schedule.config.cron_expression = row.cron_expression;
    schedule.config.criteria = catalog::deserialize_criteria(row.criteria)
                                   .value_or(catalog::SearchCriteria{});
    schedule.config.quality = row.quality;
    schedule.config.max_downloads = row.max_downloads;
    schedule.config.enabled = row.enabled;
    schedule.last_run = row.last_run;
    schedule.next_run = row.next_run;
    schedule.last_run_status = row.last_run_status;
    schedule.created_at = row.created_at;
    schedule.updated_at = row.updated_at;
    return schedule;
}

void apply_config(storage::PersistedSchedule &row, ScheduleConfig const &config)
{
    row.name = config.name;
    row.cron_expression = config.cron_expression;
    row.criteria = catalog::serialize_criteria(config.criteria);
    row.quality = config.quality;
    row.max_downloads = config.max_downloads;
    row.enabled = config.enabled;
}

std::string serialize_summary(ExecutionSummary const &summary)
{
    rf::json::MutableDocument doc;
    auto *root = doc.make_object_root();
    if (root == nullptr)
    {
        return "{}";
    }
    auto *native = doc.doc();
    yyjson_mut_obj_add_uint(native, root, "movies_found",
                            summary.candidates_found);
    yyjson_mut_obj_add_uint(native, root, "movies_selected",
                            summary.candidates_selected);
    auto *titles = yyjson_mut_arr(native);
    for (auto const &title : summary.selected_titles)
    {
        yyjson_mut_arr_add_strcpy(native, titles, title.c_str());
    }
    yyjson_mut_obj_add_val(native, root, "selected_titles", titles);
    yyjson_mut_obj_add_uint(native, root, "downloads_started",
                            summary.jobs_started);
    return doc.write();
}

} // namespace

bool is_supported_quality(std::string const &quality) noexcept
{
    for (auto const *candidate : kQualities)
    {
        if (quality == candidate)
        {
            return true;
        }
    }
    return false;
}

ScheduleManager::Claim::Claim(ScheduleManager &owner, std::string id) noexcept
    : owner_(owner), id_(std::move(id))
{
}

ScheduleManager::Claim::~Claim()
{
    owner_.release(id_);
}

ScheduleManager::ScheduleManager(storage::Database *database,
                                 engine::TorrentManager *torrents,
                                 catalog::CatalogProvider *catalog,
                                 engine::EventBus *events,
                                 ScheduleManagerOptions options)
    : database_(database), torrents_(torrents), catalog_(catalog),
      events_(events), options_(options)
{
}

ScheduleManager::~ScheduleManager()
{
    shutdown();
}

std::string ScheduleManager::add_schedule(ScheduleConfig config)
{
    auto const expr = validate(config);
    auto const now = rf::utils::unix_now();

    storage::PersistedSchedule row;
    row.id = rf::utils::generate_id();
    apply_config(row, config);
    row.next_run = expr.next_after(now);
    row.created_at = now;
    row.updated_at = now;
    if (!database_->insert_schedule(row))
    {
        throw rf::Error(rf::ErrorKind::Repository, "Failed to store schedule");
    }
    RF_LOG_INFO("Added new schedule: {} - Next run: {}", row.id,
                describe_run(row.next_run));
    return row.id;
}

bool ScheduleManager::update_schedule(std::string const &id,
                                      ScheduleConfig config)
{
    auto const expr = validate(config);
    auto row = database_->schedule(id);
    if (!row)
    {
        return false;
    }
    auto const now = rf::utils::unix_now();
    apply_config(*row, config);
    row->next_run = expr.next_after(now);
    row->updated_at = now;
    if (!database_->update_schedule(*row))
    {
        RF_LOG_ERROR("Error updating schedule {}", id);
        return false;
    }
    RF_LOG_INFO("Updated schedule: {} - Next run: {}", id,
                describe_run(row->next_run));
    return true;
}

bool ScheduleManager::delete_schedule(std::string const &id)
{
    if (!database_->delete_schedule(id))
    {
        return false;
    }
    RF_LOG_INFO("Deleted schedule: {}", id);
    return true;
}

std::optional<Schedule> ScheduleManager::schedule(std::string const &id) const
{
    auto row = database_->schedule(id);
    if (!row)
    {
        return std::nullopt;
    }
    return to_schedule(*row);
}

std::vector<Schedule> ScheduleManager::schedules() const
{
    std::vector<Schedule> result;
    for (auto const &row : database_->schedules())
    {
        result.push_back(to_schedule(row));
    }
    return result;
}

std::vector<storage::ScheduleLogRecord>
ScheduleManager::logs(std::string const &id, int limit) const
{
    return database_->schedule_logs(id, limit);
}

bool ScheduleManager::claim(std::string const &id)
{
    std::lock_guard<std::mutex> lock(executing_mutex_);
    return executing_.insert(id).second;
}

void ScheduleManager::release(std::string const &id)
{
    std::lock_guard<std::mutex> lock(executing_mutex_);
    executing_.erase(id);
}

bool ScheduleManager::is_executing(std::string const &id) const
{
    std::lock_guard<std::mutex> lock(executing_mutex_);
    return executing_.count(id) != 0;
}

bool ScheduleManager::cancelled() const noexcept
{
    return stop_requested_.load() || tasks_.cancel_requested();
}

ExecutionResult ScheduleManager::execute_schedule(std::string const &id)
{
    if (!claim(id))
    {
        RF_LOG_WARN("Schedule {} is already being executed", id);
        return {ExecutionOutcome::AlreadyRunning, {},
                "Schedule is already being executed"};
    }
    Claim held(*this, id);
    return execute_claimed(id);
}

bool ScheduleManager::run_now(std::string const &id, bool background)
{
    if (!background)
    {
        auto const outcome = execute_schedule(id).outcome;
        return outcome == ExecutionOutcome::Completed ||
               outcome == ExecutionOutcome::NoCandidates;
    }
    if (!database_->schedule(id))
    {
        return false;
    }
    return launch(id);
}

bool ScheduleManager::launch(std::string const &id)
{
    if (!claim(id))
    {
        RF_LOG_WARN("Schedule {} is already being executed", id);
        return false;
    }
    bool const submitted = tasks_.submit(
        [this, id]
        {
            Claim held(*this, id);
            execute_claimed(id);
        });
    if (!submitted)
    {
        release(id);
    }
    return submitted;
}

std::size_t ScheduleManager::poll_once(std::int64_t now)
{
    std::size_t launched = 0;
    for (auto const &row : database_->due_schedules(now))
    {
        if (stop_requested_.load())
        {
            break;
        }
        if (is_executing(row.id))
        {
            continue;
        }
        RF_LOG_INFO("Schedule {} is due to run", row.id);
        if (!launch(row.id))
        {
            continue;
        }
        ++launched;
        if (options_.launch_stagger.count() > 0 &&
            wait_for_stop(options_.launch_stagger))
        {
            break;
        }
    }
    return launched;
}

ExecutionResult ScheduleManager::execute_claimed(std::string const &id)
{
    auto row = database_->schedule(id);
    if (!row)
    {
        RF_LOG_ERROR("Schedule {} not found", id);
        return {ExecutionOutcome::NotFound, {}, "Schedule not found"};
    }
    if (!database_->try_mark_schedule_running(id))
    {
        RF_LOG_WARN("Schedule {} was already running or modified by another "
                    "process",
                    id);
        return {ExecutionOutcome::AlreadyRunning, {},
                "Schedule is already running"};
    }
    RF_LOG_INFO("Executing schedule {}", id);

    ExecutionResult result;
    try
    {
        result = run_selection(*row);
    }
    catch (std::exception const &ex)
    {
        RF_LOG_ERROR("Error executing schedule {}: {}", id, ex.what());
        auto const now = rf::utils::unix_now();
        if (finish_run(*row, now, std::string("error: ") + ex.what()))
        {
            append_log(id, now, "error", std::string(ex.what()), std::nullopt);
        }
        result = {ExecutionOutcome::Failed, {}, ex.what()};
    }

    if (result.outcome == ExecutionOutcome::Interrupted)
    {
        RF_LOG_WARN("Schedule {} interrupted by shutdown", id);
        return result;
    }
    if (events_ != nullptr)
    {
        events_->publish(engine::ScheduleExecutedEvent{
            id, result.message, result.summary.job_ids});
    }
    return result;
}

ExecutionResult
ScheduleManager::run_selection(storage::PersistedSchedule const &row)
{
    ExecutionResult interrupted{ExecutionOutcome::Interrupted, {},
                                kInterruptedMessage};
    if (catalog_ == nullptr)
    {
        throw rf::Error(rf::ErrorKind::NotFound, "No catalog provider");
    }
    auto criteria = catalog::deserialize_criteria(row.criteria)
                        .value_or(catalog::SearchCriteria{});
    if (cancelled())
    {
        return interrupted;
    }
    auto candidates = catalog_->browse(criteria);
    if (cancelled())
    {
        return interrupted;
    }

    ExecutionSummary summary;
    if (candidates.empty())
    {
        RF_LOG_INFO("No movies found for schedule {}", row.id);
        auto const now = rf::utils::unix_now();
        if (finish_run(row, now, kStatusNoCandidates))
        {
            append_log(row.id, now, kStatusNoCandidates, std::nullopt,
                       serialize_summary(summary));
        }
        return {ExecutionOutcome::NoCandidates, summary, kStatusNoCandidates};
    }

    auto ranked = catalog::rank_by_rating(std::move(candidates));
    summary.candidates_found = ranked.size();

    auto const wanted = static_cast<std::size_t>(row.max_downloads);
    std::vector<std::pair<catalog::Candidate const *,
                          catalog::TorrentOption const *>>
        selected;
    for (auto const &candidate : ranked)
    {
        if (selected.size() >= wanted)
        {
            break;
        }
        auto const *torrent = catalog::find_torrent(candidate, row.quality);
        if (torrent == nullptr)
        {
            RF_LOG_WARN("No {} torrent found for {}", row.quality,
                        candidate.title);
            continue;
        }
        selected.emplace_back(&candidate, torrent);
        summary.selected_titles.push_back(candidate.title);
    }
    summary.candidates_selected = selected.size();
    RF_LOG_INFO("Found {} movies to download for schedule {}", selected.size(),
                row.id);

    for (auto const &[candidate, torrent] : selected)
    {
        if (cancelled())
        {
            interrupted.summary = summary;
            return interrupted;
        }
        if (options_.max_active_downloads > 0 && torrents_ != nullptr &&
            torrents_->active_download_count() >= options_.max_active_downloads)
        {
            RF_LOG_WARN("Active download limit {} reached; skipping {}",
                        options_.max_active_downloads, candidate->title);
            continue;
        }
        try
        {
            if (torrents_ == nullptr)
            {
                throw rf::Error(rf::ErrorKind::Engine, "No torrent manager");
            }
            engine::JobRequest request;
            request.title = candidate->title;
            request.quality = row.quality;
            request.magnet = torrent->magnet;
            request.source_url = candidate->link;
            request.sizes = torrent->sizes;
            request.year = candidate->year;
            request.genre = candidate->genre;
            summary.job_ids.push_back(torrents_->create_job(std::move(request)));
            ++summary.jobs_started;
            RF_LOG_INFO("Started download for {} ({})", candidate->title,
                        row.quality);
        }
        catch (std::exception const &ex)
        {
            RF_LOG_ERROR("Error downloading {}: {}", candidate->title,
                         ex.what());
        }
    }

    auto const now = rf::utils::unix_now();
    if (finish_run(row, now, kStatusCompleted))
    {
        append_log(row.id, now, kStatusCompleted, std::nullopt,
                   serialize_summary(summary));
    }
    return {ExecutionOutcome::Completed, std::move(summary), kStatusCompleted};
}

bool ScheduleManager::finish_run(storage::PersistedSchedule const &row,
                                 std::int64_t when, std::string const &status)
{
    std::optional<std::int64_t> next_run;
    try
    {
        next_run = CronExpression::parse(row.cron_expression).next_after(when);
    }
    catch (rf::Error const &ex)
    {
        RF_LOG_WARN("Schedule {} has an unusable cron expression: {}", row.id,
                    ex.what());
    }
    if (!database_->record_schedule_run(row.id, when, status, next_run))
    {
        RF_LOG_ERROR("Error updating next run for schedule {}", row.id);
        return false;
    }
    RF_LOG_INFO("Updated schedule {} next run to {}", row.id,
                describe_run(next_run));
    return true;
}

void ScheduleManager::append_log(std::string const &id, std::int64_t when,
                                 std::string const &status,
                                 std::optional<std::string> message,
                                 std::optional<std::string> results)
{
    storage::ScheduleLogRecord record;
    record.schedule_id = id;
    record.execution_time = when;
    record.status = status;
    record.message = std::move(message);
    record.results = std::move(results);
    if (!database_->append_schedule_log(record))
    {
        RF_LOG_WARN("failed to append log for schedule {}", id);
    }
}

void ScheduleManager::start()
{
    std::lock_guard<std::mutex> lock(loop_mutex_);
    if (loop_thread_.joinable() || shut_down_.load())
    {
        return;
    }
    loop_thread_ = std::thread([this] { run_loop(); });
    loop_started_.store(true);
}

bool ScheduleManager::running() const noexcept
{
    return loop_started_.load() && !stop_requested_.load();
}

bool ScheduleManager::wait_for_stop(std::chrono::milliseconds duration)
{
    std::unique_lock<std::mutex> lock(loop_mutex_);
    return loop_cv_.wait_for(lock, duration,
                             [this] { return stop_requested_.load(); });
}

void ScheduleManager::run_loop()
{
    RF_LOG_INFO("Scheduler task started");
    while (!stop_requested_.load())
    {
        auto wait = options_.poll_interval;
        try
        {
            poll_once(rf::utils::unix_now());
        }
        catch (std::exception const &ex)
        {
            RF_LOG_ERROR("Error in scheduler task: {}", ex.what());
            wait = options_.error_backoff;
        }
        if (wait_for_stop(wait))
        {
            break;
        }
    }
    RF_LOG_INFO("Scheduler task stopped");
}

void ScheduleManager::shutdown()
{
    if (shut_down_.exchange(true))
    {
        return;
    }
    RF_LOG_INFO("Shutting down scheduler...");
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        stop_requested_.store(true);
    }
    loop_cv_.notify_all();
    if (loop_thread_.joinable())
    {
        loop_thread_.join();
    }

    if (auto const active = tasks_.in_flight(); active > 0)
    {
        RF_LOG_INFO("Cancelling {} active schedule tasks", active);
    }
    if (!tasks_.stop(options_.shutdown_grace))
    {
        RF_LOG_WARN("Schedule executions still running after {} ms; scheduler "
                    "may not have shut down cleanly",
                    options_.shutdown_grace.count());
    }

    auto const interrupted = database_->mark_running_schedules_interrupted(
        rf::utils::unix_now(), kInterruptedMessage);
    for (auto const &id : interrupted)
    {
        RF_LOG_WARN("Schedule {} marked {}", id, kStatusInterrupted);
    }
    RF_LOG_INFO("Scheduler shutdown complete");
}

} // namespace rf::schedule
