#include "engine/TorrentManager.hpp"

#include "catalog/CatalogProvider.hpp"
#include "engine/Error.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/JobSerializer.hpp"
#include "engine/SchedulerService.hpp"
#include "utils/FS.hpp"
#include "utils/Id.hpp"
#include "utils/Log.hpp"
#include "utils/StateStore.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <system_error>
#include <unordered_set>

namespace rf::engine
{

namespace
{

constexpr auto kResumePollInterval = std::chrono::milliseconds(50);

JobState parse_state(std::string const &name)
{
    return job_state_from_string(name).value_or(JobState::Queued);
}

} // namespace

TorrentManager::EngineGuard::EngineGuard(TorrentManager &owner)
    : owner_(owner), lock_(owner.engine_mutex_)
{
    previous_ = owner_.engine_owner_.exchange(std::this_thread::get_id());
}

TorrentManager::EngineGuard::EngineGuard(TorrentManager &owner,
                                         std::chrono::milliseconds timeout)
    : owner_(owner), lock_(owner.engine_mutex_, timeout)
{
    if (lock_.owns_lock())
    {
        previous_ = owner_.engine_owner_.exchange(std::this_thread::get_id());
    }
}

TorrentManager::EngineGuard::~EngineGuard()
{
    if (lock_.owns_lock())
    {
        owner_.engine_owner_.store(previous_);
    }
}

TorrentManager::TorrentManager(EngineSession *engine,
                               storage::Database *database, EventBus *events,
                               catalog::CatalogProvider *catalog,
                               TorrentManagerOptions options)
    : engine_(engine), database_(database), events_(events), catalog_(catalog),
      options_(std::move(options)),
      resume_(database, options_.resume_data_timeout)
{
}

TorrentManager::~TorrentManager()
{
    stop_loop(options_.shutdown_grace);
    if (loop_thread_.joinable())
    {
        // still inside an engine call; joining would hang the caller
        RF_LOG_ERROR("reconciliation loop is stuck; detaching it");
        loop_thread_.detach();
    }
}

void TorrentManager::start()
{
    on_engine_thread(
        [this]
        {
            auto jobs = database_->active_jobs();
            for (auto const &job : jobs)
            {
                auto const state = parse_state(job.state);
                if (state == JobState::Error || handle_of(job.id))
                {
                    continue;
                }
                RF_LOG_INFO("Loaded job {} - {} ({})", job.id, job.title,
                            job.quality);
                bool const keep_paused =
                    state == JobState::Paused && job.user_paused;
                try
                {
                    attach_job(job, keep_paused);
                }
                catch (std::exception const &ex)
                {
                    RF_LOG_ERROR("failed to re-attach job {}: {}", job.id,
                                 ex.what());
                    set_state(job, JobState::Error, std::string(ex.what()));
                    append_log(job.id, std::string("Error: ") + ex.what(),
                               "ERROR", JobState::Error);
                    continue;
                }
                if (state == JobState::Paused && !keep_paused)
                {
                    // paused by a previous shutdown; carry on downloading
                    set_state(job, JobState::Queued);
                }
            }
            RF_LOG_INFO("{} job(s) attached at startup", attached_.size());
        });
    ensure_loop_running();
}

std::string TorrentManager::create_job(JobRequest request)
{
    if (request.magnet.empty())
    {
        throw rf::Error(rf::ErrorKind::Validation, "A magnet link is required");
    }
    if (request.title.empty())
    {
        throw rf::Error(rf::ErrorKind::Validation, "A title is required");
    }

    storage::PersistedJob job;
    job.id = rf::utils::generate_id();
    job.title = request.title;
    job.quality = request.quality;
    job.magnet = request.magnet;
    job.source_url = request.source_url;
    job.sizes = request.sizes;
    job.save_path =
        request.save_path && !request.save_path->empty()
            ? *request.save_path
            : (save_root() / rf::utils::sanitize_path_component(request.title))
                  .string();
    job.state = std::string(to_string(JobState::Queued));
    JobMetrics metrics;
    if (request.year)
    {
        metrics.extra["year"] = std::to_string(*request.year);
    }
    if (!request.genre.empty())
    {
        metrics.extra["genre"] = request.genre;
    }
    job.metadata = serialize_metrics(metrics);

    on_engine_thread(
        [this, &job]
        {
            if (!database_->insert_job(job))
            {
                throw rf::Error(rf::ErrorKind::Repository,
                                "Failed to store job for " + job.title);
            }
            append_log(job.id,
                       std::format("Started download for {} ({})", job.title,
                                   job.quality),
                       "INFO", JobState::Queued, 0.0);
            auto const on_failure = [this, &job](std::string const &message)
            {
                RF_LOG_ERROR("failed to start job {}: {}", job.id, message);
                set_state(job, JobState::Error, message);
                append_log(job.id, "Failed to start download: " + message,
                           "ERROR", JobState::Error);
            };
            try
            {
                attach_job(job, false);
            }
            catch (rf::Error const &ex)
            {
                on_failure(ex.what());
                if (ex.kind() == rf::ErrorKind::Engine)
                {
                    throw;
                }
                throw rf::Error(rf::ErrorKind::Engine, ex.what());
            }
            catch (std::exception const &ex)
            {
                on_failure(ex.what());
                throw rf::Error(rf::ErrorKind::Engine, ex.what());
            }
        });
    RF_LOG_INFO("Started download for {} ({}) as job {}", job.title,
                job.quality, job.id);
    ensure_loop_running();
    return job.id;
}

std::string
TorrentManager::create_job_from_catalog(std::string const &reference,
                                        std::string const &quality,
                                        std::optional<std::string> save_path)
{
    if (catalog_ == nullptr)
    {
        throw rf::Error(rf::ErrorKind::NotFound, "Movie not found");
    }
    auto candidate = catalog_->resolve(reference);
    if (!candidate)
    {
        throw rf::Error(rf::ErrorKind::NotFound, "Movie not found");
    }
    auto const *torrent = catalog::find_torrent(*candidate, quality);
    if (torrent == nullptr)
    {
        throw rf::Error(rf::ErrorKind::Conflict,
                        "No " + quality + " torrent available");
    }
    JobRequest request;
    request.title = candidate->title;
    request.quality = quality;
    request.magnet = torrent->magnet;
    request.source_url = candidate->link;
    request.sizes = torrent->sizes;
    request.year = candidate->year;
    request.genre = candidate->genre;
    request.save_path = std::move(save_path);
    return create_job(std::move(request));
}

bool TorrentManager::pause(std::string const &id)
{
    return on_engine_thread(
        [this, &id]
        {
            auto handle = handle_of(id);
            auto job = database_->job(id);
            if (!handle || !job)
            {
                return false;
            }
            auto const state = parse_state(job->state);
            if (!is_engine_state(state) || state == JobState::Finished)
            {
                return false;
            }
            engine_->pause(*handle);
            if (engine_->request_resume_data(*handle))
            {
                resume_.expect(id);
            }
            set_state(*job, JobState::Paused);
            database_->set_job_user_paused(id, true);
            append_log(id, "Download paused", "INFO", JobState::Paused,
                       job->progress);
            RF_LOG_INFO("paused job {}", id);
            return true;
        });
}

bool TorrentManager::resume(std::string const &id)
{
    bool reattached = false;
    bool const resumed = on_engine_thread(
        [this, &id, &reattached]
        {
            auto job = database_->job(id);
            if (!job)
            {
                return false;
            }
            auto const state = parse_state(job->state);
            if (auto handle = handle_of(id))
            {
                if (state != JobState::Paused)
                {
                    return false;
                }
                engine_->resume(*handle);
                auto next = JobState::Queued;
                if (auto st = engine_->status(*handle))
                {
                    next = job_state_from_engine(st->state)
                               .value_or(JobState::Queued);
                }
                set_state(*job, next);
                database_->set_job_user_paused(id, false);
                append_log(id, "Download resumed", "INFO", next,
                           job->progress);
                RF_LOG_INFO("resumed job {}", id);
                return true;
            }
            if (state != JobState::Paused && state != JobState::Stopped)
            {
                return false;
            }
            try
            {
                attach_job(*job, false);
            }
            catch (std::exception const &ex)
            {
                RF_LOG_ERROR("failed to re-add job {}: {}", id, ex.what());
                set_state(*job, JobState::Error, std::string(ex.what()));
                append_log(id, std::string("Error: ") + ex.what(), "ERROR",
                           JobState::Error);
                return false;
            }
            set_state(*job, JobState::Queued);
            database_->set_job_user_paused(id, false);
            append_log(id, "Download re-added and resumed", "INFO",
                       JobState::Queued, job->progress);
            RF_LOG_INFO("re-added job {}", id);
            reattached = true;
            return true;
        });
    if (reattached)
    {
        ensure_loop_running();
    }
    return resumed;
}

bool TorrentManager::stop(std::string const &id)
{
    return on_engine_thread(
        [this, &id]
        {
            auto handle = handle_of(id);
            if (!handle)
            {
                return false;
            }
            if (engine_->request_resume_data(*handle))
            {
                resume_.expect(id);
                if (!wait_for_resume_data(id, options_.resume_data_timeout))
                {
                    RF_LOG_WARN("no resume data for job {} within {} ms", id,
                                options_.resume_data_timeout.count());
                }
            }
            if (!handle_of(id))
            {
                // failed while we waited
                return false;
            }
            detach_job(id, false);
            auto job = database_->job(id);
            if (!job)
            {
                return false;
            }
            set_state(*job, JobState::Stopped);
            database_->set_job_user_paused(id, false);
            append_log(id, "Download stopped", "INFO", JobState::Stopped,
                       job->progress);
            RF_LOG_INFO("stopped job {}", id);
            return true;
        });
}

bool TorrentManager::remove(std::string const &id, bool delete_files)
{
    bool const removed = on_engine_thread(
        [this, &id, delete_files]
        {
            if (!database_->job(id))
            {
                return false;
            }
            if (handle_of(id))
            {
                detach_job(id, delete_files);
            }
            if (!database_->delete_job(id))
            {
                RF_LOG_WARN("failed to delete job {}", id);
                return false;
            }
            return true;
        });
    if (removed)
    {
        RF_LOG_INFO("Removed job {} (files {})", id,
                    delete_files ? "deleted" : "kept");
        if (events_ != nullptr)
        {
            events_->publish(JobRemovedEvent{id, delete_files});
        }
    }
    return removed;
}

std::optional<JobStatus> TorrentManager::status(std::string const &id) const
{
    auto job = database_->job(id);
    if (!job)
    {
        return std::nullopt;
    }
    return to_status(*job);
}

std::vector<JobStatus> TorrentManager::statuses() const
{
    std::vector<JobStatus> result;
    for (auto const &job : database_->jobs())
    {
        result.push_back(to_status(job));
    }
    return result;
}

std::vector<storage::JobLogRecord>
TorrentManager::logs(std::string const &id, int limit) const
{
    return database_->job_logs(id, limit);
}

bool TorrentManager::prioritize_streaming(std::string const &id)
{
    return on_engine_thread(
        [this, &id]
        {
            auto handle = handle_of(id);
            if (!handle)
            {
                return false;
            }
            if (!apply_streaming_priorities(*handle))
            {
                return false;
            }
            if (!database_->set_job_streaming(id, true))
            {
                RF_LOG_WARN("failed to persist streaming flag for job {}", id);
            }
            append_log(id, "Streaming priority enabled");
            return true;
        });
}

std::optional<VideoFileInfo>
TorrentManager::primary_video_file(std::string const &id)
{
    return on_engine_thread(
        [this, &id]() -> std::optional<VideoFileInfo>
        {
            auto job = database_->job(id);
            if (!job)
            {
                return std::nullopt;
            }
            std::filesystem::path const root(job->save_path);
            if (auto handle = handle_of(id))
            {
                auto files = engine_->files(*handle);
                if (!files)
                {
                    return std::nullopt;
                }
                EngineFile const *best = nullptr;
                for (auto const &file : *files)
                {
                    if (is_video_file(file.path) &&
                        (best == nullptr || file.size > best->size))
                    {
                        best = &file;
                    }
                }
                if (best == nullptr)
                {
                    return std::nullopt;
                }
                VideoFileInfo info;
                auto const full = root / best->path;
                info.path = full.string();
                info.name = full.filename().string();
                info.size = best->size;
                info.downloaded = best->downloaded;
                info.progress =
                    best->size > 0
                        ? std::min(100.0, static_cast<double>(best->downloaded) *
                                              100.0 /
                                              static_cast<double>(best->size))
                        : 0.0;
                return info;
            }

            std::error_code ec;
            if (!std::filesystem::is_directory(root, ec))
            {
                return std::nullopt;
            }
            std::optional<std::filesystem::path> best;
            std::uintmax_t best_size = 0;
            for (auto it = std::filesystem::recursive_directory_iterator(
                     root,
                     std::filesystem::directory_options::skip_permission_denied,
                     ec);
                 !ec && it != std::filesystem::recursive_directory_iterator();
                 it.increment(ec))
            {
                if (!it->is_regular_file(ec) ||
                    !is_video_file(it->path().string()))
                {
                    continue;
                }
                auto size = it->file_size(ec);
                if (ec)
                {
                    ec.clear();
                    continue;
                }
                if (!best || size > best_size)
                {
                    best = it->path();
                    best_size = size;
                }
            }
            if (!best)
            {
                return std::nullopt;
            }
            auto const state = parse_state(job->state);
            bool const complete =
                state == JobState::Finished || state == JobState::Seeding;
            VideoFileInfo info;
            info.path = best->string();
            info.name = best->filename().string();
            info.size = static_cast<std::int64_t>(best_size);
            info.progress = complete ? 100.0 : job->progress;
            info.downloaded = static_cast<std::int64_t>(
                static_cast<double>(best_size) * info.progress / 100.0);
            return info;
        });
}

void TorrentManager::shutdown()
{
    if (shut_down_.exchange(true))
    {
        return;
    }
    stop_loop(options_.shutdown_grace);

    EngineGuard guard(*this, options_.shutdown_grace);
    if (!guard.owns_lock())
    {
        RF_LOG_WARN("engine is unresponsive; torrent manager may not have "
                    "shut down cleanly");
        return;
    }
    std::vector<std::pair<std::string, EngineHandle>> jobs;
    {
        std::lock_guard<std::mutex> lock(attached_mutex_);
        for (auto const &[id, entry] : attached_)
        {
            jobs.emplace_back(id, entry.handle);
        }
    }
    std::size_t paused = 0;
    for (auto const &[id, handle] : jobs)
    {
        auto job = database_->job(id);
        if (!job)
        {
            continue;
        }
        auto const state = parse_state(job->state);
        engine_->pause(handle);
        if (engine_->request_resume_data(handle))
        {
            resume_.expect(id);
        }
        if (state != JobState::Paused && can_transition(state, JobState::Paused))
        {
            set_state(*job, JobState::Paused);
            append_log(id, "Paused during application shutdown", "INFO",
                       JobState::Paused, job->progress);
            ++paused;
        }
    }
    auto const deadline =
        std::chrono::steady_clock::now() + options_.resume_data_timeout;
    while (resume_.in_progress(std::chrono::steady_clock::now()) &&
           std::chrono::steady_clock::now() < deadline)
    {
        dispatch_alerts();
        std::this_thread::sleep_for(kResumePollInterval);
    }
    dispatch_alerts();
    resume_.clear();
    RF_LOG_INFO("torrent manager shut down ({} job(s) paused)", paused);
}

std::size_t TorrentManager::attached_count() const
{
    std::lock_guard<std::mutex> lock(attached_mutex_);
    return attached_.size();
}

std::size_t TorrentManager::active_download_count() const
{
    auto jobs = database_->active_jobs();
    return static_cast<std::size_t>(
        std::count_if(jobs.begin(), jobs.end(),
                      [](storage::PersistedJob const &job)
                      { return parse_state(job.state) != JobState::Paused; }));
}

void TorrentManager::reconcile_once()
{
    on_engine_thread([this] { tick(); });
}

bool TorrentManager::loop_running() const noexcept
{
    return loop_active_.load(std::memory_order_acquire);
}

bool TorrentManager::enqueue_task(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        if (!accepting_tasks_)
        {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    wake_cv_.notify_one();
    return true;
}

void TorrentManager::ensure_loop_running()
{
    if (!options_.autostart_loop || shut_down_.load())
    {
        return;
    }
    std::lock_guard<std::mutex> lock(loop_mutex_);
    if (loop_active_.load() || shut_down_.load())
    {
        return;
    }
    if (loop_thread_.joinable())
    {
        loop_thread_.join();
    }
    stop_requested_.store(false);
    {
        std::lock_guard<std::mutex> task_lock(task_mutex_);
        accepting_tasks_ = true;
    }
    loop_done_ = std::make_shared<std::promise<void>>();
    loop_done_future_ = loop_done_->get_future();
    loop_active_.store(true, std::memory_order_release);
    loop_thread_ = std::thread([this, done = loop_done_] {
        run_loop();
        done->set_value();
    });
    RF_LOG_DEBUG("reconciliation loop started");
}

void TorrentManager::stop_loop(std::chrono::milliseconds grace)
{
    std::lock_guard<std::mutex> lock(loop_mutex_);
    if (!loop_thread_.joinable())
    {
        return;
    }
    stop_requested_.store(true);
    wake_cv_.notify_all();
    if (loop_done_future_.valid() &&
        loop_done_future_.wait_for(grace) != std::future_status::ready)
    {
        RF_LOG_WARN("reconciliation loop did not stop within {} ms",
                    grace.count());
        return;
    }
    loop_thread_.join();
}

void TorrentManager::run_loop()
{
    loop_thread_id_.store(std::this_thread::get_id());
    SchedulerService timers;
    timers.every("reconciliation tick", options_.tick_interval,
                 [this] { tick(); });
    timers.every("resume data checkpoint", options_.checkpoint_interval,
                 [this] { checkpoint_resume_data(); });
    while (!stop_requested_.load())
    {
        {
            EngineGuard guard(*this);
            process_tasks();
            timers.tick(std::chrono::steady_clock::now());
        }
        auto wait = std::min<std::chrono::milliseconds>(
            timers.time_until_next_task(std::chrono::steady_clock::now()),
            options_.tick_interval);
        std::unique_lock<std::mutex> lock(task_mutex_);
        wake_cv_.wait_for(lock, wait,
                          [this]
                          { return !tasks_.empty() || stop_requested_.load(); });
    }
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        accepting_tasks_ = false;
    }
    {
        EngineGuard guard(*this);
        process_tasks();
    }
    loop_active_.store(false, std::memory_order_release);
    loop_thread_id_.store(std::thread::id{});
    RF_LOG_DEBUG("reconciliation loop stopped");
}

void TorrentManager::process_tasks()
{
    std::deque<std::function<void()>> pending;
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        pending.swap(tasks_);
    }
    for (auto &task : pending)
    {
        try
        {
            task();
        }
        catch (std::exception const &ex)
        {
            RF_LOG_ERROR("engine task failed: {}", ex.what());
        }
    }
}

void TorrentManager::tick()
{
    dispatch_alerts();
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(attached_mutex_);
        ids.reserve(attached_.size());
        for (auto const &[id, entry] : attached_)
        {
            ids.push_back(id);
        }
    }
    auto const now = std::chrono::steady_clock::now();
    for (auto const &id : ids)
    {
        reconcile_job(id, now);
    }
    prune_inactive();
}

void TorrentManager::dispatch_alerts()
{
    for (auto const &alert : engine_->poll_alerts())
    {
        std::string id;
        {
            std::lock_guard<std::mutex> lock(attached_mutex_);
            auto it = by_handle_.find(alert.handle);
            if (it == by_handle_.end())
            {
                continue;
            }
            id = it->second;
        }
        switch (alert.kind)
        {
        case EngineAlertKind::Finished:
            handle_finished(id);
            break;
        case EngineAlertKind::MetadataReceived:
            handle_metadata(id);
            break;
        case EngineAlertKind::ResumeDataSaved:
            resume_.persist(id, alert.resume_data);
            break;
        case EngineAlertKind::ResumeDataFailed:
            RF_LOG_WARN("resume data for job {} failed: {}", id,
                        alert.message);
            resume_.mark_completed(id);
            break;
        case EngineAlertKind::TorrentError:
            fail_job(id, alert.message);
            break;
        }
    }
}

void TorrentManager::reconcile_job(std::string const &id,
                                   std::chrono::steady_clock::time_point now)
{
    auto handle = handle_of(id);
    if (!handle)
    {
        return;
    }
    auto job = database_->job(id);
    if (!job)
    {
        return;
    }
    auto const current = parse_state(job->state);
    if (!is_active_state(current))
    {
        return;
    }

    std::optional<EngineStatus> st;
    try
    {
        st = engine_->status(*handle);
    }
    catch (std::exception const &ex)
    {
        fail_job(id, ex.what());
        return;
    }
    if (!st)
    {
        fail_job(id, "Torrent handle is no longer valid");
        return;
    }

    auto next = current;
    if (current != JobState::Paused)
    {
        auto mapped = job_state_from_engine(st->state);
        if (mapped && can_transition(current, *mapped))
        {
            next = *mapped;
        }
        else if (mapped)
        {
            RF_LOG_DEBUG("ignoring {} -> {} for job {}", to_string(current),
                         to_string(*mapped), id);
        }
    }

    double progress =
        std::max(job->progress, std::clamp(st->progress, 0.0, 1.0) * 100.0);
    if (next == JobState::Finished)
    {
        progress = 100.0;
    }
    progress = std::min(progress, 100.0);

    auto metrics = deserialize_metrics(job->metadata);
    metrics.download_rate = static_cast<double>(st->download_rate) / 1000.0;
    metrics.upload_rate = static_cast<double>(st->upload_rate) / 1000.0;
    metrics.peers = st->num_peers;
    metrics.total_downloaded = st->total_download;
    metrics.total_uploaded = st->total_upload;
    if (next == JobState::Downloading && st->download_rate > 0)
    {
        metrics.eta = std::max<std::int64_t>(
                          0, st->total_wanted - st->total_wanted_done) /
                      st->download_rate;
    }
    else
    {
        metrics.eta.reset();
    }

    storage::JobProgressUpdate update;
    update.id = id;
    update.state = std::string(to_string(next));
    update.progress = progress;
    update.metadata = serialize_metrics(metrics);
    if (!database_->update_job_progress(update))
    {
        RF_LOG_WARN("failed to persist progress for job {}", id);
        return;
    }
    if (next != current && events_ != nullptr)
    {
        events_->publish(JobStateChangedEvent{id, current, next, progress});
    }

    bool log_due = false;
    {
        std::lock_guard<std::mutex> lock(attached_mutex_);
        auto it = attached_.find(id);
        if (it != attached_.end())
        {
            it->second.has_metadata = st->has_metadata;
            if (now - it->second.last_log >= options_.log_interval)
            {
                it->second.last_log = now;
                log_due = true;
            }
        }
    }
    if (log_due)
    {
        auto message = st->has_metadata
                           ? std::format("Download progress: {:.2f}%", progress)
                           : std::string("Downloading metadata");
        append_log(id, message, "INFO", next, progress, metrics.download_rate);
    }
}

void TorrentManager::prune_inactive()
{
    auto active = database_->active_job_ids();
    if (!active)
    {
        RF_LOG_WARN("active job query failed; skipping prune");
        return;
    }
    std::unordered_set<std::string> keep(active->begin(), active->end());
    std::vector<std::string> stale;
    {
        std::lock_guard<std::mutex> lock(attached_mutex_);
        for (auto const &[id, entry] : attached_)
        {
            if (keep.count(id) == 0)
            {
                stale.push_back(id);
            }
        }
    }
    for (auto const &id : stale)
    {
        RF_LOG_DEBUG("detaching inactive job {}", id);
        detach_job(id, false);
    }
}

void TorrentManager::checkpoint_resume_data()
{
    std::vector<std::pair<std::string, EngineHandle>> jobs;
    {
        std::lock_guard<std::mutex> lock(attached_mutex_);
        for (auto const &[id, entry] : attached_)
        {
            jobs.emplace_back(id, entry.handle);
        }
    }
    for (auto const &[id, handle] : jobs)
    {
        if (engine_->request_resume_data(handle))
        {
            resume_.expect(id);
        }
    }
    RF_LOG_DEBUG("requested resume data checkpoint for {} job(s)", jobs.size());
}

void TorrentManager::handle_finished(std::string const &id)
{
    auto job = database_->job(id);
    if (!job)
    {
        return;
    }
    auto const state = parse_state(job->state);
    if (state == JobState::Finished || !can_transition(state, JobState::Finished))
    {
        return;
    }
    if (set_state(*job, JobState::Finished))
    {
        append_log(id, "Download completed", "INFO", JobState::Finished, 100.0);
        RF_LOG_INFO("job {} ({}) finished", id, job->title);
    }
}

void TorrentManager::handle_metadata(std::string const &id)
{
    auto handle = handle_of(id);
    auto job = database_->job(id);
    if (!handle || !job)
    {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(attached_mutex_);
        auto it = attached_.find(id);
        if (it != attached_.end())
        {
            it->second.has_metadata = true;
        }
    }
    if (parse_state(job->state) == JobState::DownloadingMetadata)
    {
        set_state(*job, JobState::Downloading);
    }
    if (job->streaming)
    {
        apply_streaming_priorities(*handle);
    }
    append_log(id, "Metadata received");
    // metadata changes what a resume blob can restore; store one now
    if (engine_->request_resume_data(*handle))
    {
        resume_.expect(id);
    }
}

void TorrentManager::fail_job(std::string const &id, std::string const &message)
{
    RF_LOG_ERROR("job {} failed: {}", id, message);
    if (auto job = database_->job(id))
    {
        set_state(*job, JobState::Error, message);
        append_log(id, "Error: " + message, "ERROR", JobState::Error,
                   job->progress);
    }
    detach_job(id, false);
}

EngineHandle TorrentManager::attach_job(storage::PersistedJob const &job,
                                        bool paused)
{
    AttachRequest request;
    request.source = job.magnet;
    request.save_path = job.save_path;
    request.resume_data = job.resume_data;
    request.sequential = job.streaming;
    request.paused = paused;
    auto handle = engine_->attach(request);
    {
        std::lock_guard<std::mutex> lock(attached_mutex_);
        AttachedJob entry;
        entry.handle = handle;
        entry.last_log = std::chrono::steady_clock::now();
        attached_[job.id] = entry;
        by_handle_[handle] = job.id;
    }
    RF_LOG_DEBUG("job {} attached as engine handle {}", job.id, handle);
    return handle;
}

void TorrentManager::detach_job(std::string const &id, bool delete_files)
{
    EngineHandle handle = 0;
    {
        std::lock_guard<std::mutex> lock(attached_mutex_);
        auto it = attached_.find(id);
        if (it == attached_.end())
        {
            return;
        }
        handle = it->second.handle;
        by_handle_.erase(handle);
        attached_.erase(it);
    }
    engine_->detach(handle, delete_files);
    resume_.mark_completed(id);
    if (auto job = database_->job(id))
    {
        auto metrics = deserialize_metrics(job->metadata);
        metrics.download_rate = 0.0;
        metrics.upload_rate = 0.0;
        metrics.eta.reset();
        database_->update_job_metadata(id, serialize_metrics(metrics));
    }
}

std::optional<EngineHandle>
TorrentManager::handle_of(std::string const &id) const
{
    std::lock_guard<std::mutex> lock(attached_mutex_);
    auto it = attached_.find(id);
    if (it == attached_.end())
    {
        return std::nullopt;
    }
    return it->second.handle;
}

bool TorrentManager::apply_streaming_priorities(EngineHandle handle)
{
    auto files = engine_->files(handle);
    if (!files)
    {
        return false;
    }
    std::vector<int> priorities;
    priorities.reserve(files->size());
    bool any_video = false;
    for (auto const &file : *files)
    {
        if (is_video_file(file.path))
        {
            priorities.push_back(kTopFilePriority);
            any_video = true;
        }
        else
        {
            priorities.push_back(kLowFilePriority);
        }
    }
    if (!any_video)
    {
        return false;
    }
    engine_->set_sequential(handle, true);
    engine_->set_file_priorities(handle, priorities);
    return true;
}

bool TorrentManager::wait_for_resume_data(std::string const &id,
                                          std::chrono::milliseconds timeout)
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (resume_.pending(id))
    {
        dispatch_alerts();
        if (!resume_.pending(id))
        {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            resume_.mark_completed(id);
            return false;
        }
        std::this_thread::sleep_for(kResumePollInterval);
    }
    return true;
}

bool TorrentManager::set_state(storage::PersistedJob const &job, JobState to,
                               std::optional<std::string> const &error)
{
    auto const from = parse_state(job.state);
    if (!can_transition(from, to))
    {
        RF_LOG_DEBUG("ignoring {} -> {} for job {}", to_string(from),
                     to_string(to), job.id);
        return false;
    }
    bool stored = false;
    double progress = job.progress;
    if (to == JobState::Finished)
    {
        progress = 100.0;
        storage::JobProgressUpdate update;
        update.id = job.id;
        update.state = std::string(to_string(to));
        update.progress = progress;
        update.metadata = job.metadata;
        stored = database_->update_job_progress(update);
    }
    else
    {
        stored = database_->update_job_state(
            job.id, std::string(to_string(to)),
            to == JobState::Error ? error : std::nullopt);
    }
    if (!stored)
    {
        RF_LOG_WARN("failed to store state {} for job {}", to_string(to),
                    job.id);
        return false;
    }
    if (from != to && events_ != nullptr)
    {
        events_->publish(JobStateChangedEvent{job.id, from, to, progress});
    }
    return true;
}

void TorrentManager::append_log(std::string const &id,
                                std::string const &message, char const *level,
                                std::optional<JobState> state,
                                std::optional<double> progress,
                                std::optional<double> download_rate)
{
    storage::JobLogRecord record;
    record.job_id = id;
    record.message = message;
    record.level = level;
    if (state)
    {
        record.state = std::string(to_string(*state));
    }
    record.progress = progress;
    record.download_rate = download_rate;
    if (!database_->append_job_log(record))
    {
        RF_LOG_WARN("failed to append log for job {}: {}", id, message);
    }
}

JobStatus TorrentManager::to_status(storage::PersistedJob const &job) const
{
    JobStatus status;
    status.id = job.id;
    status.title = job.title;
    status.quality = job.quality;
    status.state = parse_state(job.state);
    status.progress = job.progress;
    status.magnet = job.magnet;
    status.source_url = job.source_url;
    status.save_path = job.save_path;
    status.sizes = job.sizes;
    status.error_message = job.error_message;
    status.metrics = deserialize_metrics(job.metadata);
    status.streaming = job.streaming;
    status.attached = handle_of(job.id).has_value();
    status.created_at = job.created_at;
    status.updated_at = job.updated_at;
    return status;
}

std::filesystem::path TorrentManager::save_root() const
{
    if (!options_.default_save_root.empty())
    {
        return options_.default_save_root;
    }
    return rf::utils::data_root() / "downloads";
}

} // namespace rf::engine
