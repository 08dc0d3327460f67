#pragma once

#include "engine/EngineSession.hpp"
#include "engine/Job.hpp"
#include "engine/ResumeDataService.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rf::storage
{
class Database;
struct PersistedJob;
struct JobLogRecord;
} // namespace rf::storage

namespace rf::catalog
{
class CatalogProvider;
}

namespace rf::engine
{

class EventBus;

struct TorrentManagerOptions
{
    // Parent of per-title save directories; empty means
    // <data root>/downloads.
    std::filesystem::path default_save_root;
    std::chrono::milliseconds tick_interval{1000};
    std::chrono::seconds log_interval{30};
    std::chrono::milliseconds resume_data_timeout{5000};
    std::chrono::milliseconds shutdown_grace{10000};
    std::chrono::milliseconds checkpoint_interval{std::chrono::minutes(5)};
    // Start the reconciliation thread on start()/create_job(). Tests turn
    // this off and drive reconcile_once() themselves.
    bool autostart_loop = true;
};

// Owns every download job's link to the engine. Engine calls and job record
// writes happen on one thread: the reconciliation loop when it runs,
// otherwise the caller, under the engine mutex.
class TorrentManager
{
  public:
    TorrentManager(EngineSession *engine, storage::Database *database,
                   EventBus *events, catalog::CatalogProvider *catalog,
                   TorrentManagerOptions options = {});
    TorrentManager(TorrentManager const &) = delete;
    TorrentManager &operator=(TorrentManager const &) = delete;
    ~TorrentManager();

    // Re-attaches every active job from the repository.
    void start();

    std::string create_job(JobRequest request);
    std::string
    create_job_from_catalog(std::string const &reference,
                            std::string const &quality,
                            std::optional<std::string> save_path = std::nullopt);

    bool pause(std::string const &id);
    bool resume(std::string const &id);
    bool stop(std::string const &id);
    bool remove(std::string const &id, bool delete_files);

    std::optional<JobStatus> status(std::string const &id) const;
    std::vector<JobStatus> statuses() const;
    std::vector<storage::JobLogRecord> logs(std::string const &id,
                                            int limit = 100) const;

    bool prioritize_streaming(std::string const &id);
    std::optional<VideoFileInfo> primary_video_file(std::string const &id);

    void shutdown();

    std::size_t attached_count() const;
    // Repository-active jobs that are not paused.
    std::size_t active_download_count() const;

    void reconcile_once();
    bool loop_running() const noexcept;

    // Queues work for the reconciliation thread. False when the loop is not
    // accepting work.
    bool enqueue_task(std::function<void()> task);
    template <typename Fn>
    auto run_task(Fn &&fn) -> std::future<std::invoke_result_t<Fn>>
    {
        using result_t = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<result_t()>>(
            std::forward<Fn>(fn));
        auto future = task->get_future();
        if (!enqueue_task([task]() mutable { (*task)(); }))
        {
            EngineGuard guard(*this);
            (*task)();
        }
        return future;
    }

  private:
    struct AttachedJob
    {
        EngineHandle handle = 0;
        std::chrono::steady_clock::time_point last_log{};
        bool has_metadata = false;
    };

    // Holds the engine mutex and records the owning thread so nested
    // lifecycle calls run inline.
    class EngineGuard
    {
      public:
        explicit EngineGuard(TorrentManager &owner);
        // Gives up after timeout; check owns_lock().
        EngineGuard(TorrentManager &owner, std::chrono::milliseconds timeout);
        EngineGuard(EngineGuard const &) = delete;
        EngineGuard &operator=(EngineGuard const &) = delete;
        ~EngineGuard();

        bool owns_lock() const noexcept { return lock_.owns_lock(); }

      private:
        TorrentManager &owner_;
        std::unique_lock<std::recursive_timed_mutex> lock_;
        std::thread::id previous_;
    };

    template <typename Fn> auto on_engine_thread(Fn &&fn)
    {
        auto const self = std::this_thread::get_id();
        if (engine_owner_.load() == self || loop_thread_id_.load() == self ||
            !loop_running())
        {
            EngineGuard guard(*this);
            return fn();
        }
        return run_task(std::forward<Fn>(fn)).get();
    }

    void ensure_loop_running();
    void stop_loop(std::chrono::milliseconds grace);
    void run_loop();
    void process_tasks();

    void tick();
    void dispatch_alerts();
    void reconcile_job(std::string const &id,
                       std::chrono::steady_clock::time_point now);
    void prune_inactive();
    void checkpoint_resume_data();

    void handle_finished(std::string const &id);
    void handle_metadata(std::string const &id);
    void fail_job(std::string const &id, std::string const &message);

    EngineHandle attach_job(storage::PersistedJob const &job, bool paused);
    void detach_job(std::string const &id, bool delete_files);
    std::optional<EngineHandle> handle_of(std::string const &id) const;
    bool apply_streaming_priorities(EngineHandle handle);
    bool wait_for_resume_data(std::string const &id,
                              std::chrono::milliseconds timeout);

    bool set_state(storage::PersistedJob const &job, JobState to,
                   std::optional<std::string> const &error = std::nullopt);
    void append_log(std::string const &id, std::string const &message,
                    char const *level = "INFO",
                    std::optional<JobState> state = std::nullopt,
                    std::optional<double> progress = std::nullopt,
                    std::optional<double> download_rate = std::nullopt);
    JobStatus to_status(storage::PersistedJob const &job) const;
    std::filesystem::path save_root() const;

    EngineSession *engine_ = nullptr;
    storage::Database *database_ = nullptr;
    EventBus *events_ = nullptr;
    catalog::CatalogProvider *catalog_ = nullptr;
    TorrentManagerOptions options_;
    ResumeDataService resume_;

    mutable std::recursive_timed_mutex engine_mutex_;
    std::atomic<std::thread::id> engine_owner_{};

    // attached_ is written on the engine thread; readers elsewhere take
    // attached_mutex_.
    mutable std::mutex attached_mutex_;
    std::unordered_map<std::string, AttachedJob> attached_;
    std::unordered_map<EngineHandle, std::string> by_handle_;

    std::mutex loop_mutex_;
    std::thread loop_thread_;
    std::atomic<std::thread::id> loop_thread_id_{};
    std::atomic<bool> loop_active_{false};
    std::atomic<bool> stop_requested_{false};
    std::shared_ptr<std::promise<void>> loop_done_;
    std::future<void> loop_done_future_;
    std::atomic<bool> shut_down_{false};

    std::deque<std::function<void()>> tasks_;
    std::mutex task_mutex_;
    std::condition_variable wake_cv_;
    bool accepting_tasks_ = false;
};

} // namespace rf::engine
