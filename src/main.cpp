#include "app/ConfigurationService.hpp"
#include "app/DaemonMain.hpp"
#include "catalog/JsonFileCatalog.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/LibtorrentSession.hpp"
#include "engine/SettingsManager.hpp"
#include "engine/TorrentManager.hpp"
#include "schedule/ScheduleManager.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"
#include "utils/StateStore.hpp"

#include <charconv>
#include <cstddef>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace
{

// "--run-seconds=N" or "--run-seconds N": stop on our own after N seconds.
// Without a usable number the daemon stops after 5 seconds.
int parse_run_seconds(int argc, char *argv[])
{
    auto to_int = [](std::string_view text) -> int
    {
        int value = 0;
        auto [ptr, ec] =
            std::from_chars(text.data(), text.data() + text.size(), value);
        if (text.empty() || ec != std::errc() ||
            ptr != text.data() + text.size() || value <= 0)
        {
            return 5;
        }
        return value;
    };
    for (int index = 1; index < argc; ++index)
    {
        if (argv[index] == nullptr)
            continue;
        std::string_view arg = argv[index];
        if (arg.rfind("--run-seconds=", 0) == 0)
        {
            return to_int(arg.substr(14));
        }
        if (arg == "--run-seconds")
        {
            if (index + 1 < argc && argv[index + 1] &&
                argv[index + 1][0] != '-')
            {
                return to_int(argv[index + 1]);
            }
            return 5;
        }
    }
    return 0;
}

rf::engine::EngineSettings engine_settings_for(rf::app::AppConfig const &config)
{
    rf::engine::EngineSettings settings;
    if (auto range =
            rf::engine::SettingsManager::parse_port_range(config.port_range))
    {
        settings.port_min = range->first;
        settings.port_max = range->second;
    }
    settings.listen_interfaces = rf::engine::SettingsManager::listen_interfaces_for(
        config.listen_interfaces, settings.port_min);
    return settings;
}

} // namespace

namespace rf::app
{

int daemon_main(int argc, char *argv[])
{
    try
    {
        std::signal(SIGINT, [](int) { rf::runtime::request_shutdown(); });
        std::signal(SIGTERM, [](int) { rf::runtime::request_shutdown(); });

        auto const run_seconds = parse_run_seconds(argc, argv);

        auto root = rf::utils::data_root();
        if (!rf::utils::ensure_directory(root))
        {
            RF_LOG_ERROR("cannot create data directory {}", root.string());
            return 1;
        }
        auto db_path = root / "reelfetch.db";
        if (auto env = ConfigurationService::process_env("RF_DB_PATH"))
        {
            db_path = *env;
        }
        RF_LOG_INFO("Using data root {}", root.string());

        rf::storage::Database database(db_path);
        if (!database.is_valid())
        {
            RF_LOG_ERROR("cannot open database {}", db_path.string());
            return 1;
        }

        ConfigurationService configuration(
            &database, ConfigurationService::defaults_for(root));
        auto const config = configuration.load();
        rf::log::set_level(rf::log::level_from_string(config.log_level));
        RF_LOG_INFO("Downloads go to {}; catalog file {}",
                    config.download_path.string(),
                    config.catalog_path.string());

        rf::engine::EventBus bus;
        bus.subscribe<rf::engine::JobStateChangedEvent>(
            [](rf::engine::JobStateChangedEvent const &event)
            {
                RF_LOG_INFO("job {} {} -> {} ({:.2f}%)", event.job_id,
                            rf::engine::to_string(event.previous),
                            rf::engine::to_string(event.current),
                            event.progress);
            });
        bus.subscribe<rf::engine::JobRemovedEvent>(
            [](rf::engine::JobRemovedEvent const &event)
            {
                RF_LOG_INFO("job {} removed{}", event.job_id,
                            event.files_deleted ? " with its files" : "");
            });
        bus.subscribe<rf::engine::ScheduleExecutedEvent>(
            [](rf::engine::ScheduleExecutedEvent const &event)
            {
                RF_LOG_INFO("schedule {} finished: {} ({} jobs)",
                            event.schedule_id, event.status,
                            event.job_ids.size());
            });

        rf::engine::LibtorrentSession session(engine_settings_for(config));
        rf::catalog::JsonFileCatalog catalog(config.catalog_path);

        rf::engine::TorrentManagerOptions torrent_options;
        torrent_options.default_save_root = config.download_path;
        torrent_options.tick_interval =
            std::chrono::milliseconds(config.reconcile_interval_ms);
        rf::engine::TorrentManager torrents(&session, &database, &bus, &catalog,
                                            torrent_options);
        torrents.start();

        rf::schedule::ScheduleManagerOptions schedule_options;
        schedule_options.poll_interval =
            std::chrono::seconds(config.schedule_poll_seconds);
        schedule_options.max_active_downloads =
            static_cast<std::size_t>(config.max_active_downloads);
        rf::schedule::ScheduleManager schedules(&database, &torrents, &catalog,
                                                &bus, schedule_options);
        if (config.cron_enabled)
        {
            schedules.start();
        }
        else
        {
            RF_LOG_INFO("Scheduler disabled by configuration");
        }

        rf::log::print_status("reelfetch daemon running; CTRL+C to stop.");

        auto const started = std::chrono::steady_clock::now();
        while (!rf::runtime::wait_for_shutdown(std::chrono::milliseconds(200)))
        {
            if (run_seconds > 0 &&
                std::chrono::steady_clock::now() - started >=
                    std::chrono::seconds(run_seconds))
            {
                RF_LOG_INFO("Auto shutdown: run-seconds={} reached, "
                            "requesting shutdown",
                            run_seconds);
                rf::runtime::request_shutdown();
            }
        }

        RF_LOG_INFO("Shutdown requested; stopping scheduler and downloads...");
        // Executions may still create jobs, so the supervisor goes first.
        schedules.shutdown();
        torrents.shutdown();
        configuration.persist_if_dirty();

        rf::log::print_status("Shutdown complete.");
        RF_LOG_INFO("Shutdown complete.");
        return 0;
    }
    catch (std::exception const &ex)
    {
        std::fprintf(stderr, "reelfetch daemon failed: %s\n", ex.what());
        rf::log::print_status("reelfetch daemon failed: {}", ex.what());
    }
    return 1;
}

} // namespace rf::app

int main(int argc, char *argv[])
{
    return rf::app::daemon_main(argc, argv);
}
