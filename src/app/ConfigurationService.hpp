#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace rf::storage
{
class Database;
}

namespace rf::app
{

struct AppConfig
{
    std::filesystem::path data_root;
    std::filesystem::path download_path;
    std::string listen_interfaces = "0.0.0.0:6881";
    std::string port_range = "6881-6891";
    int max_active_downloads = 3;
    bool cron_enabled = true;
    int reconcile_interval_ms = 1000;
    int schedule_poll_seconds = 30;
    std::filesystem::path catalog_path;
    std::string log_level = "info";
};

// Settings table keys.
inline constexpr char const *kDownloadPathKey = "downloadPath";
inline constexpr char const *kListenInterfacesKey = "listenInterfaces";
inline constexpr char const *kPortRangeKey = "portRange";
inline constexpr char const *kMaxActiveDownloadsKey = "maxActiveDownloads";
inline constexpr char const *kCronEnabledKey = "cronEnabled";
inline constexpr char const *kReconcileIntervalKey = "reconcileIntervalMs";
inline constexpr char const *kSchedulePollKey = "schedulePollSeconds";
inline constexpr char const *kCatalogPathKey = "catalogPath";
inline constexpr char const *kLogLevelKey = "logLevel";

// Daemon settings. Precedence: built-in defaults, then the sqlite settings
// table, then RF_* environment variables. load() writes the merged result
// back so the table always shows what the daemon runs with.
class ConfigurationService
{
  public:
    using EnvReader = std::function<std::optional<std::string>(char const *)>;

    ConfigurationService(storage::Database *database, AppConfig defaults,
                         EnvReader read_env = process_env);

    static AppConfig defaults_for(std::filesystem::path const &data_root);
    static std::optional<std::string> process_env(char const *name);

    AppConfig load();
    AppConfig get() const;

    void set_download_path(std::filesystem::path const &path);
    void set_max_active_downloads(int value);
    void set_cron_enabled(bool enabled);

    void persist_if_dirty();
    bool persist_now();

  private:
    // False (with a warning) when value is unusable for key; config is left
    // unchanged then.
    static bool apply(AppConfig &config, std::string_view key,
                      std::string const &value, char const *source);
    void mark_dirty();

    storage::Database *database_;
    EnvReader read_env_;

    mutable std::shared_mutex mutex_;
    AppConfig settings_;

    std::atomic_bool dirty_{false};
};

} // namespace rf::app
