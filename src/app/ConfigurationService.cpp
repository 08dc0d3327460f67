#include "app/ConfigurationService.hpp"

#include "engine/SettingsManager.hpp"
#include "utils/Log.hpp"
#include "utils/StateStore.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <mutex>
#include <utility>

namespace rf::app
{

namespace
{

struct Binding
{
    char const *key;
    char const *env;
};

constexpr std::array<Binding, 9> kBindings = {{
    {kDownloadPathKey, "RF_DOWNLOAD_PATH"},
    {kListenInterfacesKey, "RF_LISTEN_INTERFACES"},
    {kPortRangeKey, "RF_PORT_RANGE"},
    {kMaxActiveDownloadsKey, "RF_MAX_ACTIVE_DOWNLOADS"},
    {kCronEnabledKey, "RF_CRON_ENABLED"},
    {kReconcileIntervalKey, "RF_RECONCILE_INTERVAL_MS"},
    {kSchedulePollKey, "RF_SCHEDULE_POLL_SECONDS"},
    {kCatalogPathKey, "RF_CATALOG_PATH"},
    {kLogLevelKey, "RF_LOG_LEVEL"},
}};

std::optional<int> parse_int(std::string const &value)
{
    int result = 0;
    auto const *end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, result);
    if (value.empty() || ec != std::errc() || ptr != end)
    {
        return std::nullopt;
    }
    return result;
}

std::optional<bool> parse_bool(std::string const &value)
{
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    if (lowered == "true" || lowered == "1" || lowered == "yes" ||
        lowered == "on")
    {
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no" ||
        lowered == "off")
    {
        return false;
    }
    return std::nullopt;
}

std::string value_of(AppConfig const &config, std::string_view key)
{
    if (key == kDownloadPathKey)
        return config.download_path.string();
    if (key == kListenInterfacesKey)
        return config.listen_interfaces;
    if (key == kPortRangeKey)
        return config.port_range;
    if (key == kMaxActiveDownloadsKey)
        return std::to_string(config.max_active_downloads);
    if (key == kCronEnabledKey)
        return config.cron_enabled ? "true" : "false";
    if (key == kReconcileIntervalKey)
        return std::to_string(config.reconcile_interval_ms);
    if (key == kSchedulePollKey)
        return std::to_string(config.schedule_poll_seconds);
    if (key == kCatalogPathKey)
        return config.catalog_path.string();
    if (key == kLogLevelKey)
        return config.log_level;
    return {};
}

} // namespace

ConfigurationService::ConfigurationService(storage::Database *database,
                                           AppConfig defaults,
                                           EnvReader read_env)
    : database_(database), read_env_(std::move(read_env)),
      settings_(std::move(defaults))
{
}

AppConfig ConfigurationService::defaults_for(std::filesystem::path const &data_root)
{
    AppConfig config;
    config.data_root = data_root;
    config.download_path = data_root / "downloads";
    config.catalog_path = data_root / "catalog.json";
    return config;
}

std::optional<std::string> ConfigurationService::process_env(char const *name)
{
    auto const *value = std::getenv(name);
    if (value == nullptr || *value == '\0')
    {
        return std::nullopt;
    }
    return std::string(value);
}

bool ConfigurationService::apply(AppConfig &config, std::string_view key,
                                 std::string const &value, char const *source)
{
    bool ok = true;
    if (key == kDownloadPathKey)
    {
        ok = !value.empty();
        if (ok)
            config.download_path = value;
    }
    else if (key == kListenInterfacesKey)
    {
        ok = !value.empty();
        if (ok)
            config.listen_interfaces = value;
    }
    else if (key == kPortRangeKey)
    {
        ok = engine::SettingsManager::parse_port_range(value).has_value();
        if (ok)
            config.port_range = value;
    }
    else if (key == kMaxActiveDownloadsKey)
    {
        auto parsed = parse_int(value);
        ok = parsed && *parsed >= 0;
        if (ok)
            config.max_active_downloads = *parsed;
    }
    else if (key == kCronEnabledKey)
    {
        auto parsed = parse_bool(value);
        ok = parsed.has_value();
        if (ok)
            config.cron_enabled = *parsed;
    }
    else if (key == kReconcileIntervalKey)
    {
        auto parsed = parse_int(value);
        ok = parsed && *parsed > 0;
        if (ok)
            config.reconcile_interval_ms = *parsed;
    }
    else if (key == kSchedulePollKey)
    {
        auto parsed = parse_int(value);
        ok = parsed && *parsed > 0;
        if (ok)
            config.schedule_poll_seconds = *parsed;
    }
    else if (key == kCatalogPathKey)
    {
        ok = !value.empty();
        if (ok)
            config.catalog_path = value;
    }
    else if (key == kLogLevelKey)
    {
        ok = !value.empty();
        if (ok)
            config.log_level = value;
    }
    if (!ok)
    {
        RF_LOG_WARN("ignoring invalid {} value '{}' from {}", key, value,
                    source);
    }
    return ok;
}

AppConfig ConfigurationService::load()
{
    AppConfig merged = get();
    for (auto const &binding : kBindings)
    {
        if (database_ != nullptr)
        {
            if (auto stored = database_->get_setting(binding.key))
            {
                apply(merged, binding.key, *stored, "settings");
            }
        }
        if (read_env_)
        {
            if (auto env = read_env_(binding.env))
            {
                apply(merged, binding.key, *env, binding.env);
            }
        }
    }
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        settings_ = merged;
    }
    mark_dirty();
    persist_now();
    return merged;
}

AppConfig ConfigurationService::get() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return settings_;
}

void ConfigurationService::set_download_path(std::filesystem::path const &path)
{
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (settings_.download_path == path)
            return;
        settings_.download_path = path;
    }
    mark_dirty();
}

void ConfigurationService::set_max_active_downloads(int value)
{
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        settings_.max_active_downloads = std::max(0, value);
    }
    mark_dirty();
}

void ConfigurationService::set_cron_enabled(bool enabled)
{
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        settings_.cron_enabled = enabled;
    }
    mark_dirty();
}

void ConfigurationService::mark_dirty()
{
    dirty_.store(true, std::memory_order_release);
}

void ConfigurationService::persist_if_dirty()
{
    if (!dirty_.load(std::memory_order_acquire))
        return;
    persist_now();
}

bool ConfigurationService::persist_now()
{
    if (!database_)
        return false;

    AppConfig copy = get();
    bool ok = true;
    for (auto const &binding : kBindings)
    {
        if (!database_->set_setting(binding.key, value_of(copy, binding.key)))
        {
            ok = false;
        }
    }
    if (ok)
    {
        dirty_.store(false, std::memory_order_release);
    }
    else
    {
        RF_LOG_WARN("failed to persist settings");
    }
    return ok;
}

} // namespace rf::app
