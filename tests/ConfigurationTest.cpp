#include "app/ConfigurationService.hpp"
#include "utils/StateStore.hpp"

#include "support/TempRoot.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include <doctest/doctest.h>

namespace
{

rf::app::ConfigurationService::EnvReader
env_from(std::map<std::string, std::string> values)
{
    return [values = std::move(values)](char const *name)
               -> std::optional<std::string>
    {
        auto it = values.find(name);
        if (it == values.end())
        {
            return std::nullopt;
        }
        return it->second;
    };
}

} // namespace

TEST_CASE("defaults hang off the data root")
{
    auto root = std::filesystem::path("/srv/reelfetch");
    auto defaults = rf::app::ConfigurationService::defaults_for(root);
    CHECK(defaults.data_root == root);
    CHECK(defaults.download_path == root / "downloads");
    CHECK(defaults.catalog_path == root / "catalog.json");
    CHECK(defaults.port_range == "6881-6891");
    CHECK(defaults.max_active_downloads == 3);
    CHECK(defaults.cron_enabled);
}

TEST_CASE("settings override defaults and the environment overrides both")
{
    auto root = rf::test::make_temp_root("config-precedence");
    rf::storage::Database db(root / "state.db");
    REQUIRE(db.is_valid());
    REQUIRE(db.set_setting(rf::app::kDownloadPathKey, (root / "stored").string()));
    REQUIRE(db.set_setting(rf::app::kMaxActiveDownloadsKey, "5"));
    REQUIRE(db.set_setting(rf::app::kCronEnabledKey, "false"));

    rf::app::ConfigurationService config(
        &db, rf::app::ConfigurationService::defaults_for(root),
        env_from({{"RF_MAX_ACTIVE_DOWNLOADS", "7"},
                  {"RF_LOG_LEVEL", "debug"}}));
    auto loaded = config.load();

    CHECK(loaded.download_path == root / "stored");
    CHECK(loaded.max_active_downloads == 7);
    CHECK_FALSE(loaded.cron_enabled);
    CHECK(loaded.log_level == "debug");
    CHECK(loaded.listen_interfaces == "0.0.0.0:6881");
    CHECK(config.get().max_active_downloads == 7);

    // the merged view is written back
    CHECK(db.get_setting(rf::app::kMaxActiveDownloadsKey) ==
          std::optional<std::string>("7"));
    CHECK(db.get_setting(rf::app::kLogLevelKey) ==
          std::optional<std::string>("debug"));
    CHECK(db.get_setting(rf::app::kPortRangeKey) ==
          std::optional<std::string>("6881-6891"));
}

TEST_CASE("unusable values are ignored")
{
    auto root = rf::test::make_temp_root("config-invalid");
    rf::storage::Database db(root / "state.db");
    REQUIRE(db.is_valid());
    REQUIRE(db.set_setting(rf::app::kPortRangeKey, "7000-6000"));
    REQUIRE(db.set_setting(rf::app::kReconcileIntervalKey, "0"));

    rf::app::ConfigurationService config(
        &db, rf::app::ConfigurationService::defaults_for(root),
        env_from({{"RF_MAX_ACTIVE_DOWNLOADS", "lots"},
                  {"RF_CRON_ENABLED", "maybe"},
                  {"RF_SCHEDULE_POLL_SECONDS", "15"}}));
    auto loaded = config.load();
    CHECK(loaded.port_range == "6881-6891");
    CHECK(loaded.reconcile_interval_ms == 1000);
    CHECK(loaded.max_active_downloads == 3);
    CHECK(loaded.cron_enabled);
    CHECK(loaded.schedule_poll_seconds == 15);
    CHECK(db.get_setting(rf::app::kPortRangeKey) ==
          std::optional<std::string>("6881-6891"));
}

TEST_CASE("ConfigurationService persists user settings")
{
    auto root = rf::test::make_temp_root("config-persist");
    auto db_path = root / "state.db";
    {
        rf::storage::Database db(db_path);
        REQUIRE(db.is_valid());
        rf::app::ConfigurationService config(
            &db, rf::app::ConfigurationService::defaults_for(root), nullptr);
        config.load();

        auto const new_path = root / "elsewhere";
        config.set_download_path(new_path);
        config.set_max_active_downloads(-4);
        config.set_cron_enabled(false);
        auto modified = config.get();
        CHECK(modified.download_path == new_path);
        CHECK(modified.max_active_downloads == 0);
        CHECK_FALSE(modified.cron_enabled);

        // not written until persisted
        CHECK(db.get_setting(rf::app::kDownloadPathKey) ==
              std::optional<std::string>((root / "downloads").string()));
        config.persist_if_dirty();
    }

    rf::storage::Database reader(db_path);
    REQUIRE(reader.is_valid());
    rf::app::ConfigurationService reloaded(
        &reader, rf::app::ConfigurationService::defaults_for(root), nullptr);
    auto config = reloaded.load();
    CHECK(config.download_path == root / "elsewhere");
    CHECK(config.max_active_downloads == 0);
    CHECK_FALSE(config.cron_enabled);
}

TEST_CASE("persisting without a database reports failure")
{
    rf::app::ConfigurationService config(
        nullptr, rf::app::ConfigurationService::defaults_for("/tmp/rf"),
        nullptr);
    auto loaded = config.load();
    CHECK(loaded.download_path == std::filesystem::path("/tmp/rf") / "downloads");
    CHECK_FALSE(config.persist_now());
}
