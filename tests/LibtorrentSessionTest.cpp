#include "engine/Error.hpp"
#include "engine/LibtorrentSession.hpp"
#include "engine/SettingsManager.hpp"

#include "support/TempRoot.hpp"

#include <string>

#include <doctest/doctest.h>

namespace
{

// Loopback only, no discovery: the session never leaves the machine.
rf::engine::EngineSettings offline_settings()
{
    rf::engine::EngineSettings settings;
    settings.listen_interfaces = "127.0.0.1";
    settings.port_min = 0;
    settings.port_max = 0;
    settings.enable_dht = false;
    settings.enable_lsd = false;
    settings.enable_upnp = false;
    settings.enable_natpmp = false;
    return settings;
}

constexpr char const *kMagnet =
    "magnet:?xt=urn:btih:0123456789abcdef0123456789abcdef01234567&dn=sample";

} // namespace

TEST_CASE("port ranges parse strictly")
{
    using rf::engine::SettingsManager;
    auto range = SettingsManager::parse_port_range("6881-6891");
    REQUIRE(range.has_value());
    CHECK(range->first == 6881);
    CHECK(range->second == 6891);
    auto single = SettingsManager::parse_port_range(" 7000 ");
    REQUIRE(single.has_value());
    CHECK(single->first == 7000);
    CHECK(single->second == 7000);
    CHECK_FALSE(SettingsManager::parse_port_range("").has_value());
    CHECK_FALSE(SettingsManager::parse_port_range("7000-6000").has_value());
    CHECK_FALSE(SettingsManager::parse_port_range("abc").has_value());
    CHECK_FALSE(SettingsManager::parse_port_range("70000").has_value());
}

TEST_CASE("listen interfaces get the first port where they have none")
{
    using rf::engine::SettingsManager;
    CHECK(SettingsManager::listen_interfaces_for("0.0.0.0", 6881) ==
          "0.0.0.0:6881");
    CHECK(SettingsManager::listen_interfaces_for("0.0.0.0:7000, [::]", 6881) ==
          "0.0.0.0:7000,[::]:6881");
    CHECK(SettingsManager::listen_interfaces_for("", 6881) == "0.0.0.0:6881");
}

TEST_CASE("the settings pack carries the discovery switches")
{
    auto pack =
        rf::engine::SettingsManager::build_settings_pack(offline_settings());
    CHECK_FALSE(pack.get_bool(libtorrent::settings_pack::enable_dht));
    CHECK_FALSE(pack.get_bool(libtorrent::settings_pack::enable_upnp));
    CHECK(pack.get_str(libtorrent::settings_pack::listen_interfaces) ==
          "127.0.0.1:0");
}

TEST_CASE("the session rejects unusable sources")
{
    auto root = rf::test::make_temp_root("lt-reject");
    rf::engine::LibtorrentSession session(offline_settings());

    rf::engine::AttachRequest request;
    request.save_path = (root / "downloads").string();
    request.source = "not-a-magnet";
    bool rejected = false;
    try
    {
        session.attach(request);
    }
    catch (rf::Error const &ex)
    {
        rejected = ex.kind() == rf::ErrorKind::Engine;
    }
    CHECK(rejected);

    request.source.clear();
    CHECK_THROWS_AS(session.attach(request), rf::Error);
    CHECK_FALSE(session.status(42).has_value());
    CHECK_FALSE(session.request_resume_data(42));
}

TEST_CASE("a paused magnet attaches and detaches without metadata")
{
    auto root = rf::test::make_temp_root("lt-attach");
    rf::engine::LibtorrentSession session(offline_settings());

    rf::engine::AttachRequest request;
    request.source = kMagnet;
    request.save_path = (root / "downloads").string();
    request.paused = true;
    auto handle = session.attach(request);

    auto status = session.status(handle);
    REQUIRE(status.has_value());
    CHECK(status->paused);
    CHECK_FALSE(status->has_metadata);
    CHECK(status->progress == doctest::Approx(0.0));
    CHECK_FALSE(session.files(handle).has_value());

    session.set_sequential(handle, true);
    session.detach(handle, false);
    CHECK_FALSE(session.status(handle).has_value());
    session.detach(handle, false);
}
