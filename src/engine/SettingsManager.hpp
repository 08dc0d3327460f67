#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <libtorrent/settings_pack.hpp>

namespace rf::engine
{

struct EngineSettings
{
    std::string listen_interfaces = "0.0.0.0:6881";
    int port_min = 6881;
    int port_max = 6891;
    bool enable_dht = true;
    bool enable_lsd = true;
    bool enable_upnp = true;
    bool enable_natpmp = true;
    int alert_queue_size = 8192;
};

class SettingsManager
{
  public:
    // Build a libtorrent settings_pack from EngineSettings
    static libtorrent::settings_pack
    build_settings_pack(EngineSettings const &s);

    // "6881-6891" or "6881". std::nullopt for anything else or a reversed
    // range.
    static std::optional<std::pair<int, int>>
    parse_port_range(std::string_view text);

    // Appends ":port" to every comma-separated entry that carries no port.
    static std::string listen_interfaces_for(std::string const &interfaces,
                                             int port);
};

} // namespace rf::engine
