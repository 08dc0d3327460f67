#include "engine/SettingsManager.hpp"

#include "utils/Log.hpp"

#include <algorithm>
#include <charconv>
#include <libtorrent/alert.hpp>
#include <libtorrent/settings_pack.hpp>
#include <string>

namespace rf::engine
{

namespace
{

std::string_view trim(std::string_view value)
{
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
    {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t'))
    {
        value.remove_suffix(1);
    }
    return value;
}

std::optional<int> parse_port(std::string_view text)
{
    text = trim(text);
    int value = 0;
    auto const *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end || value <= 0 || value > 65535)
    {
        return std::nullopt;
    }
    return value;
}

bool entry_has_port(std::string_view entry)
{
    auto const bracket = entry.rfind(']');
    auto const colon = entry.rfind(':');
    if (colon == std::string_view::npos)
    {
        return false;
    }
    return bracket == std::string_view::npos || colon > bracket;
}

} // namespace

libtorrent::settings_pack
SettingsManager::build_settings_pack(EngineSettings const &s)
{
    libtorrent::settings_pack pack;
    pack.set_int(libtorrent::settings_pack::alert_mask,
                 libtorrent::alert::all_categories);
    pack.set_str(libtorrent::settings_pack::listen_interfaces,
                 listen_interfaces_for(s.listen_interfaces, s.port_min));
    // libtorrent walks port, port + 1, ... on bind failure
    pack.set_int(libtorrent::settings_pack::max_retry_port_bind,
                 std::max(0, s.port_max - s.port_min));
    pack.set_bool(libtorrent::settings_pack::enable_dht, s.enable_dht);
    pack.set_bool(libtorrent::settings_pack::enable_lsd, s.enable_lsd);
    pack.set_bool(libtorrent::settings_pack::enable_upnp, s.enable_upnp);
    pack.set_bool(libtorrent::settings_pack::enable_natpmp, s.enable_natpmp);
    pack.set_int(libtorrent::settings_pack::alert_queue_size,
                 std::max(1024, s.alert_queue_size));
    RF_LOG_DEBUG("engine listen interfaces {} (ports {}-{})",
                 pack.get_str(libtorrent::settings_pack::listen_interfaces),
                 s.port_min, s.port_max);
    return pack;
}

std::optional<std::pair<int, int>>
SettingsManager::parse_port_range(std::string_view text)
{
    text = trim(text);
    if (text.empty())
    {
        return std::nullopt;
    }
    auto const dash = text.find('-');
    if (dash == std::string_view::npos)
    {
        auto port = parse_port(text);
        if (!port)
        {
            return std::nullopt;
        }
        return std::make_pair(*port, *port);
    }
    auto low = parse_port(text.substr(0, dash));
    auto high = parse_port(text.substr(dash + 1));
    if (!low || !high || *low > *high)
    {
        return std::nullopt;
    }
    return std::make_pair(*low, *high);
}

std::string SettingsManager::listen_interfaces_for(std::string const &interfaces,
                                                   int port)
{
    std::string result;
    std::string_view remaining(interfaces);
    while (!remaining.empty())
    {
        auto const comma = remaining.find(',');
        auto entry = trim(remaining.substr(0, comma));
        remaining = comma == std::string_view::npos
                        ? std::string_view{}
                        : remaining.substr(comma + 1);
        if (entry.empty())
        {
            continue;
        }
        if (!result.empty())
        {
            result.push_back(',');
        }
        result.append(entry);
        if (!entry_has_port(entry))
        {
            result.push_back(':');
            result.append(std::to_string(port));
        }
    }
    if (result.empty())
    {
        result = "0.0.0.0:" + std::to_string(port);
    }
    return result;
}

} // namespace rf::engine
