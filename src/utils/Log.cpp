#include "utils/Log.hpp"
#include "utils/FS.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

namespace rf::log
{

namespace
{
std::atomic<int> g_level{static_cast<int>(Level::Info)};
} // namespace

void set_level(Level value) noexcept
{
    g_level.store(static_cast<int>(value), std::memory_order_relaxed);
}

Level level() noexcept
{
    return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

Level level_from_string(std::string_view name) noexcept
{
    std::string lowered;
    lowered.reserve(name.size());
    for (char ch : name)
    {
        lowered.push_back(static_cast<char>(
            std::tolower(static_cast<unsigned char>(ch))));
    }
    if (lowered == "debug" || lowered == "trace")
    {
        return Level::Debug;
    }
    if (lowered == "warning" || lowered == "warn")
    {
        return Level::Warn;
    }
    if (lowered == "error" || lowered == "critical")
    {
        return Level::Error;
    }
    return Level::Info;
}

bool append_log_line_to_file(std::string const &line) noexcept
{
    static std::mutex s_mutex;
    static std::ofstream s_ofs;
    static std::optional<std::filesystem::path> s_path;
    std::lock_guard<std::mutex> lk(s_mutex);
    if (!s_path)
    {
        s_path = rf::utils::data_root() / "reelfetch.log";
    }
    if (!s_ofs.is_open())
    {
        s_ofs.open(s_path->string(), std::ios::app | std::ios::out);
    }
    if (!s_ofs.is_open())
    {
        return false;
    }
    s_ofs << line << '\n';
    s_ofs.flush();
    return s_ofs.good();
}

} // namespace rf::log
