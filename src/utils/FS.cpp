#include "utils/FS.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <system_error>
#include <vector>

#if defined(__APPLE__)
#include <mach-o/dyld.h>
#else
#include <unistd.h>
#endif

namespace rf::utils
{

namespace
{

std::optional<std::filesystem::path> env_path(char const *key)
{
    auto const *value = std::getenv(key);
    if (value == nullptr || *value == '\0')
    {
        return std::nullopt;
    }
    return std::filesystem::path(value);
}

std::filesystem::path fallback_root()
{
    if (auto exe = executable_path(); exe && !exe->filename().empty())
    {
        return exe->parent_path();
    }
    return std::filesystem::current_path();
}

} // namespace

std::optional<std::filesystem::path>
ensure_directory(std::filesystem::path const &candidate)
{
    std::error_code ec;
    std::filesystem::create_directories(candidate, ec);
    if (!ec || std::filesystem::exists(candidate))
    {
        return candidate;
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> executable_path()
{
#if defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    if (size == 0)
    {
        return std::nullopt;
    }
    std::vector<char> buffer(size);
    if (_NSGetExecutablePath(buffer.data(), &size) != 0)
    {
        return std::nullopt;
    }
    return std::filesystem::path(buffer.data());
#else
    std::vector<char> buffer(4096);
    while (true)
    {
        ssize_t length =
            readlink("/proc/self/exe", buffer.data(), buffer.size());
        if (length == -1)
        {
            return std::nullopt;
        }
        if (static_cast<std::size_t>(length) < buffer.size())
        {
            return std::filesystem::path(buffer.data(), buffer.data() + length);
        }
        buffer.resize(buffer.size() * 2);
    }
#endif
}

std::filesystem::path data_root()
{
    if (auto explicit_root = env_path("RF_DATA_ROOT"))
    {
        if (auto ensured = ensure_directory(*explicit_root))
        {
            return *ensured;
        }
    }
    std::optional<std::filesystem::path> base = env_path("XDG_DATA_HOME");
    if (!base)
    {
        if (auto home = env_path("HOME"))
        {
            base = *home / ".local" / "share";
        }
    }
    if (base)
    {
        if (auto ensured = ensure_directory(*base / "reelfetch"))
        {
            return *ensured;
        }
    }
    auto fallback = fallback_root();
    fallback /= "data";
    if (auto ensured = ensure_directory(fallback))
    {
        return *ensured;
    }
    return fallback;
}

std::string sanitize_path_component(std::string_view name)
{
    std::string result;
    result.reserve(name.size());
    for (char ch : name)
    {
        switch (ch)
        {
        case '/':
        case '\\':
        case ':':
        case '*':
        case '?':
        case '"':
        case '<':
        case '>':
        case '|':
            result.push_back('_');
            break;
        default:
            if (static_cast<unsigned char>(ch) >= 0x20)
            {
                result.push_back(ch);
            }
            break;
        }
    }
    while (!result.empty() && (result.back() == ' ' || result.back() == '.'))
    {
        result.pop_back();
    }
    while (!result.empty() && result.front() == ' ')
    {
        result.erase(result.begin());
    }
    if (result.empty() || result == "..")
    {
        return "untitled";
    }
    return result;
}

} // namespace rf::utils
