#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace rf::utils
{

// Root for the database, log file and default downloads. RF_DATA_ROOT wins,
// then $XDG_DATA_HOME/reelfetch, then ~/.local/share/reelfetch, then a
// "data" directory next to the executable.
std::filesystem::path data_root();
std::optional<std::filesystem::path> executable_path();
std::optional<std::filesystem::path>
ensure_directory(std::filesystem::path const &candidate);

// Turns a display title into a single path component.
std::string sanitize_path_component(std::string_view name);

} // namespace rf::utils
