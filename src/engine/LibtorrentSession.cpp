#include "engine/LibtorrentSession.hpp"

#include "engine/Error.hpp"
#include "utils/Log.hpp"

#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/alert_types.hpp>
#include <libtorrent/download_priority.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <libtorrent/read_resume_data.hpp>
#include <libtorrent/session_params.hpp>
#include <libtorrent/torrent_flags.hpp>
#include <libtorrent/torrent_info.hpp>
#include <libtorrent/torrent_status.hpp>
#include <libtorrent/write_resume_data.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace rf::engine
{

namespace
{

constexpr std::size_t kAlertBufferCapacity = 4096;

// Creates the directory and writes/removes a probe file so an unwritable
// target fails at attach time instead of at the first piece.
void ensure_writable(std::filesystem::path const &path)
{
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec)
    {
        throw rf::Error(rf::ErrorKind::Engine,
                        "Cannot create save path " + path.string() + ": " +
                            ec.message());
    }
    auto probe = path / ".reelfetch-write-test";
    {
        std::ofstream out(probe, std::ios::out | std::ios::trunc);
        if (!out.is_open() || !(out << "ok"))
        {
            throw rf::Error(rf::ErrorKind::Engine,
                            "Save path is not writable: " + path.string());
        }
    }
    std::filesystem::remove(probe, ec);
    if (ec)
    {
        RF_LOG_WARN("failed to remove write probe {}: {}", probe.string(),
                    ec.message());
    }
}

} // namespace

LibtorrentSession::LibtorrentSession(EngineSettings const &settings)
{
    libtorrent::session_params params(
        SettingsManager::build_settings_pack(settings));
    session_ = std::make_unique<libtorrent::session>(std::move(params));
    alert_buffer_.reserve(kAlertBufferCapacity);
    RF_LOG_INFO("libtorrent session started on {}",
                SettingsManager::listen_interfaces_for(
                    settings.listen_interfaces, settings.port_min));
}

LibtorrentSession::~LibtorrentSession()
{
    if (session_)
    {
        session_->pause();
        session_.reset();
    }
}

EngineHandle LibtorrentSession::attach(AttachRequest const &request)
{
    libtorrent::add_torrent_params params;
    libtorrent::error_code ec;
    bool from_resume = false;

    if (!request.resume_data.empty())
    {
        libtorrent::span<char const> span(
            reinterpret_cast<char const *>(request.resume_data.data()),
            static_cast<std::ptrdiff_t>(request.resume_data.size()));
        params = libtorrent::read_resume_data(span, ec);
        if (ec)
        {
            RF_LOG_WARN("discarding unreadable resume data: {}", ec.message());
            params = libtorrent::add_torrent_params{};
            ec.clear();
        }
        else
        {
            from_resume = true;
        }
    }
    if (!from_resume)
    {
        if (request.source.empty())
        {
            throw rf::Error(rf::ErrorKind::Engine,
                            "No magnet link or resume data to add");
        }
        libtorrent::parse_magnet_uri(request.source, params, ec);
        if (ec)
        {
            throw rf::Error(rf::ErrorKind::Engine,
                            "Invalid magnet link: " + ec.message());
        }
    }

    ensure_writable(request.save_path);
    params.save_path = request.save_path;
    params.flags |= libtorrent::torrent_flags::auto_managed;
    params.flags &= ~libtorrent::torrent_flags::paused;
    if (request.paused)
    {
        params.flags &= ~libtorrent::torrent_flags::auto_managed;
        params.flags |= libtorrent::torrent_flags::paused;
    }
    if (request.sequential)
    {
        params.flags |= libtorrent::torrent_flags::sequential_download;
    }

    auto handle = session_->add_torrent(std::move(params), ec);
    if (ec || !handle.is_valid())
    {
        throw rf::Error(rf::ErrorKind::Engine,
                        "Failed to add torrent: " +
                            (ec ? ec.message() : std::string("invalid handle")));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_handle_++;
    handles_.emplace(id, handle);
    RF_LOG_DEBUG("attached engine handle {} ({})", id,
                 from_resume ? "resume data" : "magnet");
    return id;
}

void LibtorrentSession::detach(EngineHandle handle, bool delete_files)
{
    libtorrent::torrent_handle native;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handles_.find(handle);
        if (it == handles_.end())
        {
            return;
        }
        native = it->second;
        handles_.erase(it);
    }
    if (!native.is_valid())
    {
        return;
    }
    if (delete_files)
    {
        session_->remove_torrent(native,
                                 libtorrent::session_handle::delete_files);
    }
    else
    {
        session_->remove_torrent(native);
    }
}

std::vector<EngineAlert> LibtorrentSession::poll_alerts()
{
    std::vector<EngineAlert> result;
    alert_buffer_.clear();
    session_->pop_alerts(&alert_buffer_);
    for (auto const *alert : alert_buffer_)
    {
        auto const *torrent =
            dynamic_cast<libtorrent::torrent_alert const *>(alert);
        if (torrent == nullptr)
        {
            continue;
        }
        auto id = handle_for(torrent->handle);
        if (!id)
        {
            continue;
        }
        EngineAlert entry;
        entry.handle = *id;
        if (libtorrent::alert_cast<libtorrent::torrent_finished_alert>(alert))
        {
            entry.kind = EngineAlertKind::Finished;
        }
        else if (libtorrent::alert_cast<libtorrent::metadata_received_alert>(
                     alert))
        {
            entry.kind = EngineAlertKind::MetadataReceived;
        }
        else if (auto *resume = libtorrent::alert_cast<
                     libtorrent::save_resume_data_alert>(alert))
        {
            entry.kind = EngineAlertKind::ResumeDataSaved;
            auto buffer = libtorrent::write_resume_data_buf(resume->params);
            entry.resume_data.assign(buffer.begin(), buffer.end());
        }
        else if (auto *failed = libtorrent::alert_cast<
                     libtorrent::save_resume_data_failed_alert>(alert))
        {
            entry.kind = EngineAlertKind::ResumeDataFailed;
            entry.message = failed->error.message();
        }
        else if (auto *error =
                     libtorrent::alert_cast<libtorrent::torrent_error_alert>(
                         alert))
        {
            entry.kind = EngineAlertKind::TorrentError;
            entry.message = error->error.message();
            auto const *file = error->filename();
            if (file != nullptr && *file != '\0')
            {
                entry.message += " (";
                entry.message += file;
                entry.message += ")";
            }
        }
        else
        {
            continue;
        }
        result.push_back(std::move(entry));
    }
    return result;
}

std::optional<EngineStatus> LibtorrentSession::status(EngineHandle handle)
{
    auto native = find(handle);
    if (!native)
    {
        return std::nullopt;
    }
    auto const st = native->status();
    EngineStatus result;
    result.state = static_cast<int>(st.state);
    result.paused =
        static_cast<bool>(st.flags & libtorrent::torrent_flags::paused);
    result.has_metadata = st.has_metadata;
    result.progress = static_cast<double>(st.progress);
    result.download_rate = st.download_rate;
    result.upload_rate = st.upload_rate;
    result.num_peers = st.num_peers;
    result.total_wanted = st.total_wanted;
    result.total_wanted_done = st.total_wanted_done;
    result.total_download = st.total_download;
    result.total_upload = st.total_upload;
    result.name = st.name;
    return result;
}

void LibtorrentSession::pause(EngineHandle handle)
{
    if (auto native = find(handle))
    {
        // auto_managed torrents get unpaused by the queue
        native->unset_flags(libtorrent::torrent_flags::auto_managed);
        native->pause(libtorrent::torrent_handle::graceful_pause);
    }
}

void LibtorrentSession::resume(EngineHandle handle)
{
    if (auto native = find(handle))
    {
        native->set_flags(libtorrent::torrent_flags::auto_managed);
        native->resume();
    }
}

bool LibtorrentSession::request_resume_data(EngineHandle handle)
{
    auto native = find(handle);
    if (!native)
    {
        return false;
    }
    native->save_resume_data(libtorrent::torrent_handle::save_info_dict);
    return true;
}

void LibtorrentSession::set_sequential(EngineHandle handle, bool sequential)
{
    auto native = find(handle);
    if (!native)
    {
        return;
    }
    if (sequential)
    {
        native->set_flags(libtorrent::torrent_flags::sequential_download);
    }
    else
    {
        native->unset_flags(libtorrent::torrent_flags::sequential_download);
    }
}

void LibtorrentSession::set_file_priorities(EngineHandle handle,
                                            std::vector<int> const &priorities)
{
    auto native = find(handle);
    if (!native)
    {
        return;
    }
    std::vector<libtorrent::download_priority_t> native_priorities;
    native_priorities.reserve(priorities.size());
    for (int value : priorities)
    {
        native_priorities.emplace_back(
            static_cast<std::uint8_t>(std::clamp(value, 0, kTopFilePriority)));
    }
    native->prioritize_files(native_priorities);
}

std::optional<std::vector<EngineFile>>
LibtorrentSession::files(EngineHandle handle)
{
    auto native = find(handle);
    if (!native)
    {
        return std::nullopt;
    }
    auto info = native->torrent_file();
    if (!info)
    {
        return std::nullopt;
    }
    std::vector<std::int64_t> progress;
    native->file_progress(progress,
                          libtorrent::torrent_handle::piece_granularity);
    auto const &storage = info->files();
    std::vector<EngineFile> result;
    result.reserve(static_cast<std::size_t>(storage.num_files()));
    for (auto index : storage.file_range())
    {
        auto const position = static_cast<std::size_t>(static_cast<int>(index));
        EngineFile file;
        file.path = storage.file_path(index);
        file.size = storage.file_size(index);
        file.downloaded = position < progress.size() ? progress[position] : 0;
        result.push_back(std::move(file));
    }
    return result;
}

std::optional<libtorrent::torrent_handle>
LibtorrentSession::find(EngineHandle handle) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(handle);
    if (it == handles_.end() || !it->second.is_valid())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<EngineHandle>
LibtorrentSession::handle_for(libtorrent::torrent_handle const &handle) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto const &[id, native] : handles_)
    {
        if (native == handle)
        {
            return id;
        }
    }
    return std::nullopt;
}

} // namespace rf::engine
