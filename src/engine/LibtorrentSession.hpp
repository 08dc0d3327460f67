#pragma once

#include "engine/EngineSession.hpp"
#include "engine/SettingsManager.hpp"

#include <libtorrent/alert.hpp>
#include <libtorrent/session.hpp>
#include <libtorrent/torrent_handle.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace rf::engine
{

// The process-wide libtorrent session. Owns the listen sockets and the
// DHT/LSD/UPnP/NAT-PMP state; torrents are addressed by EngineHandle.
class LibtorrentSession final : public EngineSession
{
  public:
    explicit LibtorrentSession(EngineSettings const &settings);
    LibtorrentSession(LibtorrentSession const &) = delete;
    LibtorrentSession &operator=(LibtorrentSession const &) = delete;
    ~LibtorrentSession() override;

    EngineHandle attach(AttachRequest const &request) override;
    void detach(EngineHandle handle, bool delete_files) override;
    std::vector<EngineAlert> poll_alerts() override;
    std::optional<EngineStatus> status(EngineHandle handle) override;
    void pause(EngineHandle handle) override;
    void resume(EngineHandle handle) override;
    bool request_resume_data(EngineHandle handle) override;
    void set_sequential(EngineHandle handle, bool sequential) override;
    void set_file_priorities(EngineHandle handle,
                             std::vector<int> const &priorities) override;
    std::optional<std::vector<EngineFile>> files(EngineHandle handle) override;

  private:
    std::optional<libtorrent::torrent_handle> find(EngineHandle handle) const;
    std::optional<EngineHandle>
    handle_for(libtorrent::torrent_handle const &handle) const;

    std::unique_ptr<libtorrent::session> session_;
    mutable std::mutex mutex_;
    std::unordered_map<EngineHandle, libtorrent::torrent_handle> handles_;
    EngineHandle next_handle_ = 1;
    std::vector<libtorrent::alert *> alert_buffer_;
};

} // namespace rf::engine
