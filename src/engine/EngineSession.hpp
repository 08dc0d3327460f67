#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rf::engine
{

using EngineHandle = std::uint64_t;

// File priorities in libtorrent's download_priority_t scale.
inline constexpr int kLowFilePriority = 1;
inline constexpr int kTopFilePriority = 7;

struct EngineStatus
{
    int state = 0; // libtorrent torrent_status::state_t ordinal
    bool paused = false;
    bool has_metadata = false;
    double progress = 0.0; // 0..1
    std::int64_t download_rate = 0; // bytes/s
    std::int64_t upload_rate = 0;
    int num_peers = 0;
    std::int64_t total_wanted = 0;
    std::int64_t total_wanted_done = 0;
    std::int64_t total_download = 0;
    std::int64_t total_upload = 0;
    std::string name;
};

struct EngineFile
{
    std::string path; // relative to the save path
    std::int64_t size = 0;
    std::int64_t downloaded = 0;
};

enum class EngineAlertKind
{
    Finished,
    MetadataReceived,
    ResumeDataSaved,
    ResumeDataFailed,
    TorrentError,
};

struct EngineAlert
{
    EngineAlertKind kind = EngineAlertKind::Finished;
    EngineHandle handle = 0;
    std::string message;
    std::vector<std::uint8_t> resume_data;
};

struct AttachRequest
{
    std::string source; // magnet URI
    std::string save_path;
    std::vector<std::uint8_t> resume_data;
    bool sequential = false;
    bool paused = false;
};

// The native BitTorrent engine as seen by the orchestrator. Calls on an
// unknown handle are no-ops (or std::nullopt).
class EngineSession
{
  public:
    virtual ~EngineSession() = default;

    // Throws rf::Error{Engine} when the torrent cannot be added.
    virtual EngineHandle attach(AttachRequest const &request) = 0;
    virtual void detach(EngineHandle handle, bool delete_files) = 0;
    virtual std::vector<EngineAlert> poll_alerts() = 0;
    virtual std::optional<EngineStatus> status(EngineHandle handle) = 0;
    virtual void pause(EngineHandle handle) = 0;
    virtual void resume(EngineHandle handle) = 0;
    virtual bool request_resume_data(EngineHandle handle) = 0;
    virtual void set_sequential(EngineHandle handle, bool sequential) = 0;
    virtual void set_file_priorities(EngineHandle handle,
                                     std::vector<int> const &priorities) = 0;
    // std::nullopt until metadata is available.
    virtual std::optional<std::vector<EngineFile>>
    files(EngineHandle handle) = 0;
};

} // namespace rf::engine
