#pragma once

#include "engine/EngineSession.hpp"
#include "engine/Error.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rf::test
{

// In-memory engine. A resume blob is the text "progress=<0..1>" so tests can
// see what a re-attach restores.
class FakeEngine final : public rf::engine::EngineSession
{
  public:
    struct Torrent
    {
        rf::engine::AttachRequest request;
        rf::engine::EngineStatus status;
        std::optional<std::vector<rf::engine::EngineFile>> files;
        bool sequential = false;
        std::vector<int> priorities;
        int resume_requests = 0;
    };

    static std::vector<std::uint8_t> encode_resume(double progress)
    {
        auto text = "progress=" + std::to_string(progress);
        return std::vector<std::uint8_t>(text.begin(), text.end());
    }

    static std::optional<double>
    decode_resume(std::vector<std::uint8_t> const &blob)
    {
        std::string text(blob.begin(), blob.end());
        if (text.rfind("progress=", 0) != 0)
        {
            return std::nullopt;
        }
        return std::stod(text.substr(9));
    }

    rf::engine::EngineHandle
    attach(rf::engine::AttachRequest const &request) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        attach_requests.push_back(request);
        if (fail_attach)
        {
            throw rf::Error(rf::ErrorKind::Engine, *fail_attach);
        }
        if (request.resume_data.empty() &&
            request.source.rfind("magnet:?", 0) != 0)
        {
            throw rf::Error(rf::ErrorKind::Engine,
                            "Invalid magnet link: " + request.source);
        }
        auto const handle = next_handle_++;
        Torrent torrent;
        torrent.request = request;
        torrent.status.paused = request.paused;
        torrent.sequential = request.sequential;
        if (auto restored = decode_resume(request.resume_data))
        {
            torrent.status.progress = *restored;
        }
        torrents_[handle] = std::move(torrent);
        return handle;
    }

    void detach(rf::engine::EngineHandle handle, bool delete_files) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (torrents_.erase(handle) != 0)
        {
            detached.emplace_back(handle, delete_files);
        }
    }

    std::vector<rf::engine::EngineAlert> poll_alerts() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<rf::engine::EngineAlert> out;
        out.swap(alerts_);
        return out;
    }

    std::optional<rf::engine::EngineStatus>
    status(rf::engine::EngineHandle handle) override
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (status_gate_closed_)
        {
            ++status_waiters_;
            gate_cv_.notify_all();
            gate_cv_.wait(lock, [this] { return !status_gate_closed_; });
            --status_waiters_;
        }
        if (fail_status)
        {
            throw rf::Error(rf::ErrorKind::Engine, *fail_status);
        }
        if (lose_handles)
        {
            return std::nullopt;
        }
        auto it = torrents_.find(handle);
        if (it == torrents_.end())
        {
            return std::nullopt;
        }
        return it->second.status;
    }

    void pause(rf::engine::EngineHandle handle) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto *torrent = find_locked(handle))
        {
            torrent->status.paused = true;
        }
    }

    void resume(rf::engine::EngineHandle handle) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto *torrent = find_locked(handle))
        {
            torrent->status.paused = false;
        }
    }

    bool request_resume_data(rf::engine::EngineHandle handle) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto *torrent = find_locked(handle);
        if (torrent == nullptr)
        {
            return false;
        }
        ++torrent->resume_requests;
        if (answer_resume_requests)
        {
            alerts_.push_back({rf::engine::EngineAlertKind::ResumeDataSaved,
                               handle, {},
                               encode_resume(torrent->status.progress)});
        }
        return true;
    }

    void set_sequential(rf::engine::EngineHandle handle,
                        bool sequential) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto *torrent = find_locked(handle))
        {
            torrent->sequential = sequential;
        }
    }

    void set_file_priorities(rf::engine::EngineHandle handle,
                             std::vector<int> const &priorities) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto *torrent = find_locked(handle))
        {
            torrent->priorities = priorities;
        }
    }

    std::optional<std::vector<rf::engine::EngineFile>>
    files(rf::engine::EngineHandle handle) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto *torrent = find_locked(handle);
        if (torrent == nullptr)
        {
            return std::nullopt;
        }
        return torrent->files;
    }

    // Test-side controls.

    void push_alert(rf::engine::EngineAlertKind kind,
                    rf::engine::EngineHandle handle, std::string message = {})
    {
        std::lock_guard<std::mutex> lock(mutex_);
        alerts_.push_back({kind, handle, std::move(message), {}});
    }

    template <typename Fn> void update(rf::engine::EngineHandle handle, Fn fn)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto *torrent = find_locked(handle))
        {
            fn(*torrent);
        }
    }

    std::optional<Torrent> torrent(rf::engine::EngineHandle handle) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = torrents_.find(handle);
        if (it == torrents_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::size_t attached() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return torrents_.size();
    }

    rf::engine::EngineHandle last_handle() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return next_handle_ - 1;
    }

    // status() blocks while the gate is closed, like a hung engine call.
    void close_status_gate()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_gate_closed_ = true;
    }

    void open_status_gate()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            status_gate_closed_ = false;
        }
        gate_cv_.notify_all();
    }

    bool wait_for_blocked_status(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return gate_cv_.wait_for(lock, timeout,
                                 [this] { return status_waiters_ > 0; });
    }

    std::optional<std::string> fail_attach;
    std::optional<std::string> fail_status;
    bool lose_handles = false;
    bool answer_resume_requests = true;
    std::vector<rf::engine::AttachRequest> attach_requests;
    std::vector<std::pair<rf::engine::EngineHandle, bool>> detached;

  private:
    Torrent *find_locked(rf::engine::EngineHandle handle)
    {
        auto it = torrents_.find(handle);
        return it == torrents_.end() ? nullptr : &it->second;
    }

    mutable std::mutex mutex_;
    std::map<rf::engine::EngineHandle, Torrent> torrents_;
    std::vector<rf::engine::EngineAlert> alerts_;
    rf::engine::EngineHandle next_handle_ = 1;
    std::condition_variable gate_cv_;
    bool status_gate_closed_ = false;
    int status_waiters_ = 0;
};

} // namespace rf::test
