#pragma once

#include "catalog/CatalogProvider.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace rf::test
{

inline rf::catalog::Candidate
make_candidate(std::string title, std::string rating,
               std::initializer_list<char const *> qualities)
{
    rf::catalog::Candidate candidate;
    candidate.title = title;
    candidate.rating = std::move(rating);
    candidate.year = 2020;
    candidate.genre = "Drama";
    candidate.link = "https://catalog.test/movies/" + title;
    for (auto const *quality : qualities)
    {
        rf::catalog::TorrentOption option;
        option.quality = quality;
        option.sizes = {"1.2 GB"};
        option.url = "https://catalog.test/torrent/" + title + "/" + quality;
        option.magnet = "magnet:?xt=urn:btih:" + title + quality + "&dn=" + title;
        candidate.torrents.push_back(std::move(option));
    }
    return candidate;
}

// Fixed candidate list. hold() makes browse() block until release() so tests
// can overlap executions deterministically.
class FakeCatalog final : public rf::catalog::CatalogProvider
{
  public:
    std::vector<rf::catalog::Candidate>
    browse(rf::catalog::SearchCriteria const &criteria) override
    {
        ++browse_calls;
        std::unique_lock<std::mutex> lock(mutex_);
        last_criteria = criteria;
        ++entered_;
        cv_.notify_all();
        cv_.wait(lock, [this] { return !held_; });
        if (fail_with)
        {
            throw std::runtime_error(*fail_with);
        }
        return candidates;
    }

    std::optional<rf::catalog::Candidate>
    resolve(std::string const &reference) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto const &candidate : candidates)
        {
            if (candidate.link == reference || candidate.title == reference)
            {
                return candidate;
            }
        }
        return std::nullopt;
    }

    void hold()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
    }

    void release()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_ = false;
        }
        cv_.notify_all();
    }

    // Waits until browse() has been entered count times in total.
    bool wait_for_browse(int count, std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout,
                            [this, count] { return entered_ >= count; });
    }

    std::vector<rf::catalog::Candidate> candidates;
    std::optional<std::string> fail_with;
    std::optional<rf::catalog::SearchCriteria> last_criteria;
    std::atomic<int> browse_calls{0};

  private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool held_ = false;
    int entered_ = 0;
};

} // namespace rf::test
