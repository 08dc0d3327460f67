#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rf::catalog
{

struct TorrentOption
{
    std::string quality;
    std::vector<std::string> sizes;
    std::string url;
    std::string magnet;
};

struct Candidate
{
    std::string title;
    std::optional<int> year;
    std::string rating; // as published, e.g. "7.8/10"
    std::string genre;
    std::string link;
    std::vector<TorrentOption> torrents;
};

struct SearchCriteria
{
    std::optional<std::string> keyword;
    std::string quality = "all";
    std::string genre = "all";
    double min_rating = 0.0;
    std::optional<int> year;
    std::string order_by = "featured";
    int page = 1;
};

// Source of downloadable titles. Implementations may block on I/O; they are
// only called from schedule execution threads and explicit catalog creates.
class CatalogProvider
{
  public:
    virtual ~CatalogProvider() = default;

    virtual std::vector<Candidate> browse(SearchCriteria const &criteria) = 0;
    // A link or title; std::nullopt when nothing matches.
    virtual std::optional<Candidate> resolve(std::string const &reference) = 0;
};

// "7.8" or "7.8/10" with a value in [0, 10]. Anything else ("N/A", "78%")
// is std::nullopt.
std::optional<double> parse_rating(std::string_view text);

// Highest rating first, stable for ties; unparsable ratings sort last.
std::vector<Candidate> rank_by_rating(std::vector<Candidate> candidates);

TorrentOption const *find_torrent(Candidate const &candidate,
                                  std::string_view quality) noexcept;

std::string serialize_criteria(SearchCriteria const &criteria);
// Missing members keep their defaults; an unreadable payload yields
// std::nullopt.
std::optional<SearchCriteria> deserialize_criteria(std::string const &payload);

} // namespace rf::catalog
