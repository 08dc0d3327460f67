#include "catalog/JsonFileCatalog.hpp"

#include "engine/Error.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <yyjson.h>

#include <algorithm>
#include <cstddef>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace rf::catalog
{

namespace
{

std::string lowered(std::string_view value)
{
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    return result;
}

bool contains_ci(std::string_view haystack, std::string_view needle)
{
    return lowered(haystack).find(lowered(needle)) != std::string::npos;
}

TorrentOption read_torrent(yyjson_val *obj)
{
    TorrentOption option;
    option.quality = rf::json::string_field(obj, "quality").value_or("");
    option.sizes = rf::json::string_array(yyjson_obj_get(obj, "sizes"));
    option.url = rf::json::string_field(obj, "url").value_or("");
    option.magnet = rf::json::string_field(obj, "magnet").value_or("");
    return option;
}

Candidate read_candidate(yyjson_val *obj)
{
    Candidate candidate;
    candidate.title = rf::json::string_field(obj, "title").value_or("");
    if (auto year = rf::json::int_field(obj, "year"))
    {
        candidate.year = static_cast<int>(*year);
    }
    auto *rating = yyjson_obj_get(obj, "rating");
    if (yyjson_is_str(rating))
    {
        candidate.rating.assign(yyjson_get_str(rating), yyjson_get_len(rating));
    }
    else if (yyjson_is_num(rating))
    {
        std::ostringstream out;
        out << yyjson_get_num(rating);
        candidate.rating = out.str();
    }
    candidate.genre = rf::json::string_field(obj, "genre").value_or("");
    candidate.link = rf::json::string_field(obj, "link").value_or("");
    auto *torrents = yyjson_obj_get(obj, "torrents");
    if (yyjson_is_arr(torrents))
    {
        size_t idx, limit;
        yyjson_val *entry = nullptr;
        yyjson_arr_foreach(torrents, idx, limit, entry)
        {
            if (yyjson_is_obj(entry))
            {
                candidate.torrents.push_back(read_torrent(entry));
            }
        }
    }
    return candidate;
}

bool matches(Candidate const &candidate, SearchCriteria const &criteria)
{
    if (criteria.keyword && !criteria.keyword->empty() &&
        !contains_ci(candidate.title, *criteria.keyword))
    {
        return false;
    }
    if (!criteria.genre.empty() && criteria.genre != "all" &&
        !contains_ci(candidate.genre, criteria.genre))
    {
        return false;
    }
    if (criteria.min_rating > 0.0)
    {
        auto rating = parse_rating(candidate.rating);
        if (!rating || *rating < criteria.min_rating)
        {
            return false;
        }
    }
    if (criteria.year && candidate.year != criteria.year)
    {
        return false;
    }
    if (!criteria.quality.empty() && criteria.quality != "all" &&
        find_torrent(candidate, criteria.quality) == nullptr)
    {
        return false;
    }
    return true;
}

void order(std::vector<Candidate> &candidates, std::string const &order_by)
{
    if (order_by == "rating")
    {
        candidates = rank_by_rating(std::move(candidates));
    }
    else if (order_by == "year")
    {
        std::stable_sort(candidates.begin(), candidates.end(),
                         [](Candidate const &lhs, Candidate const &rhs)
                         { return lhs.year.value_or(0) > rhs.year.value_or(0); });
    }
    else if (order_by == "title")
    {
        std::stable_sort(candidates.begin(), candidates.end(),
                         [](Candidate const &lhs, Candidate const &rhs)
                         { return lowered(lhs.title) < lowered(rhs.title); });
    }
    // "featured" keeps file order
}

} // namespace

JsonFileCatalog::JsonFileCatalog(std::filesystem::path path)
    : path_(std::move(path))
{
}

std::vector<Candidate> JsonFileCatalog::load() const
{
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec))
    {
        RF_LOG_WARN("catalog file {} does not exist", path_.string());
        return {};
    }
    std::ifstream input(path_, std::ios::binary);
    if (!input)
    {
        throw rf::Error(rf::ErrorKind::NotFound,
                        "Cannot open catalog file " + path_.string());
    }
    std::string payload((std::istreambuf_iterator<char>(input)),
                        std::istreambuf_iterator<char>());
    auto doc = rf::json::Document::parse(payload);
    auto *root = doc.root();
    if (root == nullptr || !yyjson_is_obj(root))
    {
        throw rf::Error(rf::ErrorKind::Validation,
                        "Catalog file is not a JSON object: " + path_.string());
    }
    std::vector<Candidate> result;
    auto *movies = yyjson_obj_get(root, "movies");
    if (!yyjson_is_arr(movies))
    {
        return result;
    }
    size_t idx, limit;
    yyjson_val *entry = nullptr;
    yyjson_arr_foreach(movies, idx, limit, entry)
    {
        if (!yyjson_is_obj(entry))
        {
            continue;
        }
        auto candidate = read_candidate(entry);
        if (!candidate.title.empty())
        {
            result.push_back(std::move(candidate));
        }
    }
    return result;
}

std::vector<Candidate> JsonFileCatalog::browse(SearchCriteria const &criteria)
{
    auto all = load();
    std::vector<Candidate> filtered;
    for (auto &candidate : all)
    {
        if (matches(candidate, criteria))
        {
            filtered.push_back(std::move(candidate));
        }
    }
    order(filtered, criteria.order_by);
    auto const page = std::max(1, criteria.page);
    auto const first = static_cast<std::size_t>(page - 1) * kPageSize;
    if (first >= filtered.size())
    {
        return {};
    }
    auto const last = std::min(filtered.size(), first + kPageSize);
    return std::vector<Candidate>(
        std::make_move_iterator(filtered.begin() +
                                static_cast<std::ptrdiff_t>(first)),
        std::make_move_iterator(filtered.begin() +
                                static_cast<std::ptrdiff_t>(last)));
}

std::optional<Candidate> JsonFileCatalog::resolve(std::string const &reference)
{
    if (reference.empty())
    {
        return std::nullopt;
    }
    auto all = load();
    for (auto &candidate : all)
    {
        if (!candidate.link.empty() && candidate.link == reference)
        {
            return std::move(candidate);
        }
    }
    auto const needle = lowered(reference);
    for (auto &candidate : all)
    {
        if (lowered(candidate.title) == needle)
        {
            return std::move(candidate);
        }
    }
    return std::nullopt;
}

} // namespace rf::catalog
