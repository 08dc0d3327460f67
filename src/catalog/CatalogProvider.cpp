#include "catalog/CatalogProvider.hpp"

#include "utils/Json.hpp"

#include <yyjson.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>

namespace rf::catalog
{

namespace
{

bool is_decimal(std::string_view text) noexcept
{
    if (text.empty())
    {
        return false;
    }
    bool seen_digit = false;
    bool seen_dot = false;
    for (char ch : text)
    {
        if (std::isdigit(static_cast<unsigned char>(ch)))
        {
            seen_digit = true;
        }
        else if (ch == '.' && !seen_dot)
        {
            seen_dot = true;
        }
        else
        {
            return false;
        }
    }
    return seen_digit && text.front() != '.' && text.back() != '.';
}

} // namespace

std::optional<double> parse_rating(std::string_view text)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
    {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
    {
        text.remove_suffix(1);
    }
    constexpr std::string_view kScale = "/10";
    if (text.size() > kScale.size() &&
        text.substr(text.size() - kScale.size()) == kScale)
    {
        text.remove_suffix(kScale.size());
    }
    if (!is_decimal(text))
    {
        return std::nullopt;
    }
    // strtod needs a terminated buffer
    std::string buffer(text);
    char *end = nullptr;
    double value = std::strtod(buffer.c_str(), &end);
    if (end != buffer.c_str() + buffer.size() || !std::isfinite(value) ||
        value < 0.0 || value > 10.0)
    {
        return std::nullopt;
    }
    return value;
}

std::vector<Candidate> rank_by_rating(std::vector<Candidate> candidates)
{
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](Candidate const &lhs, Candidate const &rhs)
                     {
                         auto left = parse_rating(lhs.rating);
                         auto right = parse_rating(rhs.rating);
                         if (!right)
                         {
                             return left.has_value();
                         }
                         if (!left)
                         {
                             return false;
                         }
                         return *left > *right;
                     });
    return candidates;
}

TorrentOption const *find_torrent(Candidate const &candidate,
                                  std::string_view quality) noexcept
{
    for (auto const &option : candidate.torrents)
    {
        if (option.quality == quality)
        {
            return &option;
        }
    }
    return nullptr;
}

std::string serialize_criteria(SearchCriteria const &criteria)
{
    rf::json::MutableDocument doc;
    auto *root = doc.make_object_root();
    if (root == nullptr)
    {
        return "{}";
    }
    auto *native = doc.doc();
    if (criteria.keyword)
    {
        yyjson_mut_obj_add_strcpy(native, root, "keyword",
                                  criteria.keyword->c_str());
    }
    yyjson_mut_obj_add_strcpy(native, root, "quality", criteria.quality.c_str());
    yyjson_mut_obj_add_strcpy(native, root, "genre", criteria.genre.c_str());
    yyjson_mut_obj_add_real(native, root, "min_rating", criteria.min_rating);
    if (criteria.year)
    {
        yyjson_mut_obj_add_int(native, root, "year", *criteria.year);
    }
    yyjson_mut_obj_add_strcpy(native, root, "order_by",
                              criteria.order_by.c_str());
    yyjson_mut_obj_add_int(native, root, "page", criteria.page);
    return doc.write();
}

std::optional<SearchCriteria> deserialize_criteria(std::string const &payload)
{
    auto doc = rf::json::Document::parse(payload);
    auto *root = doc.root();
    if (root == nullptr || !yyjson_is_obj(root))
    {
        return std::nullopt;
    }
    SearchCriteria criteria;
    criteria.keyword = rf::json::string_field(root, "keyword");
    if (auto quality = rf::json::string_field(root, "quality"))
    {
        criteria.quality = *quality;
    }
    if (auto genre = rf::json::string_field(root, "genre"))
    {
        criteria.genre = *genre;
    }
    if (auto rating = rf::json::number_field(root, "min_rating"))
    {
        criteria.min_rating = *rating;
    }
    if (auto year = rf::json::int_field(root, "year"))
    {
        criteria.year = static_cast<int>(*year);
    }
    if (auto order = rf::json::string_field(root, "order_by"))
    {
        criteria.order_by = *order;
    }
    if (auto page = rf::json::int_field(root, "page"); page && *page > 0)
    {
        criteria.page = static_cast<int>(*page);
    }
    return criteria;
}

} // namespace rf::catalog
