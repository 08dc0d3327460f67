#include "catalog/CatalogProvider.hpp"
#include "catalog/JsonFileCatalog.hpp"
#include "engine/Error.hpp"

#include "support/FakeCatalog.hpp"
#include "support/TempRoot.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <doctest/doctest.h>

namespace
{

void write_catalog(std::filesystem::path const &path, std::string const &body)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << body;
}

std::string movie(std::string const &title, int year, std::string const &rating,
                  std::string const &genre, std::string const &quality)
{
    return "{\"title\":\"" + title + "\",\"year\":" + std::to_string(year) +
           ",\"rating\":\"" + rating + "\",\"genre\":\"" + genre +
           "\",\"link\":\"https://catalog.test/movies/" + title +
           "\",\"torrents\":[{\"quality\":\"" + quality +
           "\",\"sizes\":[\"1.4 GB\"],\"url\":\"https://catalog.test/t/" + title +
           "\",\"magnet\":\"magnet:?xt=urn:btih:" + title + "\"}]}";
}

std::vector<std::string> titles(std::vector<rf::catalog::Candidate> const &list)
{
    std::vector<std::string> out;
    for (auto const &candidate : list)
    {
        out.push_back(candidate.title);
    }
    return out;
}

} // namespace

TEST_CASE("ratings parse strictly")
{
    using rf::catalog::parse_rating;
    CHECK(parse_rating("7.8") == std::optional<double>(7.8));
    CHECK(parse_rating("7.8/10") == std::optional<double>(7.8));
    CHECK(parse_rating(" 9/10 ") == std::optional<double>(9.0));
    CHECK(parse_rating("10") == std::optional<double>(10.0));
    CHECK(parse_rating("0") == std::optional<double>(0.0));
    CHECK_FALSE(parse_rating("").has_value());
    CHECK_FALSE(parse_rating("N/A").has_value());
    CHECK_FALSE(parse_rating("78%").has_value());
    CHECK_FALSE(parse_rating("10.5").has_value());
    CHECK_FALSE(parse_rating("-1").has_value());
    CHECK_FALSE(parse_rating(".5").has_value());
    CHECK_FALSE(parse_rating("7.8/100").has_value());
    CHECK_FALSE(parse_rating("/10").has_value());
}

TEST_CASE("ranking is by rating, stable, with unparsable ratings last")
{
    std::vector<rf::catalog::Candidate> list = {
        rf::test::make_candidate("Unknown", "N/A", {"1080p"}),
        rf::test::make_candidate("Mid", "7.0", {"1080p"}),
        rf::test::make_candidate("Top", "9.0/10", {"1080p"}),
        rf::test::make_candidate("MidToo", "7.0/10", {"1080p"}),
        rf::test::make_candidate("Blank", "", {"1080p"}),
    };
    CHECK(titles(rf::catalog::rank_by_rating(list)) ==
          std::vector<std::string>{"Top", "Mid", "MidToo", "Unknown", "Blank"});
}

TEST_CASE("find_torrent matches the exact quality")
{
    auto candidate =
        rf::test::make_candidate("Film", "8.0", {"720p", "1080p"});
    auto const *hd = rf::catalog::find_torrent(candidate, "1080p");
    REQUIRE(hd != nullptr);
    CHECK(hd->magnet == "magnet:?xt=urn:btih:Film1080p&dn=Film");
    CHECK(rf::catalog::find_torrent(candidate, "2160p") == nullptr);
    CHECK(rf::catalog::find_torrent(candidate, "1080P") == nullptr);
}

TEST_CASE("search criteria survive serialization")
{
    rf::catalog::SearchCriteria criteria;
    criteria.keyword = "space";
    criteria.genre = "sci-fi";
    criteria.min_rating = 7.5;
    criteria.year = 2019;
    criteria.order_by = "rating";
    criteria.page = 2;
    auto decoded =
        rf::catalog::deserialize_criteria(rf::catalog::serialize_criteria(criteria));
    REQUIRE(decoded.has_value());
    CHECK(decoded->keyword == std::optional<std::string>("space"));
    CHECK(decoded->genre == "sci-fi");
    CHECK(decoded->quality == "all");
    CHECK(decoded->min_rating == doctest::Approx(7.5));
    CHECK(decoded->year == std::optional<int>(2019));
    CHECK(decoded->order_by == "rating");
    CHECK(decoded->page == 2);

    auto partial = rf::catalog::deserialize_criteria("{\"genre\":\"drama\"}");
    REQUIRE(partial.has_value());
    CHECK(partial->genre == "drama");
    CHECK(partial->min_rating == doctest::Approx(0.0));
    CHECK(partial->page == 1);
    CHECK_FALSE(partial->keyword.has_value());

    CHECK_FALSE(rf::catalog::deserialize_criteria("not json").has_value());
    CHECK_FALSE(rf::catalog::deserialize_criteria("[1,2]").has_value());
}

TEST_CASE("the JSON file catalog filters and orders")
{
    auto root = rf::test::make_temp_root("catalog-file");
    auto path = root / "catalog.json";
    write_catalog(path, "{\"movies\":[" +
                            movie("Arrival", 2016, "7.9/10", "Drama, Sci-Fi",
                                  "1080p") +
                            "," +
                            movie("Blade", 1998, "7.1/10", "Action", "720p") +
                            "," +
                            movie("Coda", 2021, "8.0/10", "Drama", "2160p") +
                            "," +
                            movie("Dune", 2021, "N/A", "Sci-Fi", "1080p") +
                            "]}");
    rf::catalog::JsonFileCatalog catalog(path);

    rf::catalog::SearchCriteria all;
    CHECK(titles(catalog.browse(all)) ==
          std::vector<std::string>{"Arrival", "Blade", "Coda", "Dune"});

    rf::catalog::SearchCriteria drama;
    drama.genre = "drama";
    drama.order_by = "rating";
    CHECK(titles(catalog.browse(drama)) ==
          std::vector<std::string>{"Coda", "Arrival"});

    rf::catalog::SearchCriteria rated;
    rated.min_rating = 7.5;
    CHECK(titles(catalog.browse(rated)) ==
          std::vector<std::string>{"Arrival", "Coda"});

    rf::catalog::SearchCriteria by_quality;
    by_quality.quality = "1080p";
    by_quality.order_by = "title";
    CHECK(titles(catalog.browse(by_quality)) ==
          std::vector<std::string>{"Arrival", "Dune"});

    rf::catalog::SearchCriteria recent;
    recent.year = 2021;
    recent.keyword = "DU";
    CHECK(titles(catalog.browse(recent)) == std::vector<std::string>{"Dune"});

    rf::catalog::SearchCriteria newest;
    newest.order_by = "year";
    CHECK(titles(catalog.browse(newest)) ==
          std::vector<std::string>{"Coda", "Dune", "Arrival", "Blade"});

    auto first = catalog.browse(all).front();
    CHECK(first.year == std::optional<int>(2016));
    CHECK(first.link == "https://catalog.test/movies/Arrival");
    REQUIRE(first.torrents.size() == 1);
    CHECK(first.torrents[0].sizes == std::vector<std::string>{"1.4 GB"});
}

TEST_CASE("the JSON file catalog pages by twenty")
{
    auto root = rf::test::make_temp_root("catalog-pages");
    auto path = root / "catalog.json";
    std::string body = "{\"movies\":[";
    for (int i = 0; i < 25; ++i)
    {
        if (i > 0)
        {
            body += ",";
        }
        body += movie("Film" + std::to_string(i), 2000 + i, "6.0", "Drama",
                      "1080p");
    }
    body += "]}";
    write_catalog(path, body);
    rf::catalog::JsonFileCatalog catalog(path);

    rf::catalog::SearchCriteria criteria;
    CHECK(catalog.browse(criteria).size() ==
          static_cast<std::size_t>(rf::catalog::JsonFileCatalog::kPageSize));
    criteria.page = 2;
    auto second = catalog.browse(criteria);
    REQUIRE(second.size() == 5);
    CHECK(second.front().title == "Film20");
    criteria.page = 3;
    CHECK(catalog.browse(criteria).empty());
}

TEST_CASE("the JSON file catalog resolves links and titles")
{
    auto root = rf::test::make_temp_root("catalog-resolve");
    auto path = root / "catalog.json";
    write_catalog(path, "{\"movies\":[" +
                            movie("Arrival", 2016, "7.9", "Drama", "1080p") +
                            "]}");
    rf::catalog::JsonFileCatalog catalog(path);

    auto by_link = catalog.resolve("https://catalog.test/movies/Arrival");
    REQUIRE(by_link.has_value());
    CHECK(by_link->title == "Arrival");
    CHECK(catalog.resolve("arrival").has_value());
    CHECK_FALSE(catalog.resolve("Nope").has_value());
    CHECK_FALSE(catalog.resolve("").has_value());
}

TEST_CASE("a missing file is empty and a broken file is an error")
{
    auto root = rf::test::make_temp_root("catalog-broken");
    rf::catalog::JsonFileCatalog missing(root / "absent.json");
    CHECK(missing.browse({}).empty());
    CHECK_FALSE(missing.resolve("anything").has_value());

    auto path = root / "broken.json";
    write_catalog(path, "{ not json");
    rf::catalog::JsonFileCatalog broken(path);
    bool rejected = false;
    try
    {
        broken.browse({});
    }
    catch (rf::Error const &ex)
    {
        rejected = ex.kind() == rf::ErrorKind::Validation;
    }
    CHECK(rejected);
}
