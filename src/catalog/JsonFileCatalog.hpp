#pragma once

#include "catalog/CatalogProvider.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rf::catalog
{

// Catalog backed by a local JSON file:
//   {"movies": [{"title", "year", "rating", "genre", "link",
//                "torrents": [{"quality", "sizes", "url", "magnet"}]}]}
// The file is re-read on every call so it can be edited while the daemon
// runs. A missing file is an empty catalog.
class JsonFileCatalog final : public CatalogProvider
{
  public:
    static constexpr int kPageSize = 20;

    explicit JsonFileCatalog(std::filesystem::path path);

    std::vector<Candidate> browse(SearchCriteria const &criteria) override;
    std::optional<Candidate> resolve(std::string const &reference) override;

    std::filesystem::path const &path() const noexcept
    {
        return path_;
    }

  private:
    std::vector<Candidate> load() const;

    std::filesystem::path path_;
};

} // namespace rf::catalog
