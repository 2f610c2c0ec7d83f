/**
 * @file search_query.hpp
 * @brief Repository search filter and query construction.
 */

#ifndef GH_TOP_PROJECTS_SEARCH_QUERY_HPP
#define GH_TOP_PROJECTS_SEARCH_QUERY_HPP

#include <string>
#include <utility>
#include <vector>

namespace ghtp {

/// Largest page size accepted by the search endpoint.
constexpr int kSearchPageSize = 100;

/// The search endpoint serves at most this many results per query.
constexpr long kSearchResultCap = 1000;

/// Criteria narrowing which repositories a search returns.
struct SearchFilter {
  std::string language; ///< Primary language, passed through verbatim
  int min_stars{0};     ///< Inclusive lower star bound
  int max_stars{0};     ///< Inclusive upper star bound
  int min_forks{0};     ///< Inclusive minimum fork count
};

/**
 * Build the `q` value for a search, e.g.
 * `language:rust stars:1000..5000 forks:>=0`.
 */
std::string build_search_query(const SearchFilter &filter);

/**
 * Query parameters for one page of a search sorted by stars, descending.
 *
 * @param filter Search criteria.
 * @param page One-based page number.
 * @param per_page Page size.
 * @return Ordered name/value pairs, not yet percent-encoded.
 */
std::vector<std::pair<std::string, std::string>>
search_parameters(const SearchFilter &filter, int page,
                  int per_page = kSearchPageSize);

/**
 * Absolute URL of one search page.
 *
 * @param api_base API root such as `https://api.github.com`.
 * @param filter Search criteria.
 * @param page One-based page number.
 * @param per_page Page size.
 * @return Fully percent-encoded URL.
 */
std::string search_url(const std::string &api_base, const SearchFilter &filter,
                       int page, int per_page = kSearchPageSize);

} // namespace ghtp

#endif // GH_TOP_PROJECTS_SEARCH_QUERY_HPP
