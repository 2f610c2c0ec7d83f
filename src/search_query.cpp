#include "search_query.hpp"
#include "http_client.hpp"
#include <string>

namespace ghtp {

std::string build_search_query(const SearchFilter &filter) {
  return "language:" + filter.language + " stars:" +
         std::to_string(filter.min_stars) + ".." +
         std::to_string(filter.max_stars) +
         " forks:>=" + std::to_string(filter.min_forks);
}

std::vector<std::pair<std::string, std::string>>
search_parameters(const SearchFilter &filter, int page, int per_page) {
  return {{"q", build_search_query(filter)},
          {"sort", "stars"},
          {"order", "desc"},
          {"per_page", std::to_string(per_page)},
          {"page", std::to_string(page)}};
}

std::string search_url(const std::string &api_base, const SearchFilter &filter,
                       int page, int per_page) {
  std::string url = api_base + "/search/repositories";
  char sep = '?';
  for (const auto &[name, value] : search_parameters(filter, page, per_page)) {
    url += sep;
    url += name + "=" + url_encode(value);
    sep = '&';
  }
  return url;
}

} // namespace ghtp
