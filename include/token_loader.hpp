/**
 * @file token_loader.hpp
 * @brief GitHub token file loader.
 */
#ifndef GH_TOP_PROJECTS_TOKEN_LOADER_HPP
#define GH_TOP_PROJECTS_TOKEN_LOADER_HPP

#include <string>
#include <vector>

namespace ghtp {

/**
 * Load GitHub access tokens from a JSON, YAML or TOML file.
 *
 * Files may contain a single string, a flat array of tokens, or an
 * object/table with a `token` string and/or a `tokens` array. Surrounding
 * whitespace is stripped and empty entries are dropped.
 *
 * @param path Filesystem path to the token file
 * @return Tokens in file order
 * @throws std::runtime_error on unsupported formats or read errors
 */
std::vector<std::string> load_tokens_from_file(const std::string &path);

/**
 * Load the first token from @p path.
 *
 * @throws std::runtime_error When the file holds no token.
 */
std::string load_token_from_file(const std::string &path);

} // namespace ghtp

#endif // GH_TOP_PROJECTS_TOKEN_LOADER_HPP
