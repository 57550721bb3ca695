/**
 * @file org_list.hpp
 * @brief Loader for the list of organizations to crawl.
 */
#ifndef WORKFLOWHARVEST_ORG_LIST_HPP
#define WORKFLOWHARVEST_ORG_LIST_HPP

#include <string>
#include <vector>

namespace wfh {

/**
 * Load organization logins from a file.
 *
 * JSON, YAML and TOML files (chosen by extension) hold either a flat array of
 * logins or a mapping with an `orgs` array. Any other file is read as plain
 * text with one login per line; blank lines and `#` comments are ignored.
 * Logins are trimmed and duplicates removed, keeping the first occurrence.
 *
 * @param path Filesystem path to the organizations file
 * @return Logins in file order
 * @throws std::runtime_error When the file cannot be read or has an
 *         unexpected shape.
 */
std::vector<std::string> load_orgs_from_file(const std::string &path);

} // namespace wfh

#endif // WORKFLOWHARVEST_ORG_LIST_HPP
