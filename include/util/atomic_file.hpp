/**
 * @file atomic_file.hpp
 * @brief Write files so that readers only ever see complete contents.
 */
#ifndef WORKFLOWHARVEST_UTIL_ATOMIC_FILE_HPP
#define WORKFLOWHARVEST_UTIL_ATOMIC_FILE_HPP

#include <filesystem>
#include <string>

namespace wfh {

/**
 * Write @p data to @p path through a sibling temporary file and a rename.
 *
 * Parent directories are created as needed. An existing file at @p path is
 * replaced. The temporary file is removed when any step fails.
 *
 * @param gzip Compress the payload with zlib's gzip format.
 * @throws std::runtime_error On any I/O failure.
 */
void write_file_atomic(const std::filesystem::path &path,
                       const std::string &data, bool gzip = false);

/**
 * Read a whole file, transparently inflating gzip content when @p path ends
 * with `.gz`.
 *
 * @throws std::runtime_error When the file cannot be read.
 */
std::string read_file(const std::filesystem::path &path);

} // namespace wfh

#endif // WORKFLOWHARVEST_UTIL_ATOMIC_FILE_HPP
