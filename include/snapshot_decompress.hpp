/**
 * @file snapshot_decompress.hpp
 * @brief Conversion of gzip compressed snapshots back to plain files.
 */
#ifndef WORKFLOWHARVEST_SNAPSHOT_DECOMPRESS_HPP
#define WORKFLOWHARVEST_SNAPSHOT_DECOMPRESS_HPP

#include <cstddef>
#include <filesystem>

namespace wfh {

/// Counters of a decompression pass.
struct DecompressStats {
  std::size_t converted{0}; ///< `.yml` files written
  std::size_t skipped{0};   ///< Plain file already present
  std::size_t failed{0};    ///< Corrupt or unwritable files
};

/**
 * Decompress every `*.yml.gz` below @p root to its sibling `*.yml`.
 *
 * Existing plain files are left alone. Each output is written atomically.
 *
 * @param keep_original Keep the `.gz` file after a successful conversion.
 * @param workers Number of files processed in parallel.
 * @throws std::runtime_error When @p root is not a directory.
 */
DecompressStats decompress_snapshots(const std::filesystem::path &root,
                                     bool keep_original = false,
                                     int workers = 4);

} // namespace wfh

#endif // WORKFLOWHARVEST_SNAPSHOT_DECOMPRESS_HPP
