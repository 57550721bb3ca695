#include "snapshot_decompress.hpp"
#include "log.hpp"
#include "util/atomic_file.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <future>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace wfh {

namespace fs = std::filesystem;

namespace {

std::shared_ptr<spdlog::logger> decompress_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("decompress");
  }();
  return logger;
}

bool is_compressed_snapshot(const fs::path &p) {
  const std::string name = p.filename().string();
  const std::string suffix = ".yml.gz";
  return name.size() > suffix.size() &&
         name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

DecompressStats decompress_snapshots(const fs::path &root, bool keep_original,
                                     int workers) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    throw std::runtime_error("Not a directory: " + root.string());
  }
  std::vector<fs::path> inputs;
  for (auto it = fs::recursive_directory_iterator(root, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (it->is_regular_file(ec) && is_compressed_snapshot(it->path())) {
      inputs.push_back(it->path());
    }
  }
  if (ec) {
    decompress_log()->warn("Scanning {} stopped early: {}", root.string(),
                           ec.message());
  }

  std::atomic<std::size_t> converted{0}, skipped{0}, failed{0};
  WorkerPool pool(workers);
  pool.start();
  std::vector<std::future<void>> futures;
  futures.reserve(inputs.size());
  for (const auto &gz : inputs) {
    futures.push_back(pool.submit(gz.string(), [&, gz] {
      fs::path plain = gz;
      plain.replace_extension(); // drops ".gz"
      std::error_code fec;
      if (fs::exists(plain, fec)) {
        skipped.fetch_add(1);
        return;
      }
      try {
        write_file_atomic(plain, read_file(gz));
      } catch (const std::exception &e) {
        decompress_log()->warn("Cannot decompress {}: {}", gz.string(),
                               e.what());
        failed.fetch_add(1);
        return;
      }
      converted.fetch_add(1);
      if (!keep_original) {
        fs::remove(gz, fec);
        if (fec) {
          decompress_log()->warn("Cannot remove {}: {}", gz.string(),
                                 fec.message());
        }
      }
    }));
  }
  for (auto &f : futures) {
    f.get();
  }
  pool.stop();

  DecompressStats stats;
  stats.converted = converted.load();
  stats.skipped = skipped.load();
  stats.failed = failed.load();
  decompress_log()->info("Decompressed {} snapshots ({} skipped, {} failed)",
                         stats.converted, stats.skipped, stats.failed);
  return stats;
}

} // namespace wfh
