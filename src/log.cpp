#include "log.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>
#include <zlib.h>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr const char *kRootLogger = "wfh";

std::weak_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;
std::string g_log_file; // file sink already attached, guarded by g_logger_mutex
std::once_flag g_thread_pool_once;

void ensure_thread_pool() {
  std::call_once(g_thread_pool_once, [] {
    constexpr std::size_t queue_size = 32768;
    constexpr std::size_t num_threads = 1;
    spdlog::init_thread_pool(queue_size, num_threads);
  });
}

std::shared_ptr<spdlog::details::thread_pool> logging_pool() {
  auto pool = spdlog::thread_pool();
  if (!pool) {
    ensure_thread_pool();
    pool = spdlog::thread_pool();
  }
  return pool;
}

namespace fs = std::filesystem;

/**
 * Path of the rotated log file with the given index (`app.log` -> `app.2.log`).
 */
fs::path rotated_path(const std::string &base, std::size_t index) {
  fs::path base_path(base);
  if (index == 0) {
    return base_path;
  }
  std::string stem = base_path.stem().string();
  std::string ext = base_path.extension().string();
  return base_path.parent_path() /
         (stem + "." + std::to_string(index) + ext);
}

/**
 * Shift the gzip archives of rotated logs up by one slot, dropping the oldest.
 */
void shift_compressed_logs(const std::string &base, std::size_t max_files) {
  if (max_files == 0) {
    return;
  }
  std::error_code ec;
  fs::remove(rotated_path(base, max_files).string() + ".gz", ec);
  for (std::size_t i = max_files; i > 1; --i) {
    fs::path src_gz = rotated_path(base, i - 1).string() + ".gz";
    if (!fs::exists(src_gz, ec)) {
      continue;
    }
    fs::path dst_gz = rotated_path(base, i).string() + ".gz";
    fs::remove(dst_gz, ec);
    fs::rename(src_gz, dst_gz, ec);
  }
}

/**
 * Gzip a rotated log file next to itself and remove the original.
 *
 * @return `true` when the archive was written completely.
 */
bool gzip_rotated_file(const std::string &path) {
  auto log = wfh::category_logger("logging");
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    log->warn("Failed to open log file {} for compression", path);
    return false;
  }
  const std::string gz_path = path + ".gz";
  gzFile gz = gzopen(gz_path.c_str(), "wb");
  if (!gz) {
    log->warn("Failed to open compressed log {}", gz_path);
    return false;
  }
  char buffer[16 * 1024];
  while (input) {
    input.read(buffer, sizeof(buffer));
    std::streamsize read = input.gcount();
    if (read <= 0) {
      continue;
    }
    int written = gzwrite(gz, buffer, static_cast<unsigned>(read));
    if (written != read) {
      int err = 0;
      const char *msg = gzerror(gz, &err);
      log->warn("Failed to compress log {}: {}", path, msg ? msg : "unknown");
      gzclose(gz);
      std::error_code ec;
      fs::remove(gz_path, ec);
      return false;
    }
  }
  gzclose(gz);
  input.close();
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    log->warn("Failed to remove log {} after compression: {}", path,
              ec.message());
  }
  return true;
}

spdlog::sink_ptr make_file_sink(const std::string &file,
                                std::size_t rotate_files,
                                bool compress_rotations) {
  if (rotate_files == 0) {
    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false);
  }
  spdlog::file_event_handlers handlers;
  if (compress_rotations) {
    handlers.before_open = [rotate_files](const spdlog::filename_t &filename) {
      const auto base = spdlog::details::os::filename_to_str(filename);
      shift_compressed_logs(base, rotate_files);
      fs::path newest = rotated_path(base, 1);
      std::error_code ec;
      if (fs::exists(newest, ec)) {
        gzip_rotated_file(newest.string());
      }
    };
  }
  return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      file, 1024 * 1024 * 5, rotate_files, false, handlers);
}

bool is_project_logger(const std::string &name) {
  const std::string root(kRootLogger);
  return name == root || name.rfind(root + ".", 0) == 0;
}
} // namespace

namespace wfh {

void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files,
                 bool compress_rotations) {
  ensure_thread_pool();
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(kRootLogger);
  if (!logger) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!file.empty()) {
      sinks.push_back(make_file_sink(file, rotate_files, compress_rotations));
      g_log_file = file;
    }
    logger = std::make_shared<spdlog::async_logger>(
        kRootLogger, sinks.begin(), sinks.end(), logging_pool(),
        spdlog::async_overflow_policy::block);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    g_logger = logger;
  } else if (!file.empty() && file != g_log_file) {
    // Loggers created before the file was known get the file sink too. This
    // runs during start-up, before worker threads log.
    auto sink = make_file_sink(file, rotate_files, compress_rotations);
    spdlog::apply_all([&sink](const std::shared_ptr<spdlog::logger> &l) {
      if (is_project_logger(l->name())) {
        l->sinks().push_back(sink);
      }
    });
    g_log_file = file;
  }
  lock.unlock();
  spdlog::apply_all([level](const std::shared_ptr<spdlog::logger> &l) {
    if (is_project_logger(l->name())) {
      l->set_level(level);
    }
  });
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug("Logger initialised (level={}, file='{}', rotate={}, "
                "compress={})",
                spdlog::level::to_string_view(level), file, rotate_files,
                compress_rotations);
}

void ensure_default_logger() {
  auto logger = spdlog::default_logger();
  auto locked = g_logger.lock();
  if (!logger || !locked || logger.get() != locked.get()) {
    init_logger(spdlog::level::info);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  ensure_thread_pool();
  const std::string name = std::string(kRootLogger) + "." + category;
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto root = g_logger.lock();
  if (!root) {
    lock.unlock();
    init_logger(spdlog::level::info);
    lock.lock();
    if (auto existing = spdlog::get(name)) {
      return existing;
    }
    root = g_logger.lock();
  }
  std::vector<spdlog::sink_ptr> sinks;
  if (root) {
    sinks = root->sinks();
  } else {
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  }
  auto logger = std::make_shared<spdlog::async_logger>(
      name, sinks.begin(), sinks.end(), logging_pool(),
      spdlog::async_overflow_policy::block);
  logger->set_level(root ? root->level() : spdlog::level::info);
  spdlog::register_logger(logger);
  return logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  if (overrides.empty()) {
    return;
  }
  for (const auto &[category, level] : overrides) {
    auto logger = category_logger(category);
    logger->set_level(level);
    logger->debug("Category '{}' set to level {}", category,
                  spdlog::level::to_string_view(level));
  }
}

} // namespace wfh
