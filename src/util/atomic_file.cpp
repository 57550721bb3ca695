#include "util/atomic_file.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <unistd.h>
#include <zlib.h>

namespace wfh {

namespace fs = std::filesystem;

namespace {

std::atomic<unsigned long> g_temp_counter{0};

fs::path temp_sibling(const fs::path &path) {
  auto n = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
  return path.parent_path() /
         ("." + path.filename().string() + ".tmp." +
          std::to_string(::getpid()) + "." + std::to_string(n));
}

void write_plain(const fs::path &tmp, const std::string &data) {
  std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Failed to open " + tmp.string());
  }
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  out.close();
  if (!out) {
    throw std::runtime_error("Failed to write " + tmp.string());
  }
}

void write_gzip(const fs::path &tmp, const std::string &data) {
  gzFile gz = gzopen(tmp.c_str(), "wb");
  if (!gz) {
    throw std::runtime_error("Failed to open " + tmp.string());
  }
  std::size_t offset = 0;
  while (offset < data.size()) {
    auto chunk = static_cast<unsigned>(
        std::min<std::size_t>(data.size() - offset, 1U << 20));
    int written = gzwrite(gz, data.data() + offset, chunk);
    if (written <= 0) {
      int err = 0;
      std::string msg = gzerror(gz, &err);
      gzclose(gz);
      throw std::runtime_error("Failed to compress " + tmp.string() + ": " +
                               msg);
    }
    offset += static_cast<std::size_t>(written);
  }
  if (gzclose(gz) != Z_OK) {
    throw std::runtime_error("Failed to finish " + tmp.string());
  }
}

std::string read_gzip(const fs::path &path) {
  gzFile gz = gzopen(path.c_str(), "rb");
  if (!gz) {
    throw std::runtime_error("Failed to open " + path.string());
  }
  std::string out;
  char buffer[16 * 1024];
  while (true) {
    int n = gzread(gz, buffer, sizeof(buffer));
    if (n < 0) {
      int err = 0;
      std::string msg = gzerror(gz, &err);
      gzclose(gz);
      throw std::runtime_error("Failed to inflate " + path.string() + ": " +
                               msg);
    }
    if (n == 0) {
      break;
    }
    out.append(buffer, static_cast<std::size_t>(n));
  }
  int err = Z_OK;
  gzerror(gz, &err);
  const bool plain = gzdirect(gz) == 1;
  gzclose(gz);
  if (err == Z_BUF_ERROR) {
    throw std::runtime_error(path.string() + " is truncated");
  }
  if (plain && !out.empty()) {
    throw std::runtime_error(path.string() + " is not gzip data");
  }
  return out;
}

} // namespace

void write_file_atomic(const fs::path &path, const std::string &data,
                       bool gzip) {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("Failed to create " +
                               path.parent_path().string() + ": " +
                               ec.message());
    }
  }
  const fs::path tmp = temp_sibling(path);
  try {
    if (gzip) {
      write_gzip(tmp, data);
    } else {
      write_plain(tmp, data);
    }
    fs::rename(tmp, path);
  } catch (const std::exception &e) {
    fs::remove(tmp, ec);
    throw std::runtime_error("Atomic write of " + path.string() +
                             " failed: " + e.what());
  }
}

std::string read_file(const fs::path &path) {
  if (path.extension() == ".gz") {
    return read_gzip(path);
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open " + path.string());
  }
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

} // namespace wfh
