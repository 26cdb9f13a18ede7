// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "util/files.hpp"
#include "util/logging.hpp"
#include <cstdio>
#include <fstream>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace statesync {
namespace util {

namespace {

bool sync_path(const std::filesystem::path &path, int flags) {
  int fd = open(path.c_str(), flags);
  if (fd < 0)
    return false;
  bool result = fsync(fd) == 0;
  close(fd);
  return result;
}

// Random suffix for temp files
std::string random_suffix() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, 0xFFFF);
  char buf[8];
  snprintf(buf, sizeof(buf), "%04x", dis(gen));
  return std::string(buf);
}

} // anonymous namespace

bool atomic_write_file(const std::filesystem::path &path,
                       const std::vector<uint8_t> &data) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + random_suffix();

  {
    std::ofstream temp_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!temp_file) {
      return false;
    }

    temp_file.write(reinterpret_cast<const char *>(data.data()),
                    static_cast<std::streamsize>(data.size()));
    temp_file.flush();
    if (!temp_file) {
      temp_file.close();
      std::error_code ec;
      std::filesystem::remove(temp_path, ec);
      return false;
    }
  }

  sync_path(temp_path, O_RDONLY);
  if (!parent.empty()) {
    sync_directory(parent);
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    return false;
  }

  return true;
}

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data) {
  std::vector<uint8_t> vec(data.begin(), data.end());
  return atomic_write_file(path, vec);
}

std::optional<std::vector<uint8_t>>
read_range(const std::filesystem::path &path, uint64_t offset, uint64_t len) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::nullopt;
  }

  std::vector<uint8_t> data(static_cast<size_t>(len));
  if (len == 0) {
    return data;
  }
  file.seekg(static_cast<std::streamoff>(offset));
  file.read(reinterpret_cast<char *>(data.data()),
            static_cast<std::streamsize>(len));
  if (!file || static_cast<uint64_t>(file.gcount()) != len) {
    return std::nullopt;
  }
  return data;
}

bool write_at(const std::filesystem::path &path, uint64_t offset,
              const uint8_t *data, size_t len) {
  // in|out keeps the existing content and length
  std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
  if (!file) {
    LOG_ERROR("write_at: failed to open {}", path.string());
    return false;
  }
  file.seekp(static_cast<std::streamoff>(offset));
  file.write(reinterpret_cast<const char *>(data),
             static_cast<std::streamsize>(len));
  file.flush();
  if (!file) {
    LOG_ERROR("write_at: failed to write {} bytes at {} in {}", len, offset,
              path.string());
    return false;
  }
  return true;
}

bool create_sized_file(const std::filesystem::path &path, uint64_t size) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    return false;
  }
  {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
      return false;
    }
  }
  std::error_code ec;
  std::filesystem::resize_file(path, size, ec);
  return !ec;
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::is_directory(dir);
}

bool sync_directory(const std::filesystem::path &dir) {
  return sync_path(dir, O_RDONLY | O_DIRECTORY);
}

bool remove_all(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
  if (ec) {
    LOG_ERROR("Failed to remove {}: {}", path.string(), ec.message());
    return false;
  }
  return true;
}

bool is_empty_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return false;
  }
  return std::filesystem::is_empty(dir, ec) && !ec;
}

} // namespace util
} // namespace statesync
