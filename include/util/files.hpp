#ifndef STATESYNC_UTIL_FILES_HPP
#define STATESYNC_UTIL_FILES_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace statesync {
namespace util {

/**
 * File helpers for scratchpads, checkpoints and tool output
 *
 * Atomic write pattern:
 * 1. Write to temporary file (.tmp suffix)
 * 2. fsync() the file
 * 3. fsync() the directory
 * 4. Atomic rename over original file
 *
 * Positional helpers (ReadRange / WriteAt) work on pre-sized files so chunks
 * can land in any order.
 */

/**
 * Write data to file atomically
 * Returns true on success, false on failure
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::vector<uint8_t> &data);

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data);

/**
 * Read `len` bytes at `offset`. Fails if the file is shorter.
 */
std::optional<std::vector<uint8_t>>
read_range(const std::filesystem::path &path, uint64_t offset, uint64_t len);

/**
 * Overwrite `len` bytes at `offset` of an existing file.
 */
bool write_at(const std::filesystem::path &path, uint64_t offset,
              const uint8_t *data, size_t len);

/**
 * Create (or truncate) a file and set its length; the content is sparse.
 */
bool create_sized_file(const std::filesystem::path &path, uint64_t size);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * fsync a directory so that renames inside it are durable
 */
bool sync_directory(const std::filesystem::path &dir);

/**
 * Recursively delete `path`. Missing paths count as success.
 */
bool remove_all(const std::filesystem::path &path);

/**
 * True if `dir` is a directory without entries. Missing paths are not empty
 * directories.
 */
bool is_empty_directory(const std::filesystem::path &dir);

} // namespace util
} // namespace statesync

#endif // STATESYNC_UTIL_FILES_HPP
