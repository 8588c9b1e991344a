#pragma once

#include "rv/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace rv::storage {

/// Size of a regular file. Missing or non-regular paths are NotFound.
Result<std::uint64_t> file_size(const std::filesystem::path& path);

/**
 * Read [offset, offset + length) of a file.
 *
 * A range that runs past the end of the file is an error, since the part plan
 * was derived from a size the file no longer has.
 */
Result<std::vector<char>> read_range(const std::filesystem::path& path,
                                     std::uint64_t offset,
                                     std::uint64_t length);

/// Write bytes at offset, creating the file when it does not exist.
Result<void> write_range(const std::filesystem::path& path,
                         std::uint64_t offset,
                         const std::vector<char>& data);

Result<void> ensure_parent_exists(const std::filesystem::path& path);

} // namespace rv::storage
