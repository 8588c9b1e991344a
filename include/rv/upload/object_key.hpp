#pragma once

#include "rv/core/result.hpp"
#include "rv/jobs/types.hpp"

#include <optional>
#include <string>

namespace rv::upload {

/**
 * @brief How submitted files are named in the bucket
 *
 * Key layout: [prefix/][YYYY/MM/DD/][relative parent/]name
 * where name is the file name, or naming_pattern with {filename},
 * {timestamp} (epoch seconds) and {uuid} substituted.
 */
struct KeyOptions {
    std::optional<std::string> prefix;
    bool use_date_folder = false;
    bool preserve_directory_structure = false;
    std::string base_directory;                  ///< Parent dirs are taken relative to this
    std::optional<std::string> naming_pattern;
};

/// Date folders use UTC.
Result<std::string> generate_object_key(const std::string& source_path,
                                        const KeyOptions& options,
                                        jobs::TimePoint now = jobs::Clock::now());

} // namespace rv::upload
