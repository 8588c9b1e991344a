#include "rv/upload/object_key.hpp"
#include "rv/core/uuid.hpp"

#include <spdlog/fmt/chrono.h>

#include <filesystem>
#include <vector>

namespace rv::upload {
namespace fs = std::filesystem;

namespace {

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string join(const std::vector<std::string>& parts) {
    std::string key;
    for (const auto& part : parts) {
        if (!key.empty()) {
            key += '/';
        }
        key += part;
    }
    return key;
}

} // namespace

Result<std::string> generate_object_key(const std::string& source_path,
                                        const KeyOptions& options,
                                        jobs::TimePoint now) {
    const fs::path path(source_path);
    const std::string file_name = path.filename().string();
    if (file_name.empty() || file_name == "." || file_name == "..") {
        return Err<std::string>(Error::invalid_argument("Invalid file name: " + source_path));
    }

    std::vector<std::string> parts;

    if (options.prefix) {
        std::string prefix = *options.prefix;
        while (!prefix.empty() && prefix.back() == '/') {
            prefix.pop_back();
        }
        if (!prefix.empty()) {
            parts.push_back(prefix);
        }
    }

    const auto seconds = jobs::Clock::to_time_t(now);
    if (options.use_date_folder) {
        parts.push_back(fmt::format("{:%Y/%m/%d}", fmt::gmtime(seconds)));
    }

    if (options.preserve_directory_structure && !options.base_directory.empty()) {
        const auto relative = path.lexically_relative(options.base_directory);
        const auto parent = relative.parent_path();
        // Files outside the base directory keep a flat key
        if (!relative.empty() && !parent.empty() && *relative.begin() != "..") {
            parts.push_back(parent.generic_string());
        }
    }

    std::string name = file_name;
    if (options.naming_pattern && !options.naming_pattern->empty()) {
        name = *options.naming_pattern;
        replace_all(name, "{filename}", file_name);
        replace_all(name, "{timestamp}", std::to_string(static_cast<long long>(seconds)));
        replace_all(name, "{uuid}", generate_uuid());
    }
    parts.push_back(name);

    return Ok(join(parts));
}

} // namespace rv::upload
