#include "rv/storage/file_io.hpp"

#include <fstream>

namespace rv::storage {
namespace fs = std::filesystem;

Result<std::uint64_t> file_size(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Err<std::uint64_t>(Error::not_found("File not found: " + path.string()));
    }

    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err<std::uint64_t>(Error::permanent("Failed to stat " + path.string() + ": " + ec.message()));
    }
    return Ok(static_cast<std::uint64_t>(size));
}

Result<std::vector<char>> read_range(const fs::path& path, std::uint64_t offset, std::uint64_t length) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::vector<char>>(Error::not_found("Failed to open source file: " + path.string()));
    }

    std::vector<char> buffer(static_cast<std::size_t>(length));
    if (length == 0) {
        return Ok(std::move(buffer));
    }

    input.seekg(static_cast<std::streamoff>(offset));
    input.read(buffer.data(), static_cast<std::streamsize>(length));
    if (static_cast<std::uint64_t>(input.gcount()) != length) {
        return Err<std::vector<char>>(Error::permanent(
            "Short read from " + path.string() + " at offset " + std::to_string(offset) +
            ": file changed after submission?"));
    }
    return Ok(std::move(buffer));
}

Result<void> write_range(const fs::path& path, std::uint64_t offset, const std::vector<char>& data) {
    if (auto res = ensure_parent_exists(path); res.is_error()) {
        return res;
    }

    std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
    if (!file) {
        std::ofstream create(path, std::ios::binary | std::ios::trunc);
        if (!create) {
            return Err<void>(Error::permanent("Failed to create file: " + path.string()));
        }
        create.close();
        file.open(path, std::ios::in | std::ios::out | std::ios::binary);
    }

    if (!file) {
        return Err<void>(Error::permanent("Failed to open file: " + path.string()));
    }

    file.seekp(static_cast<std::streamoff>(offset));
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!file) {
        return Err<void>(Error::permanent("Failed to write " + path.string()));
    }
    return Ok();
}

Result<void> ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return Ok();
    }

    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return Err<void>(Error::permanent("Failed to create directory: " + parent.string()));
    }
    return Ok();
}

} // namespace rv::storage
