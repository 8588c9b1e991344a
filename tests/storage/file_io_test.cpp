#include "rv/storage/file_io.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using namespace rv::storage;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    fs::path dir = fs::temp_directory_path() /
                   ("rv_file_io_test_" + std::string(info->name()) + "_" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

} // namespace

TEST(FileIoTest, SizeOfRegularFile) {
    const auto dir = create_temp_dir();
    {
        std::ofstream out(dir / "clip.mov", std::ios::binary);
        out << "0123456789";
    }

    auto size = rv::storage::file_size(dir / "clip.mov");
    ASSERT_TRUE(size.is_ok());
    EXPECT_EQ(size.value(), 10u);

    auto missing = rv::storage::file_size(dir / "missing.mov");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, rv::ErrorKind::NotFound);

    EXPECT_TRUE(rv::storage::file_size(dir).is_error());
}

TEST(FileIoTest, ReadRangeReturnsExactSlice) {
    const auto dir = create_temp_dir();
    {
        std::ofstream out(dir / "clip.mov", std::ios::binary);
        out << "abcdefghij";
    }

    auto slice = read_range(dir / "clip.mov", 3, 4);
    ASSERT_TRUE(slice.is_ok());
    EXPECT_EQ(std::string(slice.value().begin(), slice.value().end()), "defg");

    auto empty = read_range(dir / "clip.mov", 0, 0);
    ASSERT_TRUE(empty.is_ok());
    EXPECT_TRUE(empty.value().empty());
}

TEST(FileIoTest, ShortReadIsPermanent) {
    const auto dir = create_temp_dir();
    {
        std::ofstream out(dir / "clip.mov", std::ios::binary);
        out << "abc";
    }

    auto res = read_range(dir / "clip.mov", 1, 10);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().kind, rv::ErrorKind::Permanent);
}

TEST(FileIoTest, WriteRangeCreatesParentsAndPatches) {
    const auto dir = create_temp_dir();
    const auto target = dir / "nested" / "out.bin";

    ASSERT_TRUE(write_range(target, 0, std::vector<char>{'h', 'e', 'l', 'l', 'o'}).is_ok());
    ASSERT_TRUE(write_range(target, 5, std::vector<char>{'!', '!'}).is_ok());
    ASSERT_TRUE(write_range(target, 0, std::vector<char>{'j'}).is_ok());

    EXPECT_EQ(read_file(target), "jello!!");
}
