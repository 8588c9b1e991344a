#include "rv/upload/object_key.hpp"

#include <gtest/gtest.h>

using namespace rv::upload;
using rv::jobs::Clock;

namespace {

// 2024-03-05 12:00:00 UTC
const auto kNow = Clock::from_time_t(1709640000);

} // namespace

TEST(ObjectKeyTest, PlainFileName) {
    auto key = generate_object_key("/media/clip.mov", KeyOptions{}, kNow);
    ASSERT_TRUE(key.is_ok());
    EXPECT_EQ(key.value(), "clip.mov");
}

TEST(ObjectKeyTest, PrefixAndUtcDateFolder) {
    KeyOptions options;
    options.prefix = "archive//";
    options.use_date_folder = true;

    auto key = generate_object_key("/media/clip.mov", options, kNow);
    ASSERT_TRUE(key.is_ok());
    EXPECT_EQ(key.value(), "archive/2024/03/05/clip.mov");
}

TEST(ObjectKeyTest, PreservesDirectoriesBelowBase) {
    KeyOptions options;
    options.prefix = "archive";
    options.preserve_directory_structure = true;
    options.base_directory = "/media";

    auto key = generate_object_key("/media/projects/reel-1/clip.mov", options, kNow);
    ASSERT_TRUE(key.is_ok());
    EXPECT_EQ(key.value(), "archive/projects/reel-1/clip.mov");

    auto outside = generate_object_key("/elsewhere/clip.mov", options, kNow);
    ASSERT_TRUE(outside.is_ok());
    EXPECT_EQ(outside.value(), "archive/clip.mov");
}

TEST(ObjectKeyTest, NamingPatternPlaceholders) {
    KeyOptions options;
    options.naming_pattern = "{timestamp}_{filename}";

    auto key = generate_object_key("/media/clip.mov", options, kNow);
    ASSERT_TRUE(key.is_ok());
    EXPECT_EQ(key.value(), "1709640000_clip.mov");
}

TEST(ObjectKeyTest, UuidPlaceholderIsUnique) {
    KeyOptions options;
    options.naming_pattern = "{uuid}-{filename}";

    auto first = generate_object_key("/media/clip.mov", options, kNow);
    auto second = generate_object_key("/media/clip.mov", options, kNow);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_NE(first.value(), second.value());
    EXPECT_EQ(first.value().size(), 36u + 1u + 8u);
    EXPECT_EQ(first.value().substr(37), "clip.mov");
}

TEST(ObjectKeyTest, RejectsPathWithoutFileName) {
    auto key = generate_object_key("/media/", KeyOptions{}, kNow);
    ASSERT_TRUE(key.is_error());
    EXPECT_EQ(key.error().kind, rv::ErrorKind::InvalidArgument);
}
