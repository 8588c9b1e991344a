#include "rv/storage/memory_object_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace rv::storage;
using rv::ErrorKind;
using rv::jobs::Clock;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    fs::path dir = fs::temp_directory_path() /
                   ("rv_memory_store_test_" + std::string(info->name()) + "_" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::vector<char> bytes(const std::string& text) {
    return std::vector<char>(text.begin(), text.end());
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

const Credentials kCreds{"key", "secret", std::nullopt, "us-east-1"};
const RequestOptions kOptions{};

} // namespace

TEST(MemoryObjectStoreTest, MultipartAssemblesInPartOrder) {
    MemoryObjectStore store;

    auto session = store.create_multipart_upload(kCreds, "archive/a.mov", kOptions);
    ASSERT_TRUE(session.is_ok());
    const auto upload_id = session.value();

    auto e2 = store.upload_part(kCreds, "archive/a.mov", upload_id, 2, bytes("world"), kOptions);
    auto e1 = store.upload_part(kCreds, "archive/a.mov", upload_id, 1, bytes("hello "), kOptions);
    ASSERT_TRUE(e1.is_ok());
    ASSERT_TRUE(e2.is_ok());
    EXPECT_EQ(store.open_sessions(), 1u);

    auto listed = store.list_parts(kCreds, "archive/a.mov", upload_id, kOptions);
    ASSERT_TRUE(listed.is_ok());
    ASSERT_EQ(listed.value().size(), 2u);
    EXPECT_EQ(listed.value()[0].part_number, 1u);

    auto done = store.complete_multipart_upload(
        kCreds, "archive/a.mov", upload_id,
        {CompletedPart{1, 6, e1.value()}, CompletedPart{2, 5, e2.value()}}, kOptions);
    ASSERT_TRUE(done.is_ok());

    auto data = store.object_data("archive/a.mov");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(std::string(data->begin(), data->end()), "hello world");
    EXPECT_EQ(store.open_sessions(), 0u);
}

TEST(MemoryObjectStoreTest, CompleteRejectsGapsAndBadEtags) {
    MemoryObjectStore store;
    const auto upload_id = store.create_multipart_upload(kCreds, "k", kOptions).value();
    auto e1 = store.upload_part(kCreds, "k", upload_id, 1, bytes("a"), kOptions).value();

    auto gap = store.complete_multipart_upload(kCreds, "k", upload_id, {CompletedPart{2, 1, e1}}, kOptions);
    ASSERT_TRUE(gap.is_error());
    EXPECT_EQ(gap.error().kind, ErrorKind::Permanent);

    auto bad_tag = store.complete_multipart_upload(kCreds, "k", upload_id, {CompletedPart{1, 1, "\"x\""}}, kOptions);
    EXPECT_TRUE(bad_tag.is_error());
    EXPECT_FALSE(store.has_object("k"));
}

TEST(MemoryObjectStoreTest, MissingCredentialsDenied) {
    MemoryObjectStore store;
    Credentials empty;

    auto res = store.create_multipart_upload(empty, "k", kOptions);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().kind, ErrorKind::Permanent);
    EXPECT_NE(res.error().message.find("AccessDenied"), std::string::npos);
}

TEST(MemoryObjectStoreTest, AbortDropsSession) {
    MemoryObjectStore store;
    const auto upload_id = store.create_multipart_upload(kCreds, "k", kOptions).value();

    ASSERT_TRUE(store.abort_multipart_upload(kCreds, "k", upload_id, kOptions).is_ok());
    EXPECT_EQ(store.aborted_sessions(), 1u);

    auto part = store.upload_part(kCreds, "k", upload_id, 1, bytes("a"), kOptions);
    ASSERT_TRUE(part.is_error());
    EXPECT_EQ(part.error().kind, ErrorKind::NotFound);
}

TEST(MemoryObjectStoreTest, LatencyBeyondTimeoutIsTransient) {
    MemoryObjectStore store;
    store.set_part_latency(std::chrono::milliseconds(200));
    const auto upload_id = store.create_multipart_upload(kCreds, "k", kOptions).value();

    RequestOptions tight{std::chrono::milliseconds(20)};
    auto part = store.upload_part(kCreds, "k", upload_id, 1, bytes("a"), tight);
    ASSERT_TRUE(part.is_error());
    EXPECT_TRUE(part.error().is_transient());
}

TEST(MemoryObjectStoreTest, PartFaultHook) {
    MemoryObjectStore store;
    store.set_part_fault([](const std::string&, std::uint32_t part) -> std::optional<rv::Error> {
        if (part == 2) {
            return rv::Error::transient("SlowDown");
        }
        return std::nullopt;
    });
    const auto upload_id = store.create_multipart_upload(kCreds, "k", kOptions).value();

    EXPECT_TRUE(store.upload_part(kCreds, "k", upload_id, 1, bytes("a"), kOptions).is_ok());
    EXPECT_TRUE(store.upload_part(kCreds, "k", upload_id, 2, bytes("b"), kOptions).is_error());
    EXPECT_EQ(store.part_calls("k"), 2u);
}

TEST(MemoryObjectStoreTest, RestoreLifecycle) {
    MemoryObjectStore store;
    store.put_object("archive/a.mov", bytes("payload"));

    auto before = store.restore_status(kCreds, "archive/a.mov", kOptions);
    ASSERT_TRUE(before.is_ok());
    EXPECT_EQ(before.value().state, RemoteRestoreState::NotFound);

    ASSERT_TRUE(store.request_restore(kCreds, "archive/a.mov", rv::jobs::RestoreTier::Bulk, 7, kOptions).is_ok());
    EXPECT_EQ(store.restore_status(kCreds, "archive/a.mov", kOptions).value().state,
              RemoteRestoreState::InProgress);

    const auto expires = Clock::now() + std::chrono::hours(24);
    store.complete_restore("archive/a.mov", expires);
    auto after = store.restore_status(kCreds, "archive/a.mov", kOptions);
    ASSERT_TRUE(after.is_ok());
    EXPECT_EQ(after.value().state, RemoteRestoreState::Completed);
    EXPECT_EQ(after.value().expires_at, std::optional<rv::jobs::TimePoint>(expires));
    EXPECT_EQ(store.status_queries("archive/a.mov"), 3u);
}

TEST(MemoryObjectStoreTest, RestoreOfMissingKeyRejected) {
    MemoryObjectStore store;
    auto res = store.request_restore(kCreds, "nope", rv::jobs::RestoreTier::Standard, 7, kOptions);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().kind, ErrorKind::NotFound);
}

TEST(MemoryObjectStoreTest, DownloadRequiresLiveRestore) {
    const auto dir = create_temp_dir();
    MemoryObjectStore store;
    store.put_object("k", bytes("restored bytes"));

    auto early = store.download_object(kCreds, "k", dir / "out.bin", nullptr, kOptions);
    ASSERT_TRUE(early.is_error());

    ASSERT_TRUE(store.request_restore(kCreds, "k", rv::jobs::RestoreTier::Standard, 1, kOptions).is_ok());
    store.complete_restore("k", Clock::now() + std::chrono::hours(1));

    std::uint64_t last_written = 0;
    auto ok = store.download_object(kCreds, "k", dir / "out.bin",
                                    [&](std::uint64_t written, std::uint64_t) { last_written = written; }, kOptions);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), 14u);
    EXPECT_EQ(last_written, 14u);
    EXPECT_EQ(read_file(dir / "out.bin"), "restored bytes");

    store.expire_restore("k");
    auto expired = store.download_object(kCreds, "k", dir / "again.bin", nullptr, kOptions);
    ASSERT_TRUE(expired.is_error());
    EXPECT_NE(expired.error().message.find("InvalidObjectState"), std::string::npos);
}

TEST(MemoryObjectStoreTest, ListObjectsByPrefix) {
    MemoryObjectStore store;
    store.put_object("archive/a.mov", bytes("a"));
    store.put_object("archive/b.mov", bytes("bb"));
    store.put_object("other/c.mov", bytes("c"), "STANDARD");

    auto listed = store.list_objects(kCreds, "archive/", kOptions);
    ASSERT_TRUE(listed.is_ok());
    ASSERT_EQ(listed.value().size(), 2u);
    EXPECT_EQ(listed.value()[1].size, 2u);
    EXPECT_EQ(listed.value()[0].storage_class, "DEEP_ARCHIVE");
}

TEST(MemoryObjectStoreTest, FailNextStatusIsOneShot) {
    MemoryObjectStore store;
    store.put_object("k", bytes("a"));
    store.fail_next_status("k", rv::Error::transient("ServiceUnavailable"));

    EXPECT_TRUE(store.restore_status(kCreds, "k", kOptions).is_error());
    EXPECT_TRUE(store.restore_status(kCreds, "k", kOptions).is_ok());
}
