#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <unistd.h>
#include "store/json_file_stream_store.hpp"
#include "store/memory_stream_store.hpp"

namespace fs = std::filesystem;
using namespace rtmp2rtsp;
using namespace rtmp2rtsp::store;
using model::ErrorCode;

namespace {

model::StreamConfig MakeConfig(const std::string& name, int port = 8554) {
    return {name, "rtmp://example/live/" + name, port};
}

model::StreamStatus MakeStatus(bool running, const std::string& reason) {
    model::StreamStatus s;
    s.running = running;
    s.reason = reason;
    s.last_checked_at = std::chrono::system_clock::now();
    return s;
}

} // namespace

TEST(MemoryStreamStoreTest, PutRejectsDuplicateName) {
    MemoryStreamStore store;
    ASSERT_TRUE(store.Put(MakeConfig("cam1"), MakeStatus(false, "starting"), false).ok());

    auto st = store.Put(MakeConfig("cam1", 9000), MakeStatus(false, "starting"), false);
    EXPECT_EQ(st.code, ErrorCode::DUPLICATE_NAME);
    EXPECT_EQ(store.Get("cam1")->config.rtsp_port, 8554);
}

TEST(MemoryStreamStoreTest, ListKeepsInsertionOrder) {
    MemoryStreamStore store;
    for (const auto* name : {"c", "a", "b"}) {
        ASSERT_TRUE(store.Put(MakeConfig(name), MakeStatus(false, ""), false).ok());
    }
    ASSERT_TRUE(store.Delete("a").ok());
    ASSERT_TRUE(store.Put(MakeConfig("a"), MakeStatus(false, ""), false).ok());

    auto list = store.List();
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0].config.name, "c");
    EXPECT_EQ(list[1].config.name, "b");
    EXPECT_EQ(list[2].config.name, "a");
}

TEST(MemoryStreamStoreTest, ReplaceKeepsPositionAndCreationTime) {
    MemoryStreamStore store;
    ASSERT_TRUE(store.Put(MakeConfig("cam1"), MakeStatus(false, ""), false).ok());
    ASSERT_TRUE(store.Put(MakeConfig("cam2"), MakeStatus(false, ""), false).ok());
    auto created = store.Get("cam1")->created_at;

    ASSERT_TRUE(store.Put(MakeConfig("cam1", 9000), MakeStatus(false, "starting"), true).ok());
    auto list = store.List();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].config.name, "cam1");
    EXPECT_EQ(list[0].config.rtsp_port, 9000);
    EXPECT_EQ(list[0].created_at, created);
}

TEST(MemoryStreamStoreTest, MissingRecords) {
    MemoryStreamStore store;
    EXPECT_FALSE(store.Get("nope").has_value());
    EXPECT_EQ(store.Delete("nope").code, ErrorCode::NOT_FOUND);
    EXPECT_EQ(store.UpdateStatus("nope", MakeStatus(true, "healthy")).code, ErrorCode::NOT_FOUND);
}

TEST(MemoryStreamStoreTest, UpdateStatus) {
    MemoryStreamStore store;
    ASSERT_TRUE(store.Put(MakeConfig("cam1"), MakeStatus(false, "starting"), false).ok());
    ASSERT_TRUE(store.UpdateStatus("cam1", MakeStatus(true, "healthy")).ok());

    auto rec = store.Get("cam1");
    ASSERT_TRUE(rec.has_value());
    EXPECT_TRUE(rec->status.running);
    EXPECT_EQ(rec->status.reason, "healthy");
}

class JsonFileStreamStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() /
               ("rtmp2rtsp_store_" + std::to_string(::getpid()) + "_" + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        path_ = (dir_ / "streams.json").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
    std::string path_;
};

TEST_F(JsonFileStreamStoreTest, MissingFileIsEmptyStore) {
    JsonFileStreamStore store(path_);
    ASSERT_TRUE(store.Load().ok());
    EXPECT_TRUE(store.List().empty());
    EXPECT_FALSE(fs::exists(path_));
}

TEST_F(JsonFileStreamStoreTest, SurvivesReload) {
    {
        JsonFileStreamStore store(path_);
        ASSERT_TRUE(store.Load().ok());
        ASSERT_TRUE(store.Put(MakeConfig("cam1"), MakeStatus(true, "healthy"), false).ok());
        ASSERT_TRUE(store.Put(MakeConfig("cam2", 8555), MakeStatus(false, "starting"), false).ok());
        ASSERT_TRUE(store.Put(MakeConfig("cam3", 8556), MakeStatus(false, ""), false).ok());
        ASSERT_TRUE(store.Delete("cam2").ok());
    }

    JsonFileStreamStore reloaded(path_);
    ASSERT_TRUE(reloaded.Load().ok());
    auto list = reloaded.List();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].config, MakeConfig("cam1"));
    EXPECT_EQ(list[0].status.reason, "healthy");
    EXPECT_TRUE(list[0].status.running);
    EXPECT_EQ(list[1].config, MakeConfig("cam3", 8556));
    EXPECT_GT(model::ToUnixMillis(list[0].created_at), 0);
    EXPECT_FALSE(fs::exists(path_ + ".tmp"));
}

TEST_F(JsonFileStreamStoreTest, CorruptFileIsStorageError) {
    {
        std::ofstream out(path_);
        out << "{\"version\": 1, \"streams\": [ {\"name\": ";
    }
    JsonFileStreamStore store(path_);
    EXPECT_EQ(store.Load().code, ErrorCode::STORAGE_ERROR);
}

TEST_F(JsonFileStreamStoreTest, UnknownVersionIsStorageError) {
    {
        std::ofstream out(path_);
        out << "{\"version\": 99, \"streams\": []}";
    }
    JsonFileStreamStore store(path_);
    EXPECT_EQ(store.Load().code, ErrorCode::STORAGE_ERROR);
}

TEST_F(JsonFileStreamStoreTest, FailedWriteRollsBack) {
    // A regular file where the state directory should be makes every write fail.
    auto blocker = dir_ / "blocker";
    { std::ofstream out(blocker); out << "x"; }

    JsonFileStreamStore store((blocker / "streams.json").string());
    ASSERT_TRUE(store.Load().ok());

    auto st = store.Put(MakeConfig("cam1"), MakeStatus(false, "starting"), false);
    EXPECT_EQ(st.code, ErrorCode::STORAGE_ERROR);
    EXPECT_FALSE(store.Get("cam1").has_value());
    EXPECT_TRUE(store.List().empty());
}

TEST_F(JsonFileStreamStoreTest, DuplicateNamesAreStorageError) {
    {
        std::ofstream out(path_);
        out << R"({"version": 1, "streams": [
            {"name": "cam1", "source_url": "rtmp://example/a", "rtsp_port": 8554},
            {"name": "cam1", "source_url": "rtmp://example/b", "rtsp_port": 8555}]})";
    }
    JsonFileStreamStore store(path_);
    auto st = store.Load();
    EXPECT_EQ(st.code, ErrorCode::STORAGE_ERROR);
    EXPECT_NE(st.message.find("duplicate"), std::string::npos);
    EXPECT_TRUE(store.List().empty());
}

TEST_F(JsonFileStreamStoreTest, InvalidRecordIsStorageError) {
    {
        std::ofstream out(path_);
        out << R"({"version": 1, "streams": [
            {"name": "cam1", "source_url": "http://example/a", "rtsp_port": 8554}]})";
    }
    JsonFileStreamStore store(path_);
    EXPECT_EQ(store.Load().code, ErrorCode::STORAGE_ERROR);

    {
        std::ofstream out(path_);
        out << R"({"version": 1, "streams": [
            {"name": "cam1", "source_url": "rtmp://example/a", "rtsp_port": 80}]})";
    }
    EXPECT_EQ(store.Load().code, ErrorCode::STORAGE_ERROR);
    EXPECT_TRUE(store.List().empty());
}
