#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "key_adhesion/session_recorder.hpp"
#include "key_adhesion/session_store.hpp"

using namespace kb::adh;

namespace {

class SessionStoreTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("key_adhesion_") + info->name());
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override { std::filesystem::remove_all(dir_); }

    void writeFile(const std::string& name, const std::string& text)
    {
        std::filesystem::create_directories(dir_);
        std::ofstream out(dir_ / name);
        out << text;
    }

    std::filesystem::path dir_;
};

KeySession sampleSession()
{
    KeySession session;
    session.start_time = 100.0;
    session.end_time = 101.5;
    session.events = {
        KeyEvent::press("a", 100.1),
        KeyEvent::press("left shift", 100.12),
        KeyEvent::release("a", 100.2),
        KeyEvent::release("left shift", 100.3),
    };
    session.metadata["source"] = "test";
    return session;
}

}  // namespace

TEST_F(SessionStoreTest, SaveCreatesDirectoryAndTimestampedFile)
{
    SessionStore store(dir_);
    const auto path = store.save(sampleSession());

    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(path.parent_path(), dir_);
    const auto name = path.filename().string();
    EXPECT_EQ(name.rfind("session_", 0), 0u);
    EXPECT_EQ(path.extension().string(), ".json");
}

TEST_F(SessionStoreTest, SavedSessionLoadsBack)
{
    SessionStore store(dir_);
    const auto path = store.save(sampleSession());
    const auto loaded = store.load(path);

    EXPECT_DOUBLE_EQ(loaded.start_time, 100.0);
    EXPECT_DOUBLE_EQ(loaded.end_time, 101.5);
    ASSERT_EQ(loaded.events.size(), 4u);
    EXPECT_EQ(loaded.events[1].key(), "left shift");
    EXPECT_TRUE(loaded.events[2].isRelease());
    EXPECT_DOUBLE_EQ(loaded.events[2].timestamp(), 100.2);
    EXPECT_EQ(loaded.metadata.at("source"), "test");
}

TEST_F(SessionStoreTest, SecondSaveInSameSecondGetsDistinctName)
{
    SessionStore store(dir_);
    const auto first = store.save(sampleSession());
    const auto second = store.save(sampleSession());
    EXPECT_NE(first, second);
    EXPECT_EQ(store.listSessions().size(), 2u);
}

TEST_F(SessionStoreTest, ListSessionsIgnoresOtherFiles)
{
    writeFile("session_20240101_120000.json", "{}");
    writeFile("session_20230101_120000.json", "{}");
    writeFile("notes.txt", "hello");
    writeFile("other.json", "{}");

    SessionStore store(dir_);
    const auto sessions = store.listSessions();
    ASSERT_EQ(sessions.size(), 2u);
    EXPECT_EQ(sessions[0].filename().string(), "session_20230101_120000.json");
}

TEST_F(SessionStoreTest, ListSessionsOfMissingDirectoryIsEmpty)
{
    SessionStore store(dir_);
    EXPECT_TRUE(store.listSessions().empty());
}

TEST_F(SessionStoreTest, LoadMissingFileThrows)
{
    SessionStore store(dir_);
    EXPECT_THROW(store.load(dir_ / "session_missing.json"), std::runtime_error);
}

TEST_F(SessionStoreTest, LoadInvalidJsonThrows)
{
    writeFile("session_bad.json", "{ not json");
    SessionStore store(dir_);
    EXPECT_THROW(store.load(dir_ / "session_bad.json"), std::runtime_error);
}

TEST_F(SessionStoreTest, LoadMissingFieldThrows)
{
    writeFile("session_partial.json", R"({"start_time": 1.0, "events": []})");
    SessionStore store(dir_);
    EXPECT_THROW(store.load(dir_ / "session_partial.json"), std::runtime_error);
}

TEST(SessionStore, UnknownEventTypeIsRejected)
{
    const auto json = nlohmann::json::parse(R"({
        "start_time": 0.0, "end_time": 1.0, "metadata": {},
        "events": [{"key": "a", "event_type": "hold", "timestamp": 0.5}]
    })");
    EXPECT_THROW(SessionStore::fromJson(json), std::runtime_error);
}

TEST(SessionStore, ToJsonUsesWireFieldNames)
{
    const auto json = SessionStore::toJson(sampleSession());
    EXPECT_DOUBLE_EQ(json.at("start_time").get<double>(), 100.0);
    ASSERT_EQ(json.at("events").size(), 4u);
    EXPECT_EQ(json.at("events")[0].at("event_type"), "press");
    EXPECT_EQ(json.at("events")[2].at("event_type"), "release");
    EXPECT_EQ(json.at("events")[0].at("key"), "a");
    EXPECT_EQ(json.at("metadata").at("source"), "test");
}

TEST(SessionStore, NonStringMetadataIsKeptAsText)
{
    const auto json = nlohmann::json::parse(R"({
        "start_time": 0.0, "end_time": 1.0,
        "metadata": {"version": 2},
        "events": []
    })");
    const auto session = SessionStore::fromJson(json);
    EXPECT_EQ(session.metadata.at("version"), "2");
}

TEST(SessionRecorder, AppendsOnlyWhileRecording)
{
    SessionRecorder recorder;
    recorder.append(KeyEvent::press("a", 1.0));
    EXPECT_FALSE(recorder.hasSession());

    recorder.start(2.0);
    recorder.append(KeyEvent::press("a", 2.5));
    recorder.append(KeyEvent::release("a", 2.6));
    recorder.stop(3.0);
    recorder.append(KeyEvent::press("b", 3.5));

    EXPECT_FALSE(recorder.isRecording());
    EXPECT_TRUE(recorder.hasSession());
    EXPECT_EQ(recorder.eventCount(), 2u);
    EXPECT_DOUBLE_EQ(recorder.session().start_time, 2.0);
    EXPECT_DOUBLE_EQ(recorder.session().end_time, 3.0);
}

TEST(SessionRecorder, StartDiscardsPreviousSession)
{
    SessionRecorder recorder;
    recorder.start(0.0);
    recorder.append(KeyEvent::press("a", 0.5));
    recorder.start(1.0);
    EXPECT_EQ(recorder.eventCount(), 0u);

    recorder.reset();
    EXPECT_FALSE(recorder.hasSession());
    EXPECT_FALSE(recorder.isRecording());
}
