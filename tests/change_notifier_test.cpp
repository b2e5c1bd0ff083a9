#include "gtest/gtest.h"
#include "ovslink/change_notifier.hpp"
#include "fake_ovsdb_server.hpp" // For RecordingLogger

#include <stdexcept>
#include <variant>

using ovslink::ChangeNotifier;
using ovslink::TableCache;
using ovslink::testing::RecordingLogger;
namespace ovsdb = ovslink::ovsdb;
using ovsdb::Json;

class ChangeNotifierTest : public ::testing::Test {
protected:
    TableCache cache;
    RecordingLogger logger;
    ChangeNotifier notifier{cache, logger};
};

// --- Mapping messages to events ---

TEST_F(ChangeNotifierTest, FromMessage_Update) {
    auto event = ChangeNotifier::from_message(
        "update", Json::parse(R"(["mon", {"Bridge": {"b1": {"new": {"name": "br0"}}}}])"));
    ASSERT_TRUE(event.has_value());
    const auto* updated = std::get_if<ovslink::UpdatedEvent>(&event.value());
    ASSERT_NE(updated, nullptr);
    EXPECT_EQ(updated->monitor_id, "mon");
    EXPECT_EQ(updated->updates.at("Bridge").size(), 1);
}

TEST_F(ChangeNotifierTest, FromMessage_LockEvents) {
    auto locked = ChangeNotifier::from_message("locked", Json::parse(R"(["my_lock"])"));
    ASSERT_TRUE(locked.has_value());
    ASSERT_TRUE(std::holds_alternative<ovslink::LockedEvent>(locked.value()));
    EXPECT_EQ(std::get<ovslink::LockedEvent>(locked.value()).lock_name, "my_lock");

    auto stolen = ChangeNotifier::from_message("stolen", Json::parse(R"(["my_lock"])"));
    ASSERT_TRUE(stolen.has_value());
    EXPECT_TRUE(std::holds_alternative<ovslink::StolenEvent>(stolen.value()));
}

TEST_F(ChangeNotifierTest, FromMessage_Echo) {
    auto echo = ChangeNotifier::from_message("echo", Json::parse(R"(["ping"])"));
    ASSERT_TRUE(echo.has_value());
    ASSERT_TRUE(std::holds_alternative<ovslink::EchoEvent>(echo.value()));
    EXPECT_EQ(std::get<ovslink::EchoEvent>(echo.value()).payload, Json::parse(R"(["ping"])"));
}

TEST_F(ChangeNotifierTest, FromMessage_UnknownMethod) {
    EXPECT_FALSE(ChangeNotifier::from_message("update2", Json::array()).has_value());
}

TEST_F(ChangeNotifierTest, FromMessage_MalformedUpdateThrows) {
    EXPECT_THROW(ChangeNotifier::from_message("update", Json::parse(R"(["mon"])")), std::runtime_error);
    EXPECT_THROW(ChangeNotifier::from_message("update", Json::parse(R"(["mon", 7])")), std::runtime_error);
}

// --- Applying events ---

TEST_F(ChangeNotifierTest, OnMessage_UpdateReachesCache) {
    notifier.on_message("update", Json::parse(R"(["mon", {"Bridge": {"b1": {"new": {"name": "br0"}}}}])"));
    EXPECT_EQ(notifier.updates_applied(), 1);
    auto row = cache.get_row("Bridge", "b1");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ((*row)["name"], "br0");

    notifier.on_message("update", Json::parse(R"(["mon", {"Bridge": {"b1": {"old": {"name": "br0"}}}}])"));
    EXPECT_EQ(notifier.updates_applied(), 2);
    EXPECT_FALSE(cache.get_row("Bridge", "b1").has_value());
}

TEST_F(ChangeNotifierTest, OnMessage_NonUpdateEventsLeaveCacheAlone) {
    notifier.on_message("locked", Json::parse(R"(["l"])"));
    notifier.on_message("stolen", Json::parse(R"(["l"])"));
    notifier.on_message("echo", Json::array());
    EXPECT_EQ(notifier.updates_applied(), 0);
    EXPECT_TRUE(cache.snapshot().empty());
}

TEST_F(ChangeNotifierTest, OnMessage_MalformedUpdateIsLoggedAndDropped) {
    notifier.on_message("update", Json::parse(R"(["mon", {"Bridge": []}])"));
    EXPECT_EQ(notifier.updates_applied(), 0);
    EXPECT_TRUE(cache.snapshot().empty());
    EXPECT_TRUE(logger.contains(ovslink::LogLevel::ERROR, "Dropping malformed update"));
}
