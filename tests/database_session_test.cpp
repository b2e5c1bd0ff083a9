#include "gtest/gtest.h"
#include "ovslink/database_session.hpp"
#include "fake_ovsdb_server.hpp"

#include <chrono>
#include <memory>
#include <string>

using ovslink::DatabaseSession;
using ovslink::ErrorKind;
using ovslink::SessionOptions;
using ovslink::testing::FakeOvsdbServer;
using ovslink::testing::RecordingLogger;
using ovslink::testing::wait_until;
namespace ovsdb = ovslink::ovsdb;

class DatabaseSessionTest : public ::testing::Test {
protected:
    RecordingLogger logger;
    FakeOvsdbServer server;
    SessionOptions options;

    void SetUp() override {
        options.endpoint = "socketpair";
        options.transact_timeout = std::chrono::milliseconds(2000);
    }

    std::unique_ptr<DatabaseSession> start_session() {
        auto session = DatabaseSession::start(server.connect(logger), options, logger);
        if (!session) {
            ADD_FAILURE() << session.error().to_string();
            return nullptr;
        }
        return std::move(session.value());
    }
};

// --- Test Cases ---

TEST_F(DatabaseSessionTest, Start_LoadsSnapshot) {
    std::string br0 = server.add_bridge("br0");
    std::string br1 = server.add_bridge("br1");

    auto session = start_session();
    ASSERT_NE(session, nullptr);
    EXPECT_TRUE(session->is_connected());

    const auto& cache = session->cache();
    EXPECT_EQ(cache.table_size(ovsdb::kBridgeTable), 2);
    ASSERT_TRUE(cache.get_row(ovsdb::kBridgeTable, br0).has_value());
    EXPECT_EQ((*cache.get_row(ovsdb::kBridgeTable, br1))["name"], "br1");
}

TEST_F(DatabaseSessionTest, Start_MonitorsBridgePortInterface) {
    auto session = start_session();
    ASSERT_NE(session, nullptr);

    auto methods = server.methods_received();
    ASSERT_FALSE(methods.empty());
    EXPECT_EQ(methods.front(), "monitor");

    // Empty tables are known to the cache even though the snapshot omits them
    for (const auto& entry : DatabaseSession::monitored_tables()) {
        EXPECT_TRUE(session->cache().has_table(entry.first)) << entry.first;
    }
    EXPECT_EQ(DatabaseSession::monitored_tables().at(ovsdb::kBridgeTable),
              std::vector<std::string>({"name", "ports"}));
}

TEST_F(DatabaseSessionTest, Start_FailsWhenMonitorRejected) {
    server.set_fail_monitor(true);
    auto session = DatabaseSession::start(server.connect(logger), options, logger);
    ASSERT_FALSE(session.ok());
    EXPECT_EQ(session.error().kind, ErrorKind::ConnectionFailed);
    EXPECT_EQ(session.error().stage, "monitor");
}

TEST_F(DatabaseSessionTest, Start_FailsOnMalformedSnapshot) {
    server.set_malformed_snapshot(true);
    auto session = DatabaseSession::start(server.connect(logger), options, logger);
    ASSERT_FALSE(session.ok());
    EXPECT_EQ(session.error().kind, ErrorKind::ConnectionFailed);
    EXPECT_EQ(session.error().message, "malformed snapshot");
}

TEST_F(DatabaseSessionTest, Start_WithoutConnectionFails) {
    auto session = DatabaseSession::start(nullptr, options, logger);
    ASSERT_FALSE(session.ok());
    EXPECT_EQ(session.error().kind, ErrorKind::ConnectionFailed);
}

TEST_F(DatabaseSessionTest, Connect_UnreachableEndpoint) {
    SessionOptions unreachable;
    unreachable.endpoint = "unix:/nonexistent/ovsdb/db.sock";
    auto session = DatabaseSession::connect(unreachable, logger);
    ASSERT_FALSE(session.ok());
    EXPECT_EQ(session.error().kind, ErrorKind::ConnectionFailed);
}

TEST_F(DatabaseSessionTest, LaterChangesReachCache) {
    auto session = start_session();
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(session->cache().table_size(ovsdb::kBridgeTable), 0);

    std::string br2 = server.add_bridge("br2");
    ASSERT_TRUE(wait_until([&]() { return session->cache().get_row(ovsdb::kBridgeTable, br2).has_value(); }));

    server.remove_row(ovsdb::kBridgeTable, br2);
    ASSERT_TRUE(wait_until([&]() { return !session->cache().get_row(ovsdb::kBridgeTable, br2).has_value(); }));
    EXPECT_GE(session->notifier().updates_applied(), 2);
}

TEST_F(DatabaseSessionTest, Transact_ReturnsPerOperationResults) {
    server.add_bridge("br0");
    auto session = start_session();
    ASSERT_NE(session, nullptr);

    ovsdb::InsertOp insert;
    insert.table = ovsdb::kInterfaceTable;
    insert.row = {{"name", "tap0"}, {"type", "internal"}};
    ovsdb::MutateOp mutate;
    mutate.table = ovsdb::kBridgeTable;
    mutate.where.push_back({"name", "==", "nope"});
    mutate.mutations.push_back({"ports", "insert", ovsdb::make_set({})});

    auto results = session->transact({insert, mutate});
    ASSERT_TRUE(results.ok()) << results.error().to_string();
    ASSERT_EQ(results.value().size(), 2);
    EXPECT_FALSE(results.value()[0].uuid.empty());
    EXPECT_EQ(results.value()[1].count.value_or(-1), 0);

    // The update for the insert arrives before the reply
    EXPECT_EQ(session->cache().table_size(ovsdb::kInterfaceTable), 1);
}

TEST_F(DatabaseSessionTest, Transact_TimeoutIsConnectionFailed) {
    options.transact_timeout = std::chrono::milliseconds(100);
    auto session = start_session();
    ASSERT_NE(session, nullptr);
    server.set_drop_transact_replies(true);

    auto results = session->transact({});
    ASSERT_FALSE(results.ok());
    EXPECT_EQ(results.error().kind, ErrorKind::ConnectionFailed);
    EXPECT_EQ(results.error().stage, "transact");
}

TEST_F(DatabaseSessionTest, Transact_AfterServerGoneIsConnectionFailed) {
    auto session = start_session();
    ASSERT_NE(session, nullptr);
    server.close_client();
    ASSERT_TRUE(wait_until([&]() { return !session->is_connected(); }));

    auto results = session->transact({});
    ASSERT_FALSE(results.ok());
    EXPECT_EQ(results.error().kind, ErrorKind::ConnectionFailed);
}
