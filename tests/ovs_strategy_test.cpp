#include "gtest/gtest.h"
#include "ovslink/ovs_strategy.hpp"
#include "fake_ovsdb_server.hpp"
#include "recording_link_control.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using ovslink::DatabaseSession;
using ovslink::ErrorKind;
using ovslink::NetworkConfig;
using ovslink::NetworkState;
using ovslink::OvsStrategy;
using ovslink::PortProvisioner;
using ovslink::testing::FakeOvsdbServer;
using ovslink::testing::RecordingLinkControl;
using ovslink::testing::RecordingLogger;
namespace ovsdb = ovslink::ovsdb;

class OvsStrategyTest : public ::testing::Test {
protected:
    RecordingLogger logger;
    FakeOvsdbServer server;
    RecordingLinkControl links;
    std::unique_ptr<DatabaseSession> session;
    NetworkConfig config;
    NetworkState state;

    void SetUp() override {
        server.add_bridge("br0");
        ovslink::SessionOptions options;
        options.endpoint = "socketpair";
        auto started = DatabaseSession::start(server.connect(logger), options, logger);
        ASSERT_TRUE(started.ok()) << started.error().to_string();
        session = std::move(started.value());

        config.bridge = "br0";
        config.veth_prefix = "veth";
        config.mtu = 1450;
        config.address = "10.1.0.2/16";
        config.gateway = "10.1.0.1";
    }

    ovslink::AttachOptions fast_attach() const {
        ovslink::AttachOptions options;
        options.ready_attempts = 3;
        options.ready_interval = std::chrono::milliseconds(1);
        return options;
    }
};

// --- Test Cases ---

TEST_F(OvsStrategyTest, ValidateForCreate) {
    EXPECT_FALSE(OvsStrategy::validate_for_create(config).has_value());

    NetworkConfig no_bridge = config;
    no_bridge.bridge.clear();
    auto error = OvsStrategy::validate_for_create(no_bridge);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::ConfigurationInvalid);
    EXPECT_EQ(error->message, "bridge is not specified");

    NetworkConfig no_prefix = config;
    no_prefix.veth_prefix.clear();
    error = OvsStrategy::validate_for_create(no_prefix);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->message, "veth prefix is not specified");
}

TEST_F(OvsStrategyTest, Create_ProvisionsAndAttaches) {
    PortProvisioner provisioner(*session, logger);
    provisioner.set_name_generator([](const std::string& prefix) { return prefix + "feed001"; });
    links.add_link("vethfeed001");
    OvsStrategy strategy(links, logger, fast_attach());

    auto error = strategy.create(provisioner, config, 3131, state);
    ASSERT_FALSE(error.has_value()) << error->to_string();
    EXPECT_EQ(state.ovs_port, "vethfeed001");
    EXPECT_TRUE(session->cache().find_row(ovsdb::kPortTable, "name", "vethfeed001").has_value());
    EXPECT_EQ(links.calls().back(), "move_to_namespace_pid vethfeed001 3131");
}

TEST_F(OvsStrategyTest, Create_InvalidConfigTouchesNothing) {
    config.bridge.clear();
    PortProvisioner provisioner(*session, logger);
    OvsStrategy strategy(links, logger, fast_attach());

    auto error = strategy.create(provisioner, config, 1, state);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::ConfigurationInvalid);
    EXPECT_EQ(server.transactions_committed(), 0);
    EXPECT_TRUE(links.calls().empty());
}

TEST_F(OvsStrategyTest, Create_ProvisionFailureSkipsAttachment) {
    config.bridge = "br-other";
    PortProvisioner provisioner(*session, logger);
    OvsStrategy strategy(links, logger, fast_attach());

    auto error = strategy.create(provisioner, config, 1, state);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::TransactionFailed);
    EXPECT_EQ(links.existence_checks(), 0);
    EXPECT_TRUE(state.ovs_port.empty());
}

TEST_F(OvsStrategyTest, Initialize_RunsFinalization) {
    state.ovs_port = "vethfeed001";
    OvsStrategy strategy(links, logger, fast_attach());

    ASSERT_FALSE(strategy.initialize(config, state).has_value());
    std::vector<std::string> expected = {
        "set_link_down vethfeed001",
        "rename_link vethfeed001 eth0",
        "add_address eth0 10.1.0.2/16",
        "set_mtu eth0 1450",
        "set_link_up eth0",
        "set_default_gateway 10.1.0.1 eth0",
    };
    EXPECT_EQ(links.calls(), expected);
}
