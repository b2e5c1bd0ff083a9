#include "gtest/gtest.h"
#include "ovslink/namespace_attachment.hpp"
#include "fake_ovsdb_server.hpp" // For RecordingLogger
#include "recording_link_control.hpp"

#include <chrono>
#include <string>
#include <vector>

using ovslink::AttachOptions;
using ovslink::ErrorKind;
using ovslink::NamespaceAttachment;
using ovslink::NetworkState;
using ovslink::testing::RecordingLinkControl;
using ovslink::testing::RecordingLogger;

class NamespaceAttachmentTest : public ::testing::Test {
protected:
    RecordingLogger logger;
    RecordingLinkControl links;
    AttachOptions options;
    NetworkState state;

    void SetUp() override {
        options.ready_attempts = 5;
        options.ready_interval = std::chrono::milliseconds(1);
    }
};

// --- Test Cases ---

TEST_F(NamespaceAttachmentTest, Attach_StepOrder) {
    links.add_link("veth1234567");
    NamespaceAttachment attachment(links, logger, options);

    auto error = attachment.attach("veth1234567", 1450, 4242, state);
    ASSERT_FALSE(error.has_value()) << error->to_string();

    std::vector<std::string> expected = {
        "set_mtu veth1234567 1450",
        "set_link_up veth1234567",
        "move_to_namespace_pid veth1234567 4242",
    };
    EXPECT_EQ(links.calls(), expected);
    EXPECT_EQ(state.ovs_port, "veth1234567");
}

TEST_F(NamespaceAttachmentTest, Attach_WaitsForDevice) {
    links.add_link("veth1234567", 3);
    NamespaceAttachment attachment(links, logger, options);

    EXPECT_FALSE(attachment.attach("veth1234567", 1500, 1, state).has_value());
    EXPECT_EQ(links.existence_checks(), 4);
    EXPECT_EQ(state.ovs_port, "veth1234567");
}

TEST_F(NamespaceAttachmentTest, Attach_DeviceNeverAppears) {
    NamespaceAttachment attachment(links, logger, options);

    auto error = attachment.attach("veth1234567", 1500, 1, state);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::DeviceOperationFailed);
    EXPECT_EQ(error->stage, "wait for device");
    EXPECT_EQ(links.existence_checks(), 5);
    EXPECT_TRUE(links.calls().empty());
    EXPECT_TRUE(state.ovs_port.empty());
}

TEST_F(NamespaceAttachmentTest, Attach_MtuFailureStopsEarly) {
    links.add_link("veth1234567");
    links.fail_step("set_mtu", "Invalid argument");
    NamespaceAttachment attachment(links, logger, options);

    auto error = attachment.attach("veth1234567", 99999, 1, state);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::DeviceOperationFailed);
    EXPECT_EQ(error->stage, "set mtu");
    EXPECT_EQ(error->message, "set mtu 99999 on veth1234567 failed");
    EXPECT_EQ(error->details, "Invalid argument");
    EXPECT_EQ(links.calls().size(), 1);
    EXPECT_TRUE(state.ovs_port.empty());
}

TEST_F(NamespaceAttachmentTest, Attach_NamespaceMoveFailure) {
    links.add_link("veth1234567");
    links.fail_step("move_to_namespace_pid", "No such process");
    NamespaceAttachment attachment(links, logger, options);

    auto error = attachment.attach("veth1234567", 1500, 777, state);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->stage, "move to namespace");
    EXPECT_NE(error->message.find("777"), std::string::npos);
    EXPECT_TRUE(state.ovs_port.empty());
}
