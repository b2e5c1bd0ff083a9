#include "ovslink/namespace_attachment.hpp"

#include <thread>

namespace ovslink {

NamespaceAttachment::NamespaceAttachment(LinkControl& links, Logger& logger, AttachOptions options)
    : links_(links), logger_(logger), options_(options) {}

bool NamespaceAttachment::wait_for_link(const std::string& port_name) {
    for (uint32_t attempt = 0; attempt < options_.ready_attempts; ++attempt) {
        if (links_.link_exists(port_name)) {
            return true;
        }
        if (attempt + 1 < options_.ready_attempts) {
            std::this_thread::sleep_for(options_.ready_interval);
        }
    }
    return false;
}

std::optional<Error> NamespaceAttachment::attach(const std::string& port_name, uint32_t mtu, pid_t namespace_pid,
                                                 NetworkState& state) {
    auto fail = [&](const std::string& step, const std::string& value, const std::string& reason) {
        std::string what = value.empty() ? step : step + " " + value;
        Error error(ErrorKind::DeviceOperationFailed, step, what + " on " + port_name + " failed", reason);
        logger_.error("NamespaceAttachment", error.to_string());
        return error;
    };

    if (!wait_for_link(port_name)) {
        return fail("wait for device", port_name,
                    "not visible after " + std::to_string(options_.ready_attempts) + " attempts");
    }

    if (auto failure = links_.set_mtu(port_name, mtu)) {
        return fail("set mtu", std::to_string(mtu), *failure);
    }
    if (auto failure = links_.set_link_up(port_name)) {
        return fail("link up", "", *failure);
    }
    if (auto failure = links_.move_to_namespace_pid(port_name, namespace_pid)) {
        return fail("move to namespace", "of pid " + std::to_string(namespace_pid), *failure);
    }

    state.ovs_port = port_name;
    logger_.info("NamespaceAttachment",
                 "Moved " + port_name + " into the namespace of pid " + std::to_string(namespace_pid));
    return std::nullopt;
}

} // namespace ovslink
