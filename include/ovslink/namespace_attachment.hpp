#ifndef OVSLINK_NAMESPACE_ATTACHMENT_HPP
#define OVSLINK_NAMESPACE_ATTACHMENT_HPP

#include "ovslink/error.hpp"
#include "ovslink/link_control.hpp"
#include "ovslink/logger.hpp"
#include "ovslink/network_types.hpp"

#include <sys/types.h> // For pid_t

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace ovslink {

struct AttachOptions {
    uint32_t ready_attempts = 50;
    std::chrono::milliseconds ready_interval{20};
};

// Host side half of the hand-off: waits for the kernel device behind a new
// internal port, configures it and moves it into the target namespace.
class NamespaceAttachment {
public:
    NamespaceAttachment(LinkControl& links, Logger& logger, AttachOptions options = AttachOptions());

    // Steps: wait for the device, set MTU, bring it up, move it into the
    // namespace of `namespace_pid`. The first failing step is returned as
    // DeviceOperationFailed. `state.ovs_port` is set only on success.
    std::optional<Error> attach(const std::string& port_name, uint32_t mtu, pid_t namespace_pid,
                                NetworkState& state);

private:
    bool wait_for_link(const std::string& port_name);

    LinkControl& links_;
    Logger& logger_;
    AttachOptions options_;
};

} // namespace ovslink

#endif // OVSLINK_NAMESPACE_ATTACHMENT_HPP
