#ifndef OVSLINK_OVS_STRATEGY_HPP
#define OVSLINK_OVS_STRATEGY_HPP

#include "ovslink/error.hpp"
#include "ovslink/link_control.hpp"
#include "ovslink/logger.hpp"
#include "ovslink/namespace_attachment.hpp"
#include "ovslink/network_types.hpp"
#include "ovslink/port_provisioner.hpp"

#include <sys/types.h> // For pid_t

#include <optional>

namespace ovslink {

// The two entry points of OVS based container networking. create() runs on
// the host; initialize() runs inside the container's network namespace.
class OvsStrategy {
public:
    OvsStrategy(LinkControl& links, Logger& logger, AttachOptions attach_options = AttachOptions());

    // ConfigurationInvalid when the bridge or the veth prefix is missing.
    static std::optional<Error> validate_for_create(const NetworkConfig& config);

    // Provisions an internal port on config.bridge and moves it into the
    // namespace of `namespace_pid`. On success state.ovs_port names the port.
    std::optional<Error> create(PortProvisioner& provisioner, const NetworkConfig& config, pid_t namespace_pid,
                                NetworkState& state);

    std::optional<Error> initialize(const NetworkConfig& config, const NetworkState& state);

private:
    LinkControl& links_;
    Logger& logger_;
    AttachOptions attach_options_;
};

} // namespace ovslink

#endif // OVSLINK_OVS_STRATEGY_HPP
