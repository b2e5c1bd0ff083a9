#ifndef OVSLINK_NAMESPACE_FINALIZATION_HPP
#define OVSLINK_NAMESPACE_FINALIZATION_HPP

#include "ovslink/error.hpp"
#include "ovslink/link_control.hpp"
#include "ovslink/logger.hpp"
#include "ovslink/network_types.hpp"

#include <optional>

namespace ovslink {

// Namespace side half of the hand-off. Must run with the calling thread
// inside the target network namespace.
class NamespaceFinalization {
public:
    NamespaceFinalization(LinkControl& links, Logger& logger);

    // Renames state.ovs_port to eth0 and applies the addressing in `config`:
    //
    //   down, rename to eth0, [mac], address, [ipv6 address], mtu, up,
    //   [default route], [ipv6 default route]
    //
    // Bracketed steps run only when configured. Stops at the first failure.
    std::optional<Error> finalize(const NetworkConfig& config, const NetworkState& state);

private:
    LinkControl& links_;
    Logger& logger_;
};

} // namespace ovslink

#endif // OVSLINK_NAMESPACE_FINALIZATION_HPP
