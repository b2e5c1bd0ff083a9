#ifndef OVSLINK_NETNS_HPP
#define OVSLINK_NETNS_HPP

#include "ovslink/error.hpp"

#include <sys/types.h> // For pid_t

#include <optional>
#include <string>

namespace ovslink {

// Path of the network namespace handle of `pid` under /proc.
std::string network_namespace_path(pid_t pid);

// Moves the calling thread into the network namespace of `pid` via setns(2).
// Requires CAP_SYS_ADMIN. Failure is DeviceOperationFailed.
std::optional<Error> enter_network_namespace(pid_t pid);

} // namespace ovslink

#endif // OVSLINK_NETNS_HPP
