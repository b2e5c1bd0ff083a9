#ifndef OVSLINK_LINK_CONTROL_HPP
#define OVSLINK_LINK_CONTROL_HPP

#include <sys/types.h> // For pid_t

#include <cstdint>
#include <optional>
#include <string>

namespace ovslink {

// Single step interface manipulation. Each call either fully applies or
// returns a description of why it did not.
class LinkControl {
public:
    using Failure = std::optional<std::string>;

    virtual ~LinkControl() = default;

    virtual bool link_exists(const std::string& name) = 0;
    virtual Failure set_mtu(const std::string& name, uint32_t mtu) = 0;
    virtual Failure set_link_up(const std::string& name) = 0;
    virtual Failure set_link_down(const std::string& name) = 0;
    virtual Failure rename_link(const std::string& name, const std::string& new_name) = 0;
    virtual Failure set_mac_address(const std::string& name, const std::string& mac) = 0;
    // `cidr` is an IPv4 or IPv6 address with prefix length, e.g. 10.0.0.5/24.
    virtual Failure add_address(const std::string& name, const std::string& cidr) = 0;
    virtual Failure set_default_gateway(const std::string& gateway, const std::string& name) = 0;
    virtual Failure move_to_namespace_pid(const std::string& name, pid_t pid) = 0;
};

} // namespace ovslink

#endif // OVSLINK_LINK_CONTROL_HPP
