#ifndef OVSLINK_NETLINK_LINK_CONTROL_HPP
#define OVSLINK_NETLINK_LINK_CONTROL_HPP

#include "ovslink/error.hpp"
#include "ovslink/link_control.hpp"
#include "ovslink/logger.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>

struct nl_sock;
struct rtnl_link;

namespace ovslink {

// LinkControl over an rtnetlink socket (libnl-route-3). Acts on the network
// namespace the calling thread is in when the object is created.
class NetlinkLinkControl : public LinkControl {
public:
    static Result<std::unique_ptr<NetlinkLinkControl>> open(Logger& logger);
    ~NetlinkLinkControl() override;

    NetlinkLinkControl(const NetlinkLinkControl&) = delete;
    NetlinkLinkControl& operator=(const NetlinkLinkControl&) = delete;

    bool link_exists(const std::string& name) override;
    Failure set_mtu(const std::string& name, uint32_t mtu) override;
    Failure set_link_up(const std::string& name) override;
    Failure set_link_down(const std::string& name) override;
    Failure rename_link(const std::string& name, const std::string& new_name) override;
    Failure set_mac_address(const std::string& name, const std::string& mac) override;
    Failure add_address(const std::string& name, const std::string& cidr) override;
    Failure set_default_gateway(const std::string& gateway, const std::string& name) override;
    Failure move_to_namespace_pid(const std::string& name, pid_t pid) override;

private:
    NetlinkLinkControl(struct nl_sock* sock, Logger& logger);

    // Looks up `name`, lets `fill` describe the change, and applies it.
    Failure change_link(const std::string& name, const std::function<Failure(struct rtnl_link* change)>& fill);
    Failure lookup_ifindex(const std::string& name, int& ifindex);

    struct nl_sock* sock_;
    Logger& logger_;
    std::mutex sock_mutex_;
};

} // namespace ovslink

#endif // OVSLINK_NETLINK_LINK_CONTROL_HPP
