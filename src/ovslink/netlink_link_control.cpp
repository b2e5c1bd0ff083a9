#include "ovslink/netlink_link_control.hpp"

#include <netlink/netlink.h>
#include <netlink/errno.h>
#include <netlink/addr.h>
#include <netlink/route/link.h>
#include <netlink/route/addr.h>
#include <netlink/route/route.h>
#include <netlink/route/nexthop.h>

#include <linux/if.h>        // For IFF_UP
#include <linux/rtnetlink.h> // For RT_TABLE_MAIN, RTPROT_BOOT, RT_SCOPE_UNIVERSE

#include <memory>
#include <utility>

namespace ovslink {

namespace {

struct LinkDeleter { void operator()(struct rtnl_link* link) const { rtnl_link_put(link); } };
struct NlAddrDeleter { void operator()(struct nl_addr* addr) const { nl_addr_put(addr); } };
struct RtnlAddrDeleter { void operator()(struct rtnl_addr* addr) const { rtnl_addr_put(addr); } };
struct RouteDeleter { void operator()(struct rtnl_route* route) const { rtnl_route_put(route); } };

using LinkPtr = std::unique_ptr<struct rtnl_link, LinkDeleter>;
using NlAddrPtr = std::unique_ptr<struct nl_addr, NlAddrDeleter>;
using RtnlAddrPtr = std::unique_ptr<struct rtnl_addr, RtnlAddrDeleter>;
using RoutePtr = std::unique_ptr<struct rtnl_route, RouteDeleter>;

std::string nl_error(int err) {
    return nl_geterror(err);
}

LinkControl::Failure parse_address(const std::string& text, int family, NlAddrPtr& out) {
    struct nl_addr* addr = nullptr;
    int err = nl_addr_parse(text.c_str(), family, &addr);
    if (err < 0) {
        return "invalid address " + text + ": " + nl_error(err);
    }
    out.reset(addr);
    return std::nullopt;
}

} // namespace

Result<std::unique_ptr<NetlinkLinkControl>> NetlinkLinkControl::open(Logger& logger) {
    struct nl_sock* sock = nl_socket_alloc();
    if (sock == nullptr) {
        return Error(ErrorKind::DeviceOperationFailed, "netlink", "cannot allocate netlink socket");
    }
    int err = nl_connect(sock, NETLINK_ROUTE);
    if (err < 0) {
        nl_socket_free(sock);
        return Error(ErrorKind::DeviceOperationFailed, "netlink", "cannot connect rtnetlink socket", nl_error(err));
    }
    // Private constructor, so make_unique cannot be used.
    return Result<std::unique_ptr<NetlinkLinkControl>>(
        std::unique_ptr<NetlinkLinkControl>(new NetlinkLinkControl(sock, logger)));
}

NetlinkLinkControl::NetlinkLinkControl(struct nl_sock* sock, Logger& logger)
    : sock_(sock), logger_(logger) {}

NetlinkLinkControl::~NetlinkLinkControl() {
    nl_close(sock_);
    nl_socket_free(sock_);
}

bool NetlinkLinkControl::link_exists(const std::string& name) {
    std::lock_guard<std::mutex> lock(sock_mutex_);
    struct rtnl_link* link = nullptr;
    int err = rtnl_link_get_kernel(sock_, 0, name.c_str(), &link);
    LinkPtr holder(link);
    return err >= 0 && link != nullptr;
}

LinkControl::Failure NetlinkLinkControl::lookup_ifindex(const std::string& name, int& ifindex) {
    struct rtnl_link* link = nullptr;
    int err = rtnl_link_get_kernel(sock_, 0, name.c_str(), &link);
    LinkPtr holder(link);
    if (err < 0 || link == nullptr) {
        return "no such device " + name + ": " + nl_error(err);
    }
    ifindex = rtnl_link_get_ifindex(link);
    return std::nullopt;
}

LinkControl::Failure NetlinkLinkControl::change_link(const std::string& name,
                                                     const std::function<Failure(struct rtnl_link* change)>& fill) {
    std::lock_guard<std::mutex> lock(sock_mutex_);
    struct rtnl_link* orig = nullptr;
    int err = rtnl_link_get_kernel(sock_, 0, name.c_str(), &orig);
    LinkPtr orig_holder(orig);
    if (err < 0 || orig == nullptr) {
        return "no such device " + name + ": " + nl_error(err);
    }

    LinkPtr change(rtnl_link_alloc());
    if (!change) {
        return std::string("out of memory");
    }
    if (auto failure = fill(change.get())) {
        return failure;
    }

    err = rtnl_link_change(sock_, orig, change.get(), 0);
    if (err < 0) {
        return nl_error(err);
    }
    return std::nullopt;
}

LinkControl::Failure NetlinkLinkControl::set_mtu(const std::string& name, uint32_t mtu) {
    logger_.log_device_step(name, "set mtu", std::to_string(mtu));
    return change_link(name, [mtu](struct rtnl_link* change) -> Failure {
        rtnl_link_set_mtu(change, mtu);
        return std::nullopt;
    });
}

LinkControl::Failure NetlinkLinkControl::set_link_up(const std::string& name) {
    logger_.log_device_step(name, "up", "");
    return change_link(name, [](struct rtnl_link* change) -> Failure {
        rtnl_link_set_flags(change, IFF_UP);
        return std::nullopt;
    });
}

LinkControl::Failure NetlinkLinkControl::set_link_down(const std::string& name) {
    logger_.log_device_step(name, "down", "");
    return change_link(name, [](struct rtnl_link* change) -> Failure {
        rtnl_link_unset_flags(change, IFF_UP);
        return std::nullopt;
    });
}

LinkControl::Failure NetlinkLinkControl::rename_link(const std::string& name, const std::string& new_name) {
    logger_.log_device_step(name, "rename", new_name);
    if (new_name.empty() || new_name.size() >= IFNAMSIZ) {
        return "invalid interface name " + new_name;
    }
    return change_link(name, [&new_name](struct rtnl_link* change) -> Failure {
        rtnl_link_set_name(change, new_name.c_str());
        return std::nullopt;
    });
}

LinkControl::Failure NetlinkLinkControl::set_mac_address(const std::string& name, const std::string& mac) {
    logger_.log_device_step(name, "set mac", mac);
    NlAddrPtr addr;
    if (auto failure = parse_address(mac, AF_LLC, addr)) {
        return failure;
    }
    return change_link(name, [&addr](struct rtnl_link* change) -> Failure {
        rtnl_link_set_addr(change, addr.get());
        return std::nullopt;
    });
}

LinkControl::Failure NetlinkLinkControl::add_address(const std::string& name, const std::string& cidr) {
    logger_.log_device_step(name, "add address", cidr);
    NlAddrPtr local;
    if (auto failure = parse_address(cidr, AF_UNSPEC, local)) {
        return failure;
    }

    std::lock_guard<std::mutex> lock(sock_mutex_);
    int ifindex = 0;
    if (auto failure = lookup_ifindex(name, ifindex)) {
        return failure;
    }

    RtnlAddrPtr addr(rtnl_addr_alloc());
    if (!addr) {
        return std::string("out of memory");
    }
    rtnl_addr_set_ifindex(addr.get(), ifindex);
    int err = rtnl_addr_set_local(addr.get(), local.get());
    if (err < 0) {
        return nl_error(err);
    }
    err = rtnl_addr_add(sock_, addr.get(), 0);
    if (err < 0) {
        return nl_error(err);
    }
    return std::nullopt;
}

LinkControl::Failure NetlinkLinkControl::set_default_gateway(const std::string& gateway, const std::string& name) {
    logger_.log_device_step(name, "default gateway", gateway);
    NlAddrPtr gw;
    if (auto failure = parse_address(gateway, AF_UNSPEC, gw)) {
        return failure;
    }
    int family = nl_addr_get_family(gw.get());
    NlAddrPtr dst;
    if (auto failure = parse_address("default", family, dst)) {
        return failure;
    }

    std::lock_guard<std::mutex> lock(sock_mutex_);
    int ifindex = 0;
    if (auto failure = lookup_ifindex(name, ifindex)) {
        return failure;
    }

    RoutePtr route(rtnl_route_alloc());
    if (!route) {
        return std::string("out of memory");
    }
    rtnl_route_set_family(route.get(), static_cast<uint8_t>(family));
    rtnl_route_set_table(route.get(), RT_TABLE_MAIN);
    rtnl_route_set_protocol(route.get(), RTPROT_BOOT);
    rtnl_route_set_scope(route.get(), RT_SCOPE_UNIVERSE);
    int err = rtnl_route_set_dst(route.get(), dst.get());
    if (err < 0) {
        return nl_error(err);
    }

    // Ownership of the nexthop passes to the route
    struct rtnl_nexthop* nexthop = rtnl_route_nh_alloc();
    if (nexthop == nullptr) {
        return std::string("out of memory");
    }
    rtnl_route_nh_set_ifindex(nexthop, ifindex);
    rtnl_route_nh_set_gateway(nexthop, gw.get());
    rtnl_route_add_nexthop(route.get(), nexthop);

    err = rtnl_route_add(sock_, route.get(), NLM_F_EXCL);
    if (err < 0) {
        return nl_error(err);
    }
    return std::nullopt;
}

LinkControl::Failure NetlinkLinkControl::move_to_namespace_pid(const std::string& name, pid_t pid) {
    logger_.log_device_step(name, "move to netns of pid", std::to_string(pid));
    return change_link(name, [pid](struct rtnl_link* change) -> Failure {
        rtnl_link_set_ns_pid(change, pid);
        return std::nullopt;
    });
}

} // namespace ovslink
