#include "ovslink/namespace_finalization.hpp"

#include <functional>
#include <string>
#include <vector>

namespace ovslink {

namespace {

struct Step {
    std::string name;
    std::string device;
    std::string value;
    std::function<LinkControl::Failure()> run;
};

} // namespace

NamespaceFinalization::NamespaceFinalization(LinkControl& links, Logger& logger)
    : links_(links), logger_(logger) {}

std::optional<Error> NamespaceFinalization::finalize(const NetworkConfig& config, const NetworkState& state) {
    if (state.ovs_port.empty()) {
        Error error(ErrorKind::ConfigurationInvalid, "finalize", "network state does not name an ovs port");
        logger_.error("NamespaceFinalization", error.to_string());
        return error;
    }
    if (config.address.empty()) {
        Error error(ErrorKind::ConfigurationInvalid, "finalize", "address is not specified");
        logger_.error("NamespaceFinalization", error.to_string());
        return error;
    }

    const std::string prior = state.ovs_port;
    const std::string device = kDefaultDevice;

    std::vector<Step> steps;
    steps.push_back({"link down", prior, "", [&] { return links_.set_link_down(prior); }});
    steps.push_back({"rename", prior, device, [&] { return links_.rename_link(prior, device); }});
    if (!config.mac_address.empty()) {
        steps.push_back({"set mac", device, config.mac_address,
                         [&] { return links_.set_mac_address(device, config.mac_address); }});
    }
    steps.push_back({"add address", device, config.address,
                     [&] { return links_.add_address(device, config.address); }});
    if (!config.ipv6_address.empty()) {
        steps.push_back({"add ipv6 address", device, config.ipv6_address,
                         [&] { return links_.add_address(device, config.ipv6_address); }});
    }
    steps.push_back({"set mtu", device, std::to_string(config.mtu),
                     [&] { return links_.set_mtu(device, config.mtu); }});
    steps.push_back({"link up", device, "", [&] { return links_.set_link_up(device); }});
    if (!config.gateway.empty()) {
        steps.push_back({"default route", device, config.gateway,
                         [&] { return links_.set_default_gateway(config.gateway, device); }});
    }
    if (!config.ipv6_gateway.empty()) {
        steps.push_back({"ipv6 default route", device, config.ipv6_gateway,
                         [&] { return links_.set_default_gateway(config.ipv6_gateway, device); }});
    }

    for (const auto& step : steps) {
        if (auto failure = step.run()) {
            std::string what = step.value.empty() ? step.name : step.name + " " + step.value;
            Error error(ErrorKind::DeviceOperationFailed, step.name,
                        what + " on " + step.device + " failed", *failure);
            logger_.error("NamespaceFinalization", error.to_string());
            return error;
        }
    }

    logger_.info("NamespaceFinalization", "Configured " + device + " (was " + prior + ") with " + config.address);
    return std::nullopt;
}

} // namespace ovslink
