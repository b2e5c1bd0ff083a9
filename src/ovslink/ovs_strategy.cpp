#include "ovslink/ovs_strategy.hpp"
#include "ovslink/namespace_finalization.hpp"

namespace ovslink {

OvsStrategy::OvsStrategy(LinkControl& links, Logger& logger, AttachOptions attach_options)
    : links_(links), logger_(logger), attach_options_(attach_options) {}

std::optional<Error> OvsStrategy::validate_for_create(const NetworkConfig& config) {
    if (config.bridge.empty()) {
        return Error(ErrorKind::ConfigurationInvalid, "create", "bridge is not specified");
    }
    if (config.veth_prefix.empty()) {
        return Error(ErrorKind::ConfigurationInvalid, "create", "veth prefix is not specified");
    }
    return std::nullopt;
}

std::optional<Error> OvsStrategy::create(PortProvisioner& provisioner, const NetworkConfig& config,
                                         pid_t namespace_pid, NetworkState& state) {
    if (auto error = validate_for_create(config)) {
        logger_.error("OvsStrategy", error->to_string());
        return error;
    }

    auto port = provisioner.create_internal_port(config.veth_prefix, config.bridge);
    if (!port) {
        return port.error();
    }

    NamespaceAttachment attachment(links_, logger_, attach_options_);
    return attachment.attach(port.value(), config.mtu, namespace_pid, state);
}

std::optional<Error> OvsStrategy::initialize(const NetworkConfig& config, const NetworkState& state) {
    NamespaceFinalization finalization(links_, logger_);
    return finalization.finalize(config, state);
}

} // namespace ovslink
