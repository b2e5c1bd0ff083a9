#include "ovslink/command_dispatcher.hpp"
#include "ovslink/config_manager.hpp"
#include "ovslink/database_session.hpp"
#include "ovslink/logger.hpp"
#include "ovslink/netlink_link_control.hpp"
#include "ovslink/netns.hpp"
#include "ovslink/network_types.hpp"
#include "ovslink/ovs_strategy.hpp"
#include "ovslink/port_provisioner.hpp"
#include "ovslink/utils.hpp"

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

ovslink::Logger g_logger(ovslink::LogLevel::INFO);

// Loads and validates `path`. Problems are printed and false is returned.
bool load_configuration(const std::string& path, ovslink::ConfigManager& config, std::ostream& out) {
    config.set_logger(&g_logger);
    if (!config.load_config(path)) {
        out << "Error: cannot read configuration " << path << std::endl;
        return false;
    }
    std::vector<std::string> problems = config.validate_config(config.get_current_config_data());
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            out << "Error: " << path << ": " << problem << std::endl;
        }
        return false;
    }
    g_logger.set_min_log_level(config.to_runtime_options().log_level);
    return true;
}

std::optional<pid_t> parse_pid(const std::string& text) {
    auto value = ovslink::utils::safe_stoi(text);
    if (!value || value.value() <= 0) {
        return std::nullopt;
    }
    return static_cast<pid_t>(value.value());
}

int report(const ovslink::Error& error, std::ostream& out) {
    out << "Error: " << error.to_string() << std::endl;
    return ovslink::kExitFailure;
}

ovslink::SessionOptions session_options(const ovslink::RuntimeOptions& runtime) {
    ovslink::SessionOptions options;
    options.endpoint = runtime.ovsdb_endpoint;
    options.transact_timeout = std::chrono::milliseconds(runtime.transact_timeout_ms);
    return options;
}

ovslink::AttachOptions attach_options(const ovslink::RuntimeOptions& runtime) {
    ovslink::AttachOptions options;
    options.ready_attempts = runtime.link_ready_attempts;
    options.ready_interval = std::chrono::milliseconds(runtime.link_ready_interval_ms);
    return options;
}

int cmd_create(const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() != 3) {
        out << "Usage: create <config-file> <pid> <state-file>" << std::endl;
        return ovslink::kExitUsage;
    }
    ovslink::ConfigManager config;
    if (!load_configuration(args[0], config, out)) {
        return ovslink::kExitFailure;
    }
    auto pid = parse_pid(args[1]);
    if (!pid) {
        out << "Error: invalid pid " << args[1] << std::endl;
        return ovslink::kExitUsage;
    }

    ovslink::NetworkConfig network = config.to_network_config();
    ovslink::RuntimeOptions runtime = config.to_runtime_options();
    if (auto error = ovslink::OvsStrategy::validate_for_create(network)) {
        return report(error.value(), out);
    }

    auto links = ovslink::NetlinkLinkControl::open(g_logger);
    if (!links) {
        return report(links.error(), out);
    }
    auto session = ovslink::DatabaseSession::connect(session_options(runtime), g_logger);
    if (!session) {
        return report(session.error(), out);
    }

    ovslink::PortProvisioner provisioner(*session.value(), g_logger);
    ovslink::OvsStrategy strategy(*links.value(), g_logger, attach_options(runtime));
    ovslink::NetworkState state;
    if (auto error = strategy.create(provisioner, network, pid.value(), state)) {
        return report(error.value(), out);
    }

    if (!state.save(args[2])) {
        out << "Error: cannot write state file " << args[2] << std::endl;
        return ovslink::kExitFailure;
    }
    out << state.ovs_port << std::endl;
    return ovslink::kExitOk;
}

int cmd_initialize(const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() != 2 && !(args.size() == 4 && args[2] == "--netns-pid")) {
        out << "Usage: initialize <config-file> <state-file> [--netns-pid <pid>]" << std::endl;
        return ovslink::kExitUsage;
    }
    ovslink::ConfigManager config;
    if (!load_configuration(args[0], config, out)) {
        return ovslink::kExitFailure;
    }
    auto state = ovslink::NetworkState::load(args[1]);
    if (!state) {
        out << "Error: cannot read state file " << args[1] << std::endl;
        return ovslink::kExitFailure;
    }

    // The netlink socket binds to the namespace current at open time.
    if (args.size() == 4) {
        auto pid = parse_pid(args[3]);
        if (!pid) {
            out << "Error: invalid pid " << args[3] << std::endl;
            return ovslink::kExitUsage;
        }
        if (auto error = ovslink::enter_network_namespace(pid.value())) {
            return report(error.value(), out);
        }
    }

    auto links = ovslink::NetlinkLinkControl::open(g_logger);
    if (!links) {
        return report(links.error(), out);
    }
    ovslink::OvsStrategy strategy(*links.value(), g_logger, attach_options(config.to_runtime_options()));
    if (auto error = strategy.initialize(config.to_network_config(), state.value())) {
        return report(error.value(), out);
    }
    return ovslink::kExitOk;
}

int cmd_show(const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() != 1) {
        out << "Usage: show <config-file>" << std::endl;
        return ovslink::kExitUsage;
    }
    ovslink::ConfigManager config;
    config.set_logger(&g_logger);
    if (!config.load_config(args[0])) {
        out << "Error: cannot read configuration " << args[0] << std::endl;
        return ovslink::kExitFailure;
    }
    auto session = ovslink::DatabaseSession::connect(session_options(config.to_runtime_options()), g_logger);
    if (!session) {
        return report(session.error(), out);
    }

    const ovslink::TableCache& cache = session.value()->cache();
    ovslink::RowMap ports = cache.get_table(ovslink::ovsdb::kPortTable);
    for (const auto& [bridge_uuid, bridge] : cache.get_table(ovslink::ovsdb::kBridgeTable)) {
        out << "Bridge " << bridge.value("name", std::string("?")) << " (" << bridge_uuid << ")" << std::endl;
        if (!bridge.contains("ports")) {
            continue;
        }
        for (const auto& port_uuid : ovslink::ovsdb::uuids_in(bridge["ports"])) {
            auto it = ports.find(port_uuid);
            std::string name = it != ports.end() ? it->second.value("name", std::string("?")) : "?";
            out << "    Port " << name << " (" << port_uuid << ")" << std::endl;
        }
    }
    return ovslink::kExitOk;
}

int cmd_validate(const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() != 1) {
        out << "Usage: validate <config-file>" << std::endl;
        return ovslink::kExitUsage;
    }
    ovslink::ConfigManager config;
    if (!load_configuration(args[0], config, out)) {
        return ovslink::kExitFailure;
    }
    out << args[0] << ": OK" << std::endl;
    return ovslink::kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    ovslink::CommandDispatcher dispatcher;
    dispatcher.register_command({"create"}, "<config-file> <pid> <state-file>", cmd_create);
    dispatcher.register_command({"initialize"}, "<config-file> <state-file> [--netns-pid <pid>]", cmd_initialize);
    dispatcher.register_command({"show"}, "<config-file>", cmd_show);
    dispatcher.register_command({"validate"}, "<config-file>", cmd_validate);
    dispatcher.register_command({"help"}, "", [&dispatcher](const std::vector<std::string>&, std::ostream& out) {
        dispatcher.print_help(out);
        return ovslink::kExitOk;
    });

    std::vector<std::string> input(argv + 1, argv + argc);
    return dispatcher.dispatch(input, std::cout);
}
