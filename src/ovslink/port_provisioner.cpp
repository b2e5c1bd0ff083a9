#include "ovslink/port_provisioner.hpp"
#include "ovslink/network_types.hpp"
#include "ovslink/utils.hpp"

#include <stdexcept>
#include <utility>
#include <type_traits>
#include <variant>

namespace ovslink {

namespace {

constexpr const char* kInterfaceRef = "intf";
constexpr const char* kPortRef = "port";

std::string describe_operation(const ovsdb::Operation& operation) {
    return std::visit([](const auto& op) -> std::string {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, ovsdb::InsertOp>) {
            return "insert into " + op.table;
        } else {
            return "mutate " + op.table;
        }
    }, operation);
}

} // namespace

PortProvisioner::PortProvisioner(Transactor& transactor, Logger& logger)
    : transactor_(transactor), logger_(logger),
      name_generator_([](const std::string& prefix) {
          return utils::generate_random_name(prefix, kPortNameSuffixLength);
      }) {}

std::vector<ovsdb::Operation> PortProvisioner::build_operations(const std::string& port_name,
                                                                const std::string& bridge_name) {
    ovsdb::InsertOp interface_insert;
    interface_insert.table = ovsdb::kInterfaceTable;
    interface_insert.row = {{"name", port_name}, {"type", "internal"}};
    interface_insert.uuid_name = kInterfaceRef;

    ovsdb::InsertOp port_insert;
    port_insert.table = ovsdb::kPortTable;
    port_insert.row = {{"name", port_name}, {"interfaces", ovsdb::named_uuid_ref(kInterfaceRef)}};
    port_insert.uuid_name = kPortRef;

    ovsdb::MutateOp bridge_mutate;
    bridge_mutate.table = ovsdb::kBridgeTable;
    bridge_mutate.where.push_back(ovsdb::Condition{"name", "==", bridge_name});
    bridge_mutate.mutations.push_back(
        ovsdb::Mutation{"ports", "insert", ovsdb::make_set({ovsdb::named_uuid_ref(kPortRef)})});

    return {interface_insert, port_insert, bridge_mutate};
}

std::optional<Error> PortProvisioner::validate_transaction_reply(const std::vector<ovsdb::Operation>& operations,
                                                                 const std::vector<ovsdb::OperationResult>& results) {
    if (results.size() < operations.size()) {
        return Error(ErrorKind::TransactionFailed, "transact",
                     "reply has " + std::to_string(results.size()) + " results for " +
                     std::to_string(operations.size()) + " operations");
    }

    // The server appends an extra entry when the commit itself fails, so
    // errors are looked for past the last operation as well.
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (results[i].failed()) {
            std::string where = i < operations.size() ? describe_operation(operations[i]) : "commit";
            std::string details = results[i].error;
            if (!results[i].details.empty()) {
                details += ": " + results[i].details;
            }
            return Error(ErrorKind::TransactionFailed, "transact",
                         "operation " + std::to_string(i) + " (" + where + ") failed", details);
        }
    }

    for (std::size_t i = 0; i < operations.size(); ++i) {
        const auto* mutate = std::get_if<ovsdb::MutateOp>(&operations[i]);
        if (mutate == nullptr) {
            continue;
        }
        if (results[i].count.value_or(0) < 1) {
            std::string target = mutate->where.empty() ? mutate->table : mutate->where.front().value.dump();
            return Error(ErrorKind::TransactionFailed, "transact",
                         "operation " + std::to_string(i) + " (" + describe_operation(operations[i]) +
                         ") matched no rows", mutate->table + " " + target + " not found");
        }
    }
    return std::nullopt;
}

Result<std::string> PortProvisioner::create_internal_port(const std::string& name_prefix,
                                                          const std::string& bridge_name) {
    std::string port_name;
    try {
        port_name = name_generator_(name_prefix);
    } catch (const std::exception& ex) {
        return Error(ErrorKind::DeviceOperationFailed, "generate name", "cannot generate port name", ex.what());
    }

    std::vector<ovsdb::Operation> operations = build_operations(port_name, bridge_name);
    logger_.debug("PortProvisioner", "Creating internal port " + port_name + " on bridge " + bridge_name);

    auto results = transactor_.transact(operations);
    if (!results) {
        Error error = results.error();
        error.message = "create ovs port " + port_name + " on " + bridge_name + ": " + error.message;
        logger_.log_transaction(bridge_name, operations.size(), false);
        return error;
    }

    if (auto error = validate_transaction_reply(operations, results.value())) {
        error->message = "create ovs port " + port_name + " on " + bridge_name + ": " + error->message;
        logger_.log_transaction(bridge_name, operations.size(), false);
        logger_.error("PortProvisioner", error->to_string());
        return error.value();
    }

    logger_.log_transaction(bridge_name, operations.size(), true);
    logger_.info("PortProvisioner", "Created internal port " + port_name + " on bridge " + bridge_name);
    return port_name;
}

} // namespace ovslink
