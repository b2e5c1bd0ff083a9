#ifndef OVSLINK_PORT_PROVISIONER_HPP
#define OVSLINK_PORT_PROVISIONER_HPP

#include "ovslink/database_session.hpp"
#include "ovslink/error.hpp"
#include "ovslink/logger.hpp"
#include "ovslink/ovsdb_protocol.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ovslink {

// Creates OVS internal ports and links them into an existing bridge with a
// single transaction:
//
//   insert Interface {name, type: "internal"}      as "intf"
//   insert Port      {name, interfaces: intf}      as "port"
//   mutate Bridge where name == bridge: ports insert {port}
//
// The new rows only refer to each other by uuid-name, so either all three
// operations commit or none does.
class PortProvisioner {
public:
    using NameGenerator = std::function<std::string(const std::string& prefix)>;

    PortProvisioner(Transactor& transactor, Logger& logger);

    // Returns the new port name (prefix plus 7 random hex characters).
    // TransactionFailed if the server reports any per-operation error or the
    // bridge mutation touched no row; ConnectionFailed if no reply arrived.
    // Name collisions are left to the server to reject. Nothing is retried.
    Result<std::string> create_internal_port(const std::string& name_prefix, const std::string& bridge_name);

    // Replaces the random name source, mainly for tests.
    void set_name_generator(NameGenerator generator) { name_generator_ = std::move(generator); }

    static std::vector<ovsdb::Operation> build_operations(const std::string& port_name, const std::string& bridge_name);

    // Checks a transact reply against the operations that produced it.
    static std::optional<Error> validate_transaction_reply(const std::vector<ovsdb::Operation>& operations,
                                                           const std::vector<ovsdb::OperationResult>& results);

private:
    Transactor& transactor_;
    Logger& logger_;
    NameGenerator name_generator_;
};

} // namespace ovslink

#endif // OVSLINK_PORT_PROVISIONER_HPP
