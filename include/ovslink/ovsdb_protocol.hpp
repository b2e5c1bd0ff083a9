#ifndef OVSLINK_OVSDB_PROTOCOL_HPP
#define OVSLINK_OVSDB_PROTOCOL_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ovslink {
namespace ovsdb {

using Json = nlohmann::json;

constexpr const char* kDatabaseName = "Open_vSwitch";

constexpr const char* kBridgeTable = "Bridge";
constexpr const char* kPortTable = "Port";
constexpr const char* kInterfaceTable = "Interface";

// Condition on a column, e.g. {"name", "==", "br0"}.
struct Condition {
    std::string column;
    std::string function;
    Json value;
};

// Mutation of a column, e.g. {"ports", "insert", ["set", [...]]}.
struct Mutation {
    std::string column;
    std::string mutator;
    Json value;
};

struct InsertOp {
    std::string table;
    Json row;
    std::string uuid_name; // Lets later operations in the same transaction refer to the new row
};

struct MutateOp {
    std::string table;
    std::vector<Condition> where;
    std::vector<Mutation> mutations;
};

using Operation = std::variant<InsertOp, MutateOp>;

// One entry of a transact reply. Inserts fill `uuid`, mutates fill `count`.
// A non-empty `error` means the operation (and so the transaction) failed.
struct OperationResult {
    std::string uuid;
    std::optional<int64_t> count;
    std::string error;
    std::string details;

    bool failed() const { return !error.empty(); }
};

// Delta for a single row. An absent or empty `new_row` removes the row.
struct RowUpdate {
    std::optional<Json> old_row;
    std::optional<Json> new_row;
};

using TableUpdate = std::map<std::string, RowUpdate>;   // row uuid -> delta
using TableUpdates = std::map<std::string, TableUpdate>; // table name -> rows

// Column selection for a monitor request.
using MonitorTables = std::map<std::string, std::vector<std::string>>;

// OVSDB atoms and sets
Json uuid_ref(const std::string& uuid);
Json named_uuid_ref(const std::string& uuid_name);
Json make_set(const std::vector<Json>& elements);

// Returns every uuid held by a column value, in either the atomic
// ["uuid", u] form or the ["set", [...]] form.
std::vector<std::string> uuids_in(const Json& value);
bool set_contains_uuid(const Json& value, const std::string& uuid);

Json condition_to_json(const Condition& condition);
Json mutation_to_json(const Mutation& mutation);
Json operation_to_json(const Operation& operation);

// ["Open_vSwitch", op, op, ...]
Json make_transact_params(const std::vector<Operation>& operations);

// ["Open_vSwitch", monitor_id, {table: {"columns": [...]}}]
Json make_monitor_params(const MonitorTables& tables, const Json& monitor_id);

// The following throw std::runtime_error on a reply that does not have the
// shape RFC 7047 describes.
std::vector<OperationResult> parse_transact_result(const Json& result);
TableUpdates parse_table_updates(const Json& updates);

} // namespace ovsdb
} // namespace ovslink

#endif // OVSLINK_OVSDB_PROTOCOL_HPP
