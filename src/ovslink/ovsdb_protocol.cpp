#include "ovslink/ovsdb_protocol.hpp"

#include <stdexcept>
#include <type_traits>

namespace ovslink {
namespace ovsdb {

Json uuid_ref(const std::string& uuid) {
    return Json::array({"uuid", uuid});
}

Json named_uuid_ref(const std::string& uuid_name) {
    return Json::array({"named-uuid", uuid_name});
}

Json make_set(const std::vector<Json>& elements) {
    return Json::array({"set", Json(elements)});
}

namespace {

bool is_uuid_atom(const Json& value) {
    return value.is_array() && value.size() == 2 && value[0].is_string() &&
           value[0].get<std::string>() == "uuid" && value[1].is_string();
}

std::string string_member(const Json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return "";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

} // namespace

std::vector<std::string> uuids_in(const Json& value) {
    std::vector<std::string> uuids;
    if (is_uuid_atom(value)) {
        uuids.push_back(value[1].get<std::string>());
        return uuids;
    }
    if (value.is_array() && value.size() == 2 && value[0] == "set" && value[1].is_array()) {
        for (const auto& element : value[1]) {
            if (is_uuid_atom(element)) {
                uuids.push_back(element[1].get<std::string>());
            }
        }
    }
    return uuids;
}

bool set_contains_uuid(const Json& value, const std::string& uuid) {
    for (const auto& candidate : uuids_in(value)) {
        if (candidate == uuid) {
            return true;
        }
    }
    return false;
}

Json condition_to_json(const Condition& condition) {
    return Json::array({condition.column, condition.function, condition.value});
}

Json mutation_to_json(const Mutation& mutation) {
    return Json::array({mutation.column, mutation.mutator, mutation.value});
}

Json operation_to_json(const Operation& operation) {
    return std::visit([](const auto& op) -> Json {
        using T = std::decay_t<decltype(op)>;
        Json out = Json::object();
        out["table"] = op.table;
        if constexpr (std::is_same_v<T, InsertOp>) {
            out["op"] = "insert";
            out["row"] = op.row;
            if (!op.uuid_name.empty()) {
                out["uuid-name"] = op.uuid_name;
            }
        } else {
            out["op"] = "mutate";
            Json where = Json::array();
            for (const auto& condition : op.where) {
                where.push_back(condition_to_json(condition));
            }
            Json mutations = Json::array();
            for (const auto& mutation : op.mutations) {
                mutations.push_back(mutation_to_json(mutation));
            }
            out["where"] = where;
            out["mutations"] = mutations;
        }
        return out;
    }, operation);
}

Json make_transact_params(const std::vector<Operation>& operations) {
    Json params = Json::array({kDatabaseName});
    for (const auto& operation : operations) {
        params.push_back(operation_to_json(operation));
    }
    return params;
}

Json make_monitor_params(const MonitorTables& tables, const Json& monitor_id) {
    Json requests = Json::object();
    for (const auto& [table, columns] : tables) {
        requests[table] = {{"columns", columns}};
    }
    return Json::array({kDatabaseName, monitor_id, requests});
}

std::vector<OperationResult> parse_transact_result(const Json& result) {
    if (!result.is_array()) {
        throw std::runtime_error("transact result is not an array: " + result.dump());
    }
    std::vector<OperationResult> results;
    results.reserve(result.size());
    for (const auto& entry : result) {
        OperationResult op_result;
        // A null entry is what the server sends for operations it never
        // reached after an earlier one failed.
        if (entry.is_object()) {
            op_result.error = string_member(entry, "error");
            op_result.details = string_member(entry, "details");
            auto uuid_it = entry.find("uuid");
            if (uuid_it != entry.end() && is_uuid_atom(*uuid_it)) {
                op_result.uuid = (*uuid_it)[1].get<std::string>();
            }
            auto count_it = entry.find("count");
            if (count_it != entry.end() && count_it->is_number_integer()) {
                op_result.count = count_it->get<int64_t>();
            }
        } else if (!entry.is_null()) {
            throw std::runtime_error("unexpected transact result entry: " + entry.dump());
        }
        results.push_back(std::move(op_result));
    }
    return results;
}

TableUpdates parse_table_updates(const Json& updates) {
    if (!updates.is_object()) {
        throw std::runtime_error("table updates are not an object: " + updates.dump());
    }
    TableUpdates parsed;
    for (const auto& [table, rows] : updates.items()) {
        if (!rows.is_object()) {
            throw std::runtime_error("rows for table " + table + " are not an object");
        }
        TableUpdate& table_update = parsed[table];
        for (const auto& [uuid, delta] : rows.items()) {
            if (!delta.is_object()) {
                throw std::runtime_error("row update " + uuid + " in table " + table + " is not an object");
            }
            RowUpdate row_update;
            auto old_it = delta.find("old");
            if (old_it != delta.end() && !old_it->is_null()) {
                row_update.old_row = *old_it;
            }
            auto new_it = delta.find("new");
            if (new_it != delta.end() && !new_it->is_null()) {
                row_update.new_row = *new_it;
            }
            table_update[uuid] = std::move(row_update);
        }
    }
    return parsed;
}

} // namespace ovsdb
} // namespace ovslink
