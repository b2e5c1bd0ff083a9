#ifndef OVSLINK_TABLE_CACHE_HPP
#define OVSLINK_TABLE_CACHE_HPP

#include "ovslink/ovsdb_protocol.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace ovslink {

// Column name -> OVSDB value, as received from the server.
using Row = ovsdb::Json;
using RowMap = std::map<std::string, Row>;          // row uuid -> row
using TableMap = std::map<std::string, RowMap>;     // table name -> rows

// Local mirror of selected control database tables.
//
// Every row operation is an overwrite or an erase, so applying the same
// update twice leaves the same state as applying it once. Updates must be fed
// in the order the server sent them. All members lock internally; the
// connection reader thread writes while callers read.
class TableCache {
public:
    TableCache() = default;

    TableCache(const TableCache&) = delete;
    TableCache& operator=(const TableCache&) = delete;

    void apply_update(const ovsdb::TableUpdates& update);

    std::optional<Row> get_row(const std::string& table, const std::string& uuid) const;
    RowMap get_table(const std::string& table) const;

    // First row of `table` whose `column` equals `value`, with its uuid.
    std::optional<std::pair<std::string, Row>> find_row(const std::string& table,
                                                        const std::string& column,
                                                        const ovsdb::Json& value) const;

    bool has_table(const std::string& table) const;
    std::size_t table_size(const std::string& table) const;
    TableMap snapshot() const;

private:
    mutable std::mutex cache_mutex_;
    TableMap tables_;
};

} // namespace ovslink

#endif // OVSLINK_TABLE_CACHE_HPP
