#include "ovslink/table_cache.hpp"

namespace ovslink {

namespace {

bool is_empty_row(const std::optional<Row>& row) {
    return !row.has_value() || row->is_null() || row->empty();
}

} // namespace

void TableCache::apply_update(const ovsdb::TableUpdates& update) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    for (const auto& [table, rows] : update) {
        RowMap& cached_rows = tables_[table]; // Table exists after its first update, even if empty
        for (const auto& [uuid, delta] : rows) {
            if (is_empty_row(delta.new_row)) {
                cached_rows.erase(uuid);
            } else {
                cached_rows[uuid] = delta.new_row.value();
            }
        }
    }
}

std::optional<Row> TableCache::get_row(const std::string& table, const std::string& uuid) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto table_it = tables_.find(table);
    if (table_it == tables_.end()) {
        return std::nullopt;
    }
    auto row_it = table_it->second.find(uuid);
    if (row_it == table_it->second.end()) {
        return std::nullopt;
    }
    return row_it->second;
}

RowMap TableCache::get_table(const std::string& table) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = tables_.find(table);
    if (it != tables_.end()) {
        return it->second;
    }
    return RowMap();
}

std::optional<std::pair<std::string, Row>> TableCache::find_row(const std::string& table,
                                                                const std::string& column,
                                                                const ovsdb::Json& value) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto table_it = tables_.find(table);
    if (table_it == tables_.end()) {
        return std::nullopt;
    }
    for (const auto& [uuid, row] : table_it->second) {
        auto column_it = row.find(column);
        if (column_it != row.end() && *column_it == value) {
            return std::make_pair(uuid, row);
        }
    }
    return std::nullopt;
}

bool TableCache::has_table(const std::string& table) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return tables_.find(table) != tables_.end();
}

std::size_t TableCache::table_size(const std::string& table) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = tables_.find(table);
    return it == tables_.end() ? 0 : it->second.size();
}

TableMap TableCache::snapshot() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return tables_;
}

} // namespace ovslink
