#include "ovslink/database_session.hpp"

#include <stdexcept>
#include <utility>

namespace ovslink {

namespace {

constexpr const char* kMonitorId = "ovslink";

} // namespace

const ovsdb::MonitorTables& DatabaseSession::monitored_tables() {
    static const ovsdb::MonitorTables tables = {
        {ovsdb::kBridgeTable, {"name", "ports"}},
        {ovsdb::kPortTable, {"name", "interfaces"}},
        {ovsdb::kInterfaceTable, {"name", "type"}},
    };
    return tables;
}

DatabaseSession::DatabaseSession(std::unique_ptr<JsonRpcConnection> connection, const SessionOptions& options,
                                 Logger& logger)
    : logger_(logger), options_(options), cache_(), notifier_(cache_, logger), connection_(std::move(connection)) {}

DatabaseSession::~DatabaseSession() {
    if (connection_) {
        connection_->set_notification_handler(nullptr);
    }
}

Result<std::unique_ptr<DatabaseSession>> DatabaseSession::connect(const SessionOptions& options, Logger& logger) {
    auto connection = JsonRpcConnection::open(options.endpoint, logger);
    if (!connection) {
        return connection.error();
    }
    return start(std::move(connection.value()), options, logger);
}

Result<std::unique_ptr<DatabaseSession>> DatabaseSession::start(std::unique_ptr<JsonRpcConnection> connection,
                                                                const SessionOptions& options, Logger& logger) {
    if (!connection || !connection->is_open()) {
        return Error(ErrorKind::ConnectionFailed, "connect", "no open connection to " + options.endpoint);
    }
    // The constructor is private so sessions only exist connected; make_unique cannot reach it.
    std::unique_ptr<DatabaseSession> session(new DatabaseSession(std::move(connection), options, logger));

    // Register before asking for the snapshot so no update can slip past.
    ChangeNotifier* notifier = &session->notifier_;
    session->connection_->set_notification_handler(
        [notifier](const std::string& method, const ovsdb::Json& params) {
            notifier->on_message(method, params);
        });

    if (auto error = session->load_snapshot()) {
        logger.error("DatabaseSession", error->to_string());
        return error.value();
    }
    logger.info("DatabaseSession", "Session established with " + options.endpoint + ", " +
                std::to_string(session->cache_.table_size(ovsdb::kBridgeTable)) + " bridges cached");
    return Result<std::unique_ptr<DatabaseSession>>(std::move(session));
}

std::optional<Error> DatabaseSession::load_snapshot() {
    ovsdb::Json params = ovsdb::make_monitor_params(monitored_tables(), kMonitorId);

    // The snapshot is applied on the reader thread, ahead of any update that
    // follows it on the wire.
    TableCache* cache = &cache_;
    auto reply = connection_->call("monitor", params, options_.transact_timeout,
        [cache](const ovsdb::Json& result) -> std::optional<Error> {
            try {
                cache->apply_update(ovsdb::parse_table_updates(result));
            } catch (const std::exception& ex) {
                return Error(ErrorKind::ConnectionFailed, "monitor", "malformed snapshot", ex.what());
            }
            return std::nullopt;
        });
    if (!reply) {
        Error error = reply.error();
        error.stage = "monitor";
        return error;
    }
    // Tables with no rows are absent from the reply; make them known anyway.
    ovsdb::TableUpdates empty_tables;
    for (const auto& entry : monitored_tables()) {
        empty_tables[entry.first];
    }
    cache_.apply_update(empty_tables);
    return std::nullopt;
}

Result<std::vector<ovsdb::OperationResult>> DatabaseSession::transact(const std::vector<ovsdb::Operation>& operations) {
    auto reply = connection_->call("transact", ovsdb::make_transact_params(operations), options_.transact_timeout);
    if (!reply) {
        Error error = reply.error();
        error.stage = "transact";
        logger_.error("DatabaseSession", error.to_string());
        return error;
    }
    try {
        return ovsdb::parse_transact_result(reply.value());
    } catch (const std::exception& ex) {
        Error error(ErrorKind::ConnectionFailed, "transact", "malformed transact reply", ex.what());
        logger_.error("DatabaseSession", error.to_string());
        return error;
    }
}

} // namespace ovslink
