#ifndef OVSLINK_DATABASE_SESSION_HPP
#define OVSLINK_DATABASE_SESSION_HPP

#include "ovslink/change_notifier.hpp"
#include "ovslink/error.hpp"
#include "ovslink/jsonrpc_connection.hpp"
#include "ovslink/logger.hpp"
#include "ovslink/ovsdb_protocol.hpp"
#include "ovslink/table_cache.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ovslink {

struct SessionOptions {
    std::string endpoint = "tcp:127.0.0.1:6640";
    std::chrono::milliseconds transact_timeout{5000};
};

// Interface the port provisioner transacts through.
class Transactor {
public:
    virtual ~Transactor() = default;
    virtual Result<std::vector<ovsdb::OperationResult>> transact(const std::vector<ovsdb::Operation>& operations) = 0;
};

// One connection to the switch control database plus the local mirror of
// the Bridge, Port and Interface tables. Sessions share nothing; each owns
// its connection, its cache and its notifier.
class DatabaseSession : public Transactor {
public:
    // Connects to options.endpoint, loads the initial snapshot and starts
    // following updates. Any failure, including the snapshot, is ConnectionFailed.
    static Result<std::unique_ptr<DatabaseSession>> connect(const SessionOptions& options, Logger& logger);

    // Same as connect() over an existing connection.
    static Result<std::unique_ptr<DatabaseSession>> start(std::unique_ptr<JsonRpcConnection> connection,
                                                          const SessionOptions& options, Logger& logger);

    ~DatabaseSession() override;

    Result<std::vector<ovsdb::OperationResult>> transact(const std::vector<ovsdb::Operation>& operations) override;

    const TableCache& cache() const { return cache_; }
    const ChangeNotifier& notifier() const { return notifier_; }
    bool is_connected() const { return connection_ && connection_->is_open(); }

    // Tables and columns mirrored by every session.
    static const ovsdb::MonitorTables& monitored_tables();

private:
    DatabaseSession(std::unique_ptr<JsonRpcConnection> connection, const SessionOptions& options, Logger& logger);

    std::optional<Error> load_snapshot();

    Logger& logger_;
    SessionOptions options_;
    TableCache cache_;
    ChangeNotifier notifier_;
    // Declared last: destroying it joins the reader thread before the cache
    // and notifier it calls into go away.
    std::unique_ptr<JsonRpcConnection> connection_;
};

} // namespace ovslink

#endif // OVSLINK_DATABASE_SESSION_HPP
