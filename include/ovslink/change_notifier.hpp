#ifndef OVSLINK_CHANGE_NOTIFIER_HPP
#define OVSLINK_CHANGE_NOTIFIER_HPP

#include "ovslink/logger.hpp"
#include "ovslink/ovsdb_protocol.hpp"
#include "ovslink/table_cache.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace ovslink {

struct UpdatedEvent {
    ovsdb::Json monitor_id;
    ovsdb::TableUpdates updates;
};

struct LockedEvent {
    std::string lock_name;
};

struct StolenEvent {
    std::string lock_name;
};

struct EchoEvent {
    ovsdb::Json payload;
};

using NotificationEvent = std::variant<UpdatedEvent, LockedEvent, StolenEvent, EchoEvent>;

// Receives unsolicited server messages and keeps the TableCache current.
// Only UpdatedEvent carries state; the lock and echo events are accepted and
// dropped. Runs on the connection reader thread, so it must never block on
// I/O or issue requests of its own.
class ChangeNotifier {
public:
    ChangeNotifier(TableCache& cache, Logger& logger);

    // Maps a JSON-RPC method and its params to an event. Returns std::nullopt
    // for methods that are not notifications. Throws std::runtime_error if an
    // "update" carries malformed params.
    static std::optional<NotificationEvent> from_message(const std::string& method, const ovsdb::Json& params);

    void handle(const NotificationEvent& event);

    // Entry point registered with the connection.
    void on_message(const std::string& method, const ovsdb::Json& params);

    uint64_t updates_applied() const { return updates_applied_.load(); }

private:
    TableCache& cache_;
    Logger& logger_;
    std::atomic<uint64_t> updates_applied_{0};
};

} // namespace ovslink

#endif // OVSLINK_CHANGE_NOTIFIER_HPP
