#ifndef OVSLINK_TESTS_FAKE_OVSDB_SERVER_HPP
#define OVSLINK_TESTS_FAKE_OVSDB_SERVER_HPP

#include "ovslink/jsonrpc_connection.hpp"
#include "ovslink/logger.hpp"
#include "ovslink/ovsdb_protocol.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace ovslink {
namespace testing {

// Logger that keeps test output clean but remembers what was logged.
class RecordingLogger : public Logger {
public:
    RecordingLogger() : Logger(LogLevel::DEBUG) {}

    void log(LogLevel level, const std::string& component, const std::string& message) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back({level, component + ": " + message});
    }

    bool contains(LogLevel level, const std::string& fragment) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& line : lines_) {
            if (line.first == level && line.second.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

private:
    mutable std::mutex mutex_;
    mutable std::vector<std::pair<LogLevel, std::string>> lines_;
};

// Polls `predicate` until it holds or `timeout` passes.
bool wait_until(const std::function<bool()>& predicate,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

// In-process OVSDB server on one end of a socketpair. Understands enough of
// RFC 7047 for the Bridge/Port/Interface workflow: monitor, transact with
// insert and mutate (named-uuid resolution, "==" conditions, set insert),
// list_dbs, and update notifications sent ahead of the transact reply.
// Inserting a Port or Interface whose name is taken fails at commit.
class FakeOvsdbServer {
public:
    using Json = nlohmann::json;
    using Rows = std::map<std::string, Json>; // uuid -> row

    FakeOvsdbServer();
    ~FakeOvsdbServer();

    FakeOvsdbServer(const FakeOvsdbServer&) = delete;
    FakeOvsdbServer& operator=(const FakeOvsdbServer&) = delete;

    // Client side of the socketpair wrapped in a connection. Only one per server.
    std::unique_ptr<JsonRpcConnection> connect(Logger& logger);

    // Adds a bridge row and returns its uuid. Monitoring clients get an update.
    std::string add_bridge(const std::string& name);
    void remove_row(const std::string& table, const std::string& uuid);

    Rows table(const std::string& name) const;
    std::optional<std::string> find_uuid(const std::string& table, const std::string& name) const;

    // Failure injection
    void fail_operation(std::size_t index, const std::string& error, const std::string& details);
    void set_reply_delay(std::chrono::milliseconds delay) { reply_delay_ms_ = delay.count(); }
    void set_drop_transact_replies(bool drop) { drop_transact_replies_ = drop; }
    void set_fail_monitor(bool fail) { fail_monitor_ = fail; }
    void set_malformed_snapshot(bool malformed) { malformed_snapshot_ = malformed; }

    // Writes raw text or a message to the client.
    void send_raw(const std::string& text);
    void send(const Json& message);
    void close_client();

    std::vector<std::string> methods_received() const;
    std::vector<Json> replies_received() const;
    std::size_t transactions_committed() const { return transactions_committed_.load(); }

private:
    struct InjectedError {
        std::size_t index;
        std::string error;
        std::string details;
    };

    void serve();
    void handle(const Json& message);
    Json handle_monitor(const Json& params);
    Json handle_transact(const Json& params);
    Json resolve_named_uuids(const Json& value, const std::map<std::string, std::string>& names) const;
    Json row_update_for(const std::string& table, const std::string& uuid, const Json* old_row,
                        const Json* new_row) const;
    void notify(const Json& updates);
    std::string next_uuid();

    int server_fd_ = -1;
    int client_fd_ = -1;

    mutable std::mutex db_mutex_;
    std::map<std::string, Rows> db_;
    std::map<std::string, std::vector<std::string>> monitored_;
    std::optional<Json> monitor_id_;
    uint64_t uuid_counter_ = 0;
    std::optional<InjectedError> injected_error_;

    mutable std::mutex log_mutex_;
    std::vector<std::string> methods_;
    std::vector<Json> replies_;

    std::mutex write_mutex_;
    std::atomic<long long> reply_delay_ms_{0};
    std::atomic<bool> drop_transact_replies_{false};
    std::atomic<bool> fail_monitor_{false};
    std::atomic<bool> malformed_snapshot_{false};
    std::atomic<std::size_t> transactions_committed_{0};

    std::thread thread_;
};

} // namespace testing
} // namespace ovslink

#endif // OVSLINK_TESTS_FAKE_OVSDB_SERVER_HPP
