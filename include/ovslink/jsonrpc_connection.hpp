#ifndef OVSLINK_JSONRPC_CONNECTION_HPP
#define OVSLINK_JSONRPC_CONNECTION_HPP

#include "ovslink/error.hpp"
#include "ovslink/logger.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace ovslink {

// Splits a byte stream of back to back JSON objects into one document per
// object. OVSDB does not delimit messages, so objects are found by brace
// depth, ignoring braces inside strings.
class JsonStreamFramer {
public:
    void feed(const char* data, std::size_t length);

    // Next complete top level object, or std::nullopt if more bytes are needed.
    // Throws std::runtime_error if the stream holds something other than an object.
    std::optional<std::string> next();

    std::size_t buffered() const { return buffer_.size(); }

private:
    std::string buffer_;
    std::size_t scan_pos_ = 0;
    int depth_ = 0;
    bool in_string_ = false;
    bool escaped_ = false;
};

// JSON-RPC 1.0 peer over a connected stream socket.
//
// A reader thread decodes every inbound message. Replies are matched to the
// waiting call() by id; requests and notifications from the server go to the
// notification handler. Server "echo" requests are answered here so the
// session stays alive even while nobody is calling.
class JsonRpcConnection {
public:
    using Json = nlohmann::json;
    using NotificationHandler = std::function<void(const std::string& method, const Json& params)>;
    // Runs on the reader thread before call() returns, ahead of any later
    // notification. A returned Error replaces the result.
    using ReplyHook = std::function<std::optional<Error>(const Json& result)>;

    // `endpoint` is "tcp:<host>:<port>" or "unix:<path>".
    static Result<std::unique_ptr<JsonRpcConnection>> open(const std::string& endpoint, Logger& logger);

    // Takes ownership of an already connected socket.
    JsonRpcConnection(int fd, Logger& logger);
    ~JsonRpcConnection();

    JsonRpcConnection(const JsonRpcConnection&) = delete;
    JsonRpcConnection& operator=(const JsonRpcConnection&) = delete;

    void set_notification_handler(NotificationHandler handler);

    // Sends a request and blocks until its reply, the timeout, or the
    // connection closing. Everything but a successful reply is ConnectionFailed.
    Result<Json> call(const std::string& method, const Json& params,
                      std::chrono::milliseconds timeout, ReplyHook hook = nullptr);

    bool is_open() const { return open_.load(); }
    void close();

private:
    struct PendingCall {
        std::promise<Result<Json>> promise;
        ReplyHook hook;
    };

    void reader_loop();
    void dispatch(const std::string& text);
    void handle_reply(const Json& message);
    void handle_request(const Json& message);
    bool send_message(const Json& message);
    void fail_pending(const std::string& reason);

    int fd_;
    Logger& logger_;
    std::atomic<bool> open_{true};
    std::atomic<uint64_t> next_id_{1};

    std::mutex write_mutex_;
    std::mutex pending_mutex_;
    std::map<uint64_t, PendingCall> pending_;

    std::mutex handler_mutex_;
    NotificationHandler notification_handler_;

    JsonStreamFramer framer_;
    std::thread reader_;
};

} // namespace ovslink

#endif // OVSLINK_JSONRPC_CONNECTION_HPP
