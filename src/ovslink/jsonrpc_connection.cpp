#include "ovslink/jsonrpc_connection.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <netdb.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace ovslink {

void JsonStreamFramer::feed(const char* data, std::size_t length) {
    buffer_.append(data, length);
}

std::optional<std::string> JsonStreamFramer::next() {
    if (depth_ == 0 && scan_pos_ == 0) {
        std::size_t start = buffer_.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) {
            buffer_.clear();
            return std::nullopt;
        }
        buffer_.erase(0, start);
        if (buffer_[0] != '{') {
            throw std::runtime_error("expected '{' at start of JSON-RPC message, got '" + buffer_.substr(0, 16) + "'");
        }
    }

    for (std::size_t i = scan_pos_; i < buffer_.size(); ++i) {
        char c = buffer_[i];
        if (in_string_) {
            if (escaped_) {
                escaped_ = false;
            } else if (c == '\\') {
                escaped_ = true;
            } else if (c == '"') {
                in_string_ = false;
            }
            continue;
        }
        if (c == '"') {
            in_string_ = true;
        } else if (c == '{' || c == '[') {
            depth_++;
        } else if (c == '}' || c == ']') {
            depth_--;
            if (depth_ == 0) {
                std::string message = buffer_.substr(0, i + 1);
                buffer_.erase(0, i + 1);
                scan_pos_ = 0;
                return message;
            }
        }
    }
    scan_pos_ = buffer_.size();
    return std::nullopt;
}

namespace {

Error connect_error(const std::string& endpoint, const std::string& what, int err) {
    return Error(ErrorKind::ConnectionFailed, "connect", what + " " + endpoint, std::strerror(err));
}

Result<int> connect_tcp(const std::string& endpoint, const std::string& host_port) {
    std::size_t colon = host_port.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == host_port.size()) {
        return Error(ErrorKind::ConnectionFailed, "connect", "malformed tcp endpoint " + endpoint);
    }
    std::string host = host_port.substr(0, colon);
    std::string port = host_port.substr(colon + 1);

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* addresses = nullptr;
    int rc = ::getaddrinfo(host.c_str(), port.c_str(), &hints, &addresses);
    if (rc != 0) {
        return Error(ErrorKind::ConnectionFailed, "connect", "cannot resolve " + endpoint, gai_strerror(rc));
    }

    int last_errno = ECONNREFUSED;
    int fd = -1;
    for (struct addrinfo* ai = addresses; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_errno = errno;
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            break;
        }
        last_errno = errno;
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(addresses);

    if (fd < 0) {
        return connect_error(endpoint, "cannot connect to", last_errno);
    }
    return fd;
}

Result<int> connect_unix(const std::string& endpoint, const std::string& path) {
    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        return Error(ErrorKind::ConnectionFailed, "connect", "invalid unix socket path in " + endpoint);
    }
    std::memcpy(addr.sun_path, path.c_str(), path.size());

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return connect_error(endpoint, "cannot create socket for", errno);
    }
    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        int err = errno;
        ::close(fd);
        return connect_error(endpoint, "cannot connect to", err);
    }
    return fd;
}

} // namespace

Result<std::unique_ptr<JsonRpcConnection>> JsonRpcConnection::open(const std::string& endpoint, Logger& logger) {
    Result<int> fd = Error(ErrorKind::ConnectionFailed, "connect", "unsupported endpoint " + endpoint,
                           "expected tcp:<host>:<port> or unix:<path>");
    if (endpoint.rfind("tcp:", 0) == 0) {
        fd = connect_tcp(endpoint, endpoint.substr(4));
    } else if (endpoint.rfind("unix:", 0) == 0) {
        fd = connect_unix(endpoint, endpoint.substr(5));
    }
    if (!fd) {
        logger.error("JsonRpc", fd.error().to_string());
        return fd.error();
    }
    logger.info("JsonRpc", "Connected to " + endpoint);
    return std::make_unique<JsonRpcConnection>(fd.value(), logger);
}

JsonRpcConnection::JsonRpcConnection(int fd, Logger& logger)
    : fd_(fd), logger_(logger) {
    reader_ = std::thread([this]() { reader_loop(); });
}

JsonRpcConnection::~JsonRpcConnection() {
    close();
    if (reader_.joinable()) {
        reader_.join();
    }
    ::close(fd_);
}

void JsonRpcConnection::close() {
    if (open_.exchange(false)) {
        ::shutdown(fd_, SHUT_RDWR); // Wakes the reader out of recv()
    }
    fail_pending("connection closed");
}

void JsonRpcConnection::set_notification_handler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    notification_handler_ = std::move(handler);
}

Result<JsonRpcConnection::Json> JsonRpcConnection::call(const std::string& method, const Json& params,
                                                        std::chrono::milliseconds timeout, ReplyHook hook) {
    if (!open_) {
        return Error(ErrorKind::ConnectionFailed, method, "connection is closed");
    }

    uint64_t id = next_id_++;
    std::future<Result<Json>> reply;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        PendingCall pending_call;
        pending_call.hook = std::move(hook);
        reply = pending_call.promise.get_future();
        pending_.emplace(id, std::move(pending_call));
    }

    Json request = {{"method", method}, {"params", params}, {"id", id}};
    if (!send_message(request)) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.erase(id);
        return Error(ErrorKind::ConnectionFailed, method, "failed to send request");
    }

    if (reply.wait_for(timeout) != std::future_status::ready) {
        std::unique_lock<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(id);
        if (it != pending_.end()) {
            pending_.erase(it);
            lock.unlock();
            logger_.error("JsonRpc", method + " request " + std::to_string(id) + " timed out after " +
                                     std::to_string(timeout.count()) + " ms");
            return Error(ErrorKind::ConnectionFailed, method,
                         "no reply within " + std::to_string(timeout.count()) + " ms");
        }
        // The reader already claimed the reply and is finishing it
    }
    return reply.get();
}

void JsonRpcConnection::reader_loop() {
    char buf[8192];
    while (true) {
        ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            if (open_) {
                logger_.warning("JsonRpc", n == 0 ? "Peer closed the connection"
                                                  : std::string("recv failed: ") + std::strerror(errno));
            }
            if (framer_.buffered() > 0) {
                logger_.warning("JsonRpc", "Discarding " + std::to_string(framer_.buffered()) +
                                               " bytes of an incomplete message");
            }
            break;
        }
        framer_.feed(buf, static_cast<std::size_t>(n));
        try {
            while (auto text = framer_.next()) {
                dispatch(text.value());
            }
        } catch (const std::exception& ex) {
            // The stream cannot be resynchronised after a framing error
            logger_.error("JsonRpc", std::string("Protocol error, closing connection: ") + ex.what());
            break;
        }
    }
    open_ = false;
    fail_pending("connection closed by peer");
}

void JsonRpcConnection::dispatch(const std::string& text) {
    Json message = Json::parse(text, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        logger_.error("JsonRpc", "Dropping unparsable message: " + text.substr(0, 128));
        return;
    }
    if (message.contains("method")) {
        handle_request(message);
    } else if (message.contains("id")) {
        handle_reply(message);
    } else {
        logger_.warning("JsonRpc", "Dropping message with neither method nor id");
    }
}

void JsonRpcConnection::handle_reply(const Json& message) {
    const Json& id_value = message["id"];
    if (!id_value.is_number_unsigned()) {
        logger_.warning("JsonRpc", "Dropping reply with unexpected id " + id_value.dump());
        return;
    }
    uint64_t id = id_value.get<uint64_t>();

    PendingCall pending_call;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            logger_.debug("JsonRpc", "Dropping reply to unknown or timed out request " + std::to_string(id));
            return;
        }
        pending_call = std::move(it->second);
        pending_.erase(it);
    }

    auto error_it = message.find("error");
    if (error_it != message.end() && !error_it->is_null()) {
        pending_call.promise.set_value(
            Result<Json>(Error(ErrorKind::ConnectionFailed, "rpc", "server rejected request", error_it->dump())));
        return;
    }

    Json result = message.contains("result") ? message["result"] : Json();
    if (pending_call.hook) {
        std::optional<Error> hook_error;
        try {
            hook_error = pending_call.hook(result);
        } catch (const std::exception& ex) {
            hook_error = Error(ErrorKind::ConnectionFailed, "rpc", "failed to process reply", ex.what());
        }
        if (hook_error) {
            pending_call.promise.set_value(Result<Json>(hook_error.value()));
            return;
        }
    }
    pending_call.promise.set_value(Result<Json>(std::move(result)));
}

void JsonRpcConnection::handle_request(const Json& message) {
    const Json& method_value = message["method"];
    if (!method_value.is_string()) {
        logger_.warning("JsonRpc", "Dropping request with non-string method");
        return;
    }
    std::string method = method_value.get<std::string>();
    Json params = message.contains("params") ? message["params"] : Json::array();

    auto id_it = message.find("id");
    bool is_request = id_it != message.end() && !id_it->is_null();
    if (method == "echo" && is_request) {
        Json reply = {{"id", *id_it}, {"result", params}, {"error", nullptr}};
        if (!send_message(reply)) {
            logger_.warning("JsonRpc", "Failed to answer echo request");
        }
    }

    std::lock_guard<std::mutex> lock(handler_mutex_);
    if (notification_handler_) {
        notification_handler_(method, params);
    }
}

bool JsonRpcConnection::send_message(const Json& message) {
    std::string text = message.dump();
    std::lock_guard<std::mutex> lock(write_mutex_);
    std::size_t sent = 0;
    while (sent < text.size()) {
        ssize_t n = ::send(fd_, text.data() + sent, text.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            logger_.error("JsonRpc", std::string("send failed: ") + std::strerror(errno));
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

void JsonRpcConnection::fail_pending(const std::string& reason) {
    std::map<uint64_t, PendingCall> failed;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        failed.swap(pending_);
    }
    for (auto& entry : failed) {
        entry.second.promise.set_value(Result<Json>(Error(ErrorKind::ConnectionFailed, "rpc", reason)));
    }
}

} // namespace ovslink
