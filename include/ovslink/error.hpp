#ifndef OVSLINK_ERROR_HPP
#define OVSLINK_ERROR_HPP

#include <string>
#include <variant>
#include <utility>   // For std::move
#include <stdexcept> // For std::logic_error

namespace ovslink {

enum class ErrorKind {
    ConfigurationInvalid,
    ConnectionFailed,
    TransactionFailed,
    DeviceOperationFailed
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConfigurationInvalid:  return "ConfigurationInvalid";
        case ErrorKind::ConnectionFailed:      return "ConnectionFailed";
        case ErrorKind::TransactionFailed:     return "TransactionFailed";
        case ErrorKind::DeviceOperationFailed: return "DeviceOperationFailed";
        default:                               return "Unknown";
    }
}

// A terminal failure. `stage` names where it happened (a step, a table, a
// request), `details` carries lower level text such as the OVSDB server's
// own error and details strings.
struct Error {
    ErrorKind kind = ErrorKind::ConnectionFailed;
    std::string stage;
    std::string message;
    std::string details;

    Error() = default;
    Error(ErrorKind k, std::string stg, std::string msg, std::string det = "")
        : kind(k), stage(std::move(stg)), message(std::move(msg)), details(std::move(det)) {}

    std::string to_string() const {
        std::string out = error_kind_to_string(kind);
        if (!stage.empty()) {
            out += " [" + stage + "]";
        }
        out += ": " + message;
        if (!details.empty()) {
            out += " (" + details + ")";
        }
        return out;
    }
};

// Either a value or an Error.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const {
        if (!ok()) {
            throw std::logic_error("Result::value() on error: " + std::get<Error>(data_).to_string());
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!ok()) {
            throw std::logic_error("Result::value() on error: " + std::get<Error>(data_).to_string());
        }
        return std::get<T>(data_);
    }

    const Error& error() const {
        if (ok()) {
            throw std::logic_error("Result::error() on value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

} // namespace ovslink

#endif // OVSLINK_ERROR_HPP
