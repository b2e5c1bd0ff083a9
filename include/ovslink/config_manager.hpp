#ifndef OVSLINK_CONFIG_MANAGER_HPP
#define OVSLINK_CONFIG_MANAGER_HPP

#include "ovslink/logger.hpp"
#include "ovslink/network_types.hpp"

#include <cstdint> // For uint32_t, uint64_t
#include <string>
#include <vector>
#include <map>
#include <variant>
#include <optional>

namespace ovslink {

// Numeric keys load as uint32_t, or uint64_t when too large for one (which
// validation rejects). Everything else is kept as the text from the file.
using ConfigValue = std::variant<
    uint32_t,
    uint64_t,
    std::string
>;

// Configuration data is stored as a map of string paths to ConfigValue
using ConfigurationData = std::map<std::string, ConfigValue>;

// Everything that is not part of the network identity itself.
struct RuntimeOptions {
    std::string ovsdb_endpoint = "tcp:127.0.0.1:6640";
    uint32_t transact_timeout_ms = 5000;
    uint32_t link_ready_attempts = 50;
    uint32_t link_ready_interval_ms = 20;
    LogLevel log_level = LogLevel::INFO;
};

class ConfigManager {
public:
    ConfigManager() = default;

    // Loads a `key=value` file. Blank lines and lines starting with '#' are
    // skipped, malformed lines are logged and skipped. Returns false only if
    // the file cannot be opened.
    bool load_config(const std::string& filename);

    // Retrieves a configuration parameter by its path (e.g., "network.bridge").
    std::optional<ConfigValue> get_parameter(const std::string& path) const {
        auto it = config_data_.find(path);
        if (it != config_data_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    const ConfigurationData& get_current_config_data() const {
        return config_data_;
    }

    void set_logger(Logger* logger) {
        logger_ = logger;
    }

    // Returns one message per problem: unknown keys, values of the wrong
    // type, numbers above UINT32_MAX, a zero mtu, timeout or attempt count,
    // invalid MAC strings, missing network.bridge / network.veth_prefix.
    std::vector<std::string> validate_config(const ConfigurationData& config_to_validate) const;

    // Unset keys keep the NetworkConfig defaults.
    NetworkConfig to_network_config() const;
    RuntimeOptions to_runtime_options() const;

private:
    std::optional<uint32_t> get_unsigned(const std::string& path) const;
    std::string get_string(const std::string& path) const;

    ConfigurationData config_data_;
    Logger* logger_ = nullptr;           // Optional: for logging internal errors/info
};

} // namespace ovslink

#endif // OVSLINK_CONFIG_MANAGER_HPP
