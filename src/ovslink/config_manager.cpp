#include "ovslink/config_manager.hpp"
#include "ovslink/utils.hpp"

#include <fstream>   // For std::ifstream
#include <limits>    // For std::numeric_limits
#include <charconv>  // For std::from_chars
#include <type_traits>

namespace ovslink {

namespace {

enum class KeyType { String, Unsigned };

const std::map<std::string, KeyType>& known_keys() {
    static const std::map<std::string, KeyType> keys = {
        {"network.bridge", KeyType::String},
        {"network.veth_prefix", KeyType::String},
        {"network.mtu", KeyType::Unsigned},
        {"network.mac_address", KeyType::String},
        {"network.address", KeyType::String},
        {"network.ipv6_address", KeyType::String},
        {"network.gateway", KeyType::String},
        {"network.ipv6_gateway", KeyType::String},
        {"ovsdb.endpoint", KeyType::String},
        {"ovsdb.timeout_ms", KeyType::Unsigned},
        {"link.ready_attempts", KeyType::Unsigned},
        {"link.ready_interval_ms", KeyType::Unsigned},
        {"log.level", KeyType::String},
    };
    return keys;
}

// Only keys declared Unsigned are read as numbers; every other value is kept
// verbatim so names like "0100" survive. A number that does not parse is kept
// as text and reported by validate_config().
ConfigValue parse_value(const std::string& key, const std::string& value_str) {
    auto known = known_keys().find(key);
    if (known == known_keys().end() || known->second != KeyType::Unsigned || value_str.empty()) {
        return value_str;
    }

    const char* begin = value_str.data();
    const char* end = value_str.data() + value_str.size();
    uint64_t uint64_val = 0;
    auto [ptr, ec] = std::from_chars(begin, end, uint64_val);
    if (ec != std::errc() || ptr != end) {
        return value_str;
    }
    if (uint64_val <= std::numeric_limits<uint32_t>::max()) {
        return static_cast<uint32_t>(uint64_val);
    }
    return uint64_val;
}

std::string value_to_string(const ConfigValue& value) {
    std::string value_str;
    std::visit([&](const auto& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::string>) {
            value_str = val;
        } else {
            value_str = std::to_string(val);
        }
    }, value);
    return value_str;
}

// Zero would make every attach or transaction fail.
bool must_be_positive(const std::string& key) {
    return key == "network.mtu" || key == "ovsdb.timeout_ms" || key == "link.ready_attempts";
}

} // namespace

bool ConfigManager::load_config(const std::string& filename) {
    if (logger_) logger_->debug("ConfigManager", "Loading configuration from " + filename);

    std::ifstream file(filename);
    if (!file.is_open()) {
        if (logger_) logger_->error("ConfigManager", "Failed to open config file: " + filename);
        return false;
    }

    config_data_.clear();
    std::string line;
    int line_num = 0;
    while (std::getline(file, line)) {
        line_num++;
        line = utils::trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t delimiter_pos = line.find('=');
        if (delimiter_pos == std::string::npos) {
            if (logger_) logger_->warning("ConfigManager", "Skipping malformed line (no '=') in " + filename + " at line " + std::to_string(line_num));
            continue;
        }

        std::string key = utils::trim(line.substr(0, delimiter_pos));
        std::string value_str = utils::trim(line.substr(delimiter_pos + 1));

        if (key.empty()) {
            if (logger_) logger_->warning("ConfigManager", "Skipping line with empty key in " + filename + " at line " + std::to_string(line_num));
            continue;
        }

        config_data_[key] = parse_value(key, value_str);
    }

    if (logger_) logger_->info("ConfigManager", "Loaded " + std::to_string(config_data_.size()) + " parameters from " + filename);
    return true;
}

std::vector<std::string> ConfigManager::validate_config(const ConfigurationData& config_to_validate) const {
    std::vector<std::string> errors;
    const auto& keys = known_keys();

    for (const auto& pair : config_to_validate) {
        const std::string& key = pair.first;
        const ConfigValue& value = pair.second;

        auto known = keys.find(key);
        if (known == keys.end()) {
            errors.push_back("Unknown configuration key '" + key + "'.");
            continue;
        }

        if (known->second == KeyType::Unsigned) {
            if (auto* number = std::get_if<uint32_t>(&value)) {
                if (*number == 0 && must_be_positive(key)) {
                    errors.push_back("Invalid value for key '" + key + "'. Must be greater than zero.");
                }
            } else if (std::holds_alternative<uint64_t>(value)) {
                errors.push_back("Value for key '" + key + "' is out of range. Maximum is " +
                                 std::to_string(std::numeric_limits<uint32_t>::max()) + ".");
            } else {
                errors.push_back("Invalid type for key '" + key + "'. Expected a non-negative integer.");
            }
        } else if (!std::holds_alternative<std::string>(value)) {
            errors.push_back("Invalid type for key '" + key + "'. Expected a string.");
        }

        if (key == "network.mac_address") {
            std::string mac = value_to_string(value);
            if (!mac.empty() && !utils::is_valid_mac_string(mac)) {
                errors.push_back("Invalid MAC address '" + mac + "' for key '" + key + "'.");
            }
        }

        if (key == "log.level" && !log_level_from_string(value_to_string(value))) {
            errors.push_back("Invalid log level '" + value_to_string(value) + "'.");
        }
    }

    for (const char* required : {"network.bridge", "network.veth_prefix"}) {
        auto it = config_to_validate.find(required);
        if (it == config_to_validate.end() || value_to_string(it->second).empty()) {
            errors.push_back(std::string("Missing required key '") + required + "'.");
        }
    }

    if (logger_) {
        if (!errors.empty()) {
            logger_->warning("ConfigManager", "Configuration validation found " + std::to_string(errors.size()) + " errors.");
        } else {
            logger_->debug("ConfigManager", "Configuration validation successful.");
        }
    }
    return errors;
}

std::optional<uint32_t> ConfigManager::get_unsigned(const std::string& path) const {
    auto value = get_parameter(path);
    if (!value) {
        return std::nullopt;
    }
    if (auto* u32_val = std::get_if<uint32_t>(&value.value())) {
        return *u32_val;
    }
    if (logger_) logger_->warning("ConfigManager", "Ignoring non-numeric or out of range value for " + path);
    return std::nullopt;
}

std::string ConfigManager::get_string(const std::string& path) const {
    auto value = get_parameter(path);
    if (!value) {
        return "";
    }
    return value_to_string(value.value());
}

NetworkConfig ConfigManager::to_network_config() const {
    NetworkConfig config;
    config.bridge = get_string("network.bridge");
    config.veth_prefix = get_string("network.veth_prefix");
    config.mtu = get_unsigned("network.mtu").value_or(config.mtu);
    config.mac_address = get_string("network.mac_address");
    config.address = get_string("network.address");
    config.ipv6_address = get_string("network.ipv6_address");
    config.gateway = get_string("network.gateway");
    config.ipv6_gateway = get_string("network.ipv6_gateway");
    return config;
}

RuntimeOptions ConfigManager::to_runtime_options() const {
    RuntimeOptions options;
    std::string endpoint = get_string("ovsdb.endpoint");
    if (!endpoint.empty()) {
        options.ovsdb_endpoint = endpoint;
    }
    options.transact_timeout_ms = get_unsigned("ovsdb.timeout_ms").value_or(options.transact_timeout_ms);
    options.link_ready_attempts = get_unsigned("link.ready_attempts").value_or(options.link_ready_attempts);
    options.link_ready_interval_ms = get_unsigned("link.ready_interval_ms").value_or(options.link_ready_interval_ms);
    if (auto level = log_level_from_string(get_string("log.level"))) {
        options.log_level = level.value();
    }
    return options;
}

} // namespace ovslink
