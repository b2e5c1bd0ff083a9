#include "ovslink/utils.hpp"
#include <string>
#include <vector>
#include <random>    // For std::random_device
#include <cctype>    // For std::isxdigit
#include <stdexcept> // For std::stoi exceptions

namespace ovslink {
namespace utils {

std::optional<int> safe_stoi(const std::string& str) {
    try {
        size_t processed_chars = 0;
        int val = std::stoi(str, &processed_chars, 0);
        if (processed_chars != str.length()) {
            return std::nullopt;
        }
        return val;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string generate_random_name(const std::string& prefix, std::size_t length) {
    std::random_device rd; // Backed by the kernel entropy pool on Linux
    std::vector<uint8_t> bytes((length + 1) / 2);
    try {
        for (auto& b : bytes) {
            b = static_cast<uint8_t>(rd() & 0xFF);
        }
    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string("random source unavailable: ") + ex.what());
    }
    std::string suffix = to_hex_string(bytes);
    return prefix + suffix.substr(0, length);
}

bool is_valid_mac_string(const std::string& mac_str) {
    if (mac_str.length() != 17) return false;
    for (std::size_t i = 0; i < mac_str.length(); ++i) {
        if (i % 3 == 2) {
            if (mac_str[i] != ':') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(mac_str[i]))) {
            return false;
        }
    }
    return true;
}

std::string trim(const std::string& str) {
    const char* whitespace = " \t\n\r\f\v";
    size_t first = str.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

} // namespace utils
} // namespace ovslink
