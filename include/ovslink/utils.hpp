#ifndef OVSLINK_UTILS_HPP
#define OVSLINK_UTILS_HPP

#include <string>    // For std::string
#include <optional>  // For std::optional
#include <stdexcept> // For std::invalid_argument, std::out_of_range (used in .cpp)
#include <sstream>   // For std::stringstream
#include <iomanip>   // For std::hex, std::setfill, std::setw
#include <cstdint>   // For uint8_t
#include <cstddef>   // For std::size_t

namespace ovslink {
namespace utils {

// Safely converts a string to an int.
// Returns std::nullopt if conversion fails.
std::optional<int> safe_stoi(const std::string& str);

// Returns prefix followed by `length` random lower-case hex characters.
// Throws std::runtime_error if the system random source cannot be read.
std::string generate_random_name(const std::string& prefix, std::size_t length);

// Accepts "aa:bb:cc:dd:ee:ff" (either case).
bool is_valid_mac_string(const std::string& mac_str);

// Removes leading and trailing whitespace.
std::string trim(const std::string& str);

template <typename TContainer>
std::string to_hex_string(const TContainer& container, char delimiter = '\0') {
    std::stringstream ss;
    bool first = true;
    for (const auto& byte_val : container) {
        if (!first && delimiter != '\0') {
            ss << delimiter;
        }
        // Cast through uint8_t so a signed char container does not sign extend.
        ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(static_cast<uint8_t>(byte_val));
        first = false;
    }
    return ss.str();
}

} // namespace utils
} // namespace ovslink

#endif // OVSLINK_UTILS_HPP
