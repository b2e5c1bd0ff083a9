#ifndef OVSLINK_NETWORK_TYPES_HPP
#define OVSLINK_NETWORK_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <optional>

namespace ovslink {

// Device name the provisioned port is given inside the namespace.
constexpr const char* kDefaultDevice = "eth0";

// Number of random characters appended to the veth prefix.
constexpr std::size_t kPortNameSuffixLength = 7;

struct NetworkConfig {
    std::string bridge;
    std::string veth_prefix;
    uint32_t mtu = 1500;
    std::string mac_address;   // Empty means keep the kernel assigned MAC
    std::string address;       // CIDR, e.g. 10.0.0.5/24
    std::string ipv6_address;  // CIDR, optional
    std::string gateway;
    std::string ipv6_gateway;
};

// Handed from the attachment stage (host side) to the finalization stage
// (inside the namespace), possibly across processes.
struct NetworkState {
    std::string ovs_port;

    // Writes {"ovs_port": "..."} to `filename`. Returns false if the file cannot be written.
    bool save(const std::string& filename) const;

    // Returns std::nullopt if the file is missing or not a valid state document.
    static std::optional<NetworkState> load(const std::string& filename);
};

} // namespace ovslink

#endif // OVSLINK_NETWORK_TYPES_HPP
