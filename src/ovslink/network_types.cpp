#include "ovslink/network_types.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

namespace ovslink {

bool NetworkState::save(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    nlohmann::json doc = {{"ovs_port", ovs_port}};
    file << doc.dump(2) << "\n";
    return static_cast<bool>(file);
}

std::optional<NetworkState> NetworkState::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return std::nullopt;
    }
    nlohmann::json doc = nlohmann::json::parse(file, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::nullopt;
    }
    auto it = doc.find("ovs_port");
    if (it == doc.end() || !it->is_string()) {
        return std::nullopt;
    }
    NetworkState state;
    state.ovs_port = it->get<std::string>();
    return state;
}

} // namespace ovslink
