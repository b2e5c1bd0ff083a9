#ifndef OVSLINK_COMMAND_DISPATCHER_HPP
#define OVSLINK_COMMAND_DISPATCHER_HPP

#include <functional> // For std::function
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace ovslink {

// Exit codes returned by command handlers.
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// Maps command words to handlers. The longest registered prefix of the
// input words wins; the remaining words are passed as arguments.
class CommandDispatcher {
public:
    using CommandHandler = std::function<int(const std::vector<std::string>& args, std::ostream& out)>;

    void register_command(const std::vector<std::string>& command_parts, const std::string& usage,
                          CommandHandler handler) {
        if (command_parts.empty()) return;
        commands_[command_parts] = Entry{usage, std::move(handler)};
    }

    int dispatch(const std::vector<std::string>& input_parts, std::ostream& out) const {
        if (input_parts.empty()) {
            out << "Error: Empty command." << std::endl;
            print_help(out);
            return kExitUsage;
        }

        std::vector<std::string> best_match_command_key;
        const Entry* best_entry = nullptr;

        for (auto const& [registered_command_key, entry] : commands_) {
            if (input_parts.size() >= registered_command_key.size()) {
                bool prefix_match = true;
                for (std::size_t i = 0; i < registered_command_key.size(); ++i) {
                    if (input_parts[i] != registered_command_key[i]) {
                        prefix_match = false;
                        break;
                    }
                }
                if (prefix_match) {
                    if (best_entry == nullptr || registered_command_key.size() > best_match_command_key.size()) {
                        best_match_command_key = registered_command_key;
                        best_entry = &entry;
                    }
                }
            }
        }

        if (best_entry) {
            std::vector<std::string> args(input_parts.begin() + best_match_command_key.size(), input_parts.end());
            return best_entry->handler(args, out);
        }

        out << "Error: Unknown command: " << input_parts.front() << ". Type 'help' for available commands."
            << std::endl;
        return kExitUsage;
    }

    void print_help(std::ostream& out) const {
        out << "Commands:" << std::endl;
        for (auto const& [command_key, entry] : commands_) {
            std::string name;
            for (const auto& part : command_key) {
                if (!name.empty()) name += " ";
                name += part;
            }
            out << "  " << name;
            if (!entry.usage.empty()) {
                out << " " << entry.usage;
            }
            out << std::endl;
        }
    }

private:
    struct Entry {
        std::string usage;
        CommandHandler handler;
    };

    std::map<std::vector<std::string>, Entry> commands_;
};

} // namespace ovslink

#endif // OVSLINK_COMMAND_DISPATCHER_HPP
