#include "ovslink/change_notifier.hpp"

#include <stdexcept>

namespace ovslink {

namespace {

// Helper for std::visit with a set of lambdas
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string first_string_param(const ovsdb::Json& params) {
    if (params.is_array() && !params.empty() && params[0].is_string()) {
        return params[0].get<std::string>();
    }
    return "";
}

} // namespace

ChangeNotifier::ChangeNotifier(TableCache& cache, Logger& logger)
    : cache_(cache), logger_(logger) {}

std::optional<NotificationEvent> ChangeNotifier::from_message(const std::string& method, const ovsdb::Json& params) {
    if (method == "update") {
        // params: [<json-value monitor id>, <table-updates>]
        if (!params.is_array() || params.size() != 2) {
            throw std::runtime_error("update notification must carry two params: " + params.dump());
        }
        return NotificationEvent{UpdatedEvent{params[0], ovsdb::parse_table_updates(params[1])}};
    }
    if (method == "locked") {
        return NotificationEvent{LockedEvent{first_string_param(params)}};
    }
    if (method == "stolen") {
        return NotificationEvent{StolenEvent{first_string_param(params)}};
    }
    if (method == "echo") {
        return NotificationEvent{EchoEvent{params}};
    }
    return std::nullopt;
}

void ChangeNotifier::handle(const NotificationEvent& event) {
    std::visit(overloaded{
        [this](const UpdatedEvent& updated) {
            cache_.apply_update(updated.updates);
            updates_applied_++;
            logger_.debug("ChangeNotifier", "Applied update touching " + std::to_string(updated.updates.size()) + " tables");
        },
        [](const LockedEvent&) {},
        [](const StolenEvent&) {},
        [](const EchoEvent&) {},
    }, event);
}

void ChangeNotifier::on_message(const std::string& method, const ovsdb::Json& params) {
    std::optional<NotificationEvent> event;
    try {
        event = from_message(method, params);
    } catch (const std::exception& ex) {
        logger_.error("ChangeNotifier", std::string("Dropping malformed ") + method + " notification: " + ex.what());
        return;
    }
    if (!event) {
        logger_.debug("ChangeNotifier", "Ignoring unknown notification method " + method);
        return;
    }
    handle(event.value());
}

} // namespace ovslink
