#include "eventlog/EventJson.hpp"

#include <stdexcept>

using json = nlohmann::json;

namespace eventlog {

namespace {

std::string optionalString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    if (!it->is_string()) throw std::invalid_argument(std::string("'") + key + "' must be a string");
    return it->get<std::string>();
}

} // namespace

json toJson(const LogEvent& event) {
    json j = {
        {"timestamp", toEpochMs(event.timestamp)},
        {"level", levelName(event.level)},
        {"topic", event.topic},
        {"message", event.message},
        {"source", event.source},
        {"actor", event.actor}
    };
    return j;
}

LogEvent eventFromJson(const json& j) {
    if (!j.is_object()) throw std::invalid_argument("event must be a JSON object");
    auto message = j.find("message");
    if (message == j.end() || !message->is_string()) throw std::invalid_argument("missing string field 'message'");

    LogEvent e;
    e.timestamp = now();
    auto ts = j.find("timestamp");
    if (ts != j.end()) {
        if (!ts->is_number_integer()) throw std::invalid_argument("'timestamp' must be epoch milliseconds");
        e.timestamp = fromEpochMs(ts->get<int64_t>());
    }

    const std::string levelText = optionalString(j, "level");
    if (!levelText.empty()) {
        auto level = parseLevel(levelText);
        if (!level) throw std::invalid_argument("unknown level '" + levelText + "'");
        e.level = *level;
    }
    e.message = message->get<std::string>();
    e.topic = optionalString(j, "topic");
    e.actor = optionalString(j, "actor");
    e.source = optionalString(j, "source");
    return e;
}

} // namespace eventlog
