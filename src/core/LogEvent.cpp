#include "eventlog/LogEvent.hpp"

#include <cctype>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace eventlog {

namespace {

constexpr const char* kKeyDate = "d";
constexpr const char* kKeyLevel = "l";
constexpr const char* kKeyTopic = "t";
constexpr const char* kKeyMessage = "m";
constexpr const char* kKeySource = "s";
constexpr const char* kKeyActor = "a";

// Missing string fields decode as empty; present non-string fields reject the record.
bool readString(const json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.clear();
        return true;
    }
    if (!it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

} // namespace

const char* levelName(Level level) {
    switch (level) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "INFO";
}

std::optional<Level> parseLevel(std::string_view name) {
    std::string upper;
    upper.reserve(name.size());
    for (unsigned char ch : name) upper.push_back(static_cast<char>(std::toupper(ch)));
    if (upper == "TRACE") return Level::Trace;
    if (upper == "DEBUG") return Level::Debug;
    if (upper == "INFO") return Level::Info;
    if (upper == "WARN") return Level::Warn;
    if (upper == "ERROR") return Level::Error;
    if (upper == "FATAL") return Level::Fatal;
    return std::nullopt;
}

Timestamp now() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
}

int64_t toEpochMs(Timestamp ts) {
    return static_cast<int64_t>(ts.time_since_epoch().count());
}

Timestamp fromEpochMs(int64_t ms) {
    return Timestamp(std::chrono::milliseconds(ms));
}

std::string LogEvent::toString() const {
    std::ostringstream os;
    os << levelName(level) << ", " << toEpochMs(timestamp) << ", ";
    if (!actor.empty()) os << "{" << actor << "} ";
    os << topic << ", " << message;
    if (!source.empty()) os << " [" << source << "]";
    return os.str();
}

LogEvent makeEvent(Level level, std::string topic, std::string message,
                   std::string actor, std::string source) {
    LogEvent e;
    e.timestamp = now();
    e.level = level;
    e.topic = std::move(topic);
    e.message = std::move(message);
    e.actor = std::move(actor);
    e.source = std::move(source);
    return e;
}

std::string encodeEvent(const LogEvent& event) {
    json j = {
        {kKeyDate, toEpochMs(event.timestamp)},
        {kKeyLevel, levelName(event.level)},
        {kKeyTopic, event.topic},
        {kKeyMessage, event.message}
    };
    if (!event.source.empty()) j[kKeySource] = event.source;
    if (!event.actor.empty()) j[kKeyActor] = event.actor;
    // Compact dump escapes control characters, so the record stays on one line.
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<LogEvent> decodeEvent(std::string_view record) {
    if (record.empty()) return std::nullopt;
    auto j = json::parse(record.begin(), record.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    auto date = j.find(kKeyDate);
    if (date == j.end() || !date->is_number_integer()) return std::nullopt;

    auto levelIt = j.find(kKeyLevel);
    if (levelIt == j.end() || !levelIt->is_string()) return std::nullopt;
    auto level = parseLevel(levelIt->get<std::string>());
    if (!level) return std::nullopt;

    LogEvent e;
    e.timestamp = fromEpochMs(date->get<int64_t>());
    e.level = *level;
    if (!readString(j, kKeyTopic, e.topic)) return std::nullopt;
    if (!readString(j, kKeyMessage, e.message)) return std::nullopt;
    if (!readString(j, kKeySource, e.source)) return std::nullopt;
    if (!readString(j, kKeyActor, e.actor)) return std::nullopt;
    return e;
}

} // namespace eventlog
