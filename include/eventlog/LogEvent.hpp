#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace eventlog {

// Ordered least to most severe.
enum class Level : uint8_t { Trace = 0, Debug, Info, Warn, Error, Fatal };

const char* levelName(Level level);
std::optional<Level> parseLevel(std::string_view name);

using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock, std::chrono::milliseconds>;

Timestamp now();
int64_t toEpochMs(Timestamp ts);
Timestamp fromEpochMs(int64_t ms);

struct LogEvent {
    Timestamp timestamp{};
    Level level = Level::Info;
    std::string actor;   // empty for system events
    std::string topic;
    std::string message;
    std::string source;

    bool isSystemEvent() const { return actor.empty(); }

    bool operator==(const LogEvent& other) const {
        return timestamp == other.timestamp && level == other.level && actor == other.actor &&
               topic == other.topic && message == other.message && source == other.source;
    }
    bool operator!=(const LogEvent& other) const { return !(*this == other); }

    // Human readable one-liner, used in warnings about dropped events.
    std::string toString() const;
};

LogEvent makeEvent(Level level, std::string topic, std::string message,
                   std::string actor = "", std::string source = "");

// Single-line record form persisted in the record store.
std::string encodeEvent(const LogEvent& event);

// Returns nullopt for anything that is not a well-formed record; never throws.
std::optional<LogEvent> decodeEvent(std::string_view record);

} // namespace eventlog
