#pragma once

#include <optional>
#include <regex>
#include <string>
#include "eventlog/LogEvent.hpp"

namespace eventlog::algo {

enum class EventType { User, System, Both };

const char* eventTypeName(EventType type);
std::optional<EventType> parseEventType(const std::string& name);

// Predicate built once per search and applied to every decoded event.
//
// Precedence: level, then identity (regex on the actor when `username` compiles,
// otherwise case-insensitive equality), then text (message, else topic), then
// the user/system split.
class EventFilter {
public:
    EventFilter(std::optional<Level> minimumLevel,
                std::string username,
                std::string text,
                EventType eventType);

    bool matches(const LogEvent& event) const;

    bool usesPattern() const { return pattern_.has_value(); }
    std::string describe() const;

private:
    std::optional<Level> minimumLevel_;
    std::string username_;
    std::string text_;
    std::string textLower_;
    EventType eventType_;
    std::optional<std::regex> pattern_;

    bool matchesIdentity(const LogEvent& event) const;
    bool matchesText(const LogEvent& event) const;
};

} // namespace eventlog::algo
