#include "eventlog/algorithms/EventFilter.hpp"

#include <sstream>
#include "eventlog/Log.hpp"
#include "eventlog/TextMatch.hpp"

namespace eventlog::algo {

const char* eventTypeName(EventType type) {
    switch (type) {
        case EventType::User: return "User";
        case EventType::System: return "System";
        case EventType::Both: return "Both";
    }
    return "Both";
}

std::optional<EventType> parseEventType(const std::string& name) {
    if (TextMatch::equalsIgnoreCase(name, "user")) return EventType::User;
    if (TextMatch::equalsIgnoreCase(name, "system")) return EventType::System;
    if (name.empty() || TextMatch::equalsIgnoreCase(name, "both")) return EventType::Both;
    return std::nullopt;
}

EventFilter::EventFilter(std::optional<Level> minimumLevel,
                         std::string username,
                         std::string text,
                         EventType eventType)
    : minimumLevel_(minimumLevel),
      username_(std::move(username)),
      text_(std::move(text)),
      textLower_(TextMatch::lowercase(text_)),
      eventType_(eventType) {
    if (!username_.empty()) {
        try {
            pattern_.emplace(username_, std::regex::ECMAScript);
        } catch (const std::regex_error&) {
            log::trace("EventFilter", "invalid regex syntax for " + username_ + ", reverting to plaintext search");
        }
    }
}

bool EventFilter::matches(const LogEvent& event) const {
    if (minimumLevel_ && event.level < *minimumLevel_) return false;
    if (!matchesIdentity(event)) return false;
    if (!matchesText(event)) return false;

    switch (eventType_) {
        case EventType::System:
            return event.actor.empty();
        case EventType::User:
            return !event.actor.empty();
        case EventType::Both:
            break;
    }
    return true;
}

bool EventFilter::matchesIdentity(const LogEvent& event) const {
    if (pattern_) {
        return std::regex_search(event.actor, *pattern_);
    }
    if (!username_.empty()) {
        return TextMatch::equalsIgnoreCase(event.actor, username_);
    }
    return true;
}

bool EventFilter::matchesText(const LogEvent& event) const {
    if (textLower_.empty()) return true;
    if (TextMatch::containsLowered(event.message, textLower_)) return true;
    return TextMatch::containsLowered(event.topic, textLower_);
}

std::string EventFilter::describe() const {
    std::ostringstream os;
    os << "minimumLevel=" << (minimumLevel_ ? levelName(*minimumLevel_) : "any");
    if (!username_.empty()) os << ", username=" << username_;
    if (!text_.empty()) os << ", text=" << text_;
    os << ", type=" << eventTypeName(eventType_);
    return os.str();
}

} // namespace eventlog::algo
