#include "eventlog/algorithms/EventFilter.hpp"
#include "TestSupport.hpp"

#include <iostream>

using namespace eventlog;
using eventlog::algo::EventFilter;
using eventlog::algo::EventType;
using testsupport::expect;

int main() {
    const LogEvent alice = testsupport::eventAt(1, "Password changed", "alice", Level::Info, "auth");
    const LogEvent alicia = testsupport::eventAt(2, "Login failed", "Alicia", Level::Warn, "login");
    const LogEvent system = testsupport::eventAt(3, "Cache flushed", "", Level::Error, "maintenance");

    // No criteria matches everything
    EventFilter any(std::nullopt, "", "", EventType::Both);
    expect(any.matches(alice) && any.matches(alicia) && any.matches(system), "empty filter matches all");

    // Level keeps events at least as severe as the minimum
    EventFilter warnUp(Level::Warn, "", "", EventType::Both);
    expect(!warnUp.matches(alice) && warnUp.matches(alicia) && warnUp.matches(system), "minimum level");

    // A valid pattern is searched (substring) against the actor
    EventFilter pattern(std::nullopt, "^ali", "", EventType::Both);
    expect(pattern.usesPattern(), "valid regex compiled");
    expect(pattern.matches(alice) && !pattern.matches(alicia), "regex is case-sensitive find");
    EventFilter partial(std::nullopt, "lic", "", EventType::Both);
    expect(partial.matches(alice) && partial.matches(alicia), "regex find matches substrings");

    // An invalid pattern falls back to case-insensitive equality
    const LogEvent bracket = testsupport::eventAt(4, "odd name", "[admin", Level::Info);
    EventFilter literal(std::nullopt, "[ADMIN", "", EventType::Both);
    expect(!literal.usesPattern(), "invalid regex not compiled");
    expect(literal.matches(bracket) && !literal.matches(alice), "literal fallback is exact, case-insensitive");

    // Text matches the message, then the topic
    EventFilter inMessage(std::nullopt, "", "PASSWORD", EventType::Both);
    expect(inMessage.matches(alice) && !inMessage.matches(alicia), "text in message");
    EventFilter inTopic(std::nullopt, "", "Mainten", EventType::Both);
    expect(inTopic.matches(system) && !inTopic.matches(alice), "text in topic");

    // User/System split
    EventFilter users(std::nullopt, "", "", EventType::User);
    EventFilter systems(std::nullopt, "", "", EventType::System);
    expect(users.matches(alice) && !users.matches(system), "user events have an actor");
    expect(systems.matches(system) && !systems.matches(alice), "system events have no actor");

    // All criteria combine
    EventFilter combined(Level::Info, "alice", "changed", EventType::User);
    expect(combined.matches(alice) && !combined.matches(alicia) && !combined.matches(system), "combined filter");

    expect(algo::parseEventType("SYSTEM") == EventType::System, "parse event type");
    expect(algo::parseEventType("") == EventType::Both, "empty event type means both");
    expect(!algo::parseEventType("robots"), "unknown event type rejected");

    std::cout << "All EventFilter tests passed." << std::endl;
    return 0;
}
