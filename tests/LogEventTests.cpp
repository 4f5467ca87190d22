#include "eventlog/EventJson.hpp"
#include "eventlog/LogEvent.hpp"
#include "TestSupport.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

using namespace eventlog;
using testsupport::expect;
using json = nlohmann::json;

namespace {

bool rejected(const json& j) {
    try {
        eventFromJson(j);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    // Severity order: least to most severe
    expect(Level::Trace < Level::Debug && Level::Debug < Level::Info && Level::Info < Level::Warn &&
           Level::Warn < Level::Error && Level::Error < Level::Fatal, "level ordering");
    expect(parseLevel("warn") == Level::Warn, "parseLevel is case-insensitive");
    expect(!parseLevel("LOUD"), "unknown level rejected");

    // Round trip of a user event
    LogEvent user = testsupport::eventAt(1700000000123, "password changed", "alice", Level::Warn, "auth");
    auto decoded = decodeEvent(encodeEvent(user));
    expect(decoded.has_value(), "user event decodes");
    expect(*decoded == user, "user event round-trips");

    // System event keeps an empty actor
    LogEvent system = testsupport::eventAt(1700000000999, "startup", "", Level::Info, "boot");
    system.source.clear();
    auto sysDecoded = decodeEvent(encodeEvent(system));
    expect(sysDecoded && *sysDecoded == system && sysDecoded->isSystemEvent(), "system event round-trips");

    // Control characters stay escaped so a record is one line
    LogEvent multiline = testsupport::eventAt(42, "line one\nline two\r\n\ttabbed \"quoted\"", "bob");
    const std::string encoded = encodeEvent(multiline);
    expect(encoded.find('\n') == std::string::npos && encoded.find('\r') == std::string::npos, "record has no newlines");
    auto mlDecoded = decodeEvent(encoded);
    expect(mlDecoded && mlDecoded->message == multiline.message, "multiline message round-trips");

    // Invalid UTF-8 is replaced rather than throwing
    LogEvent binary = testsupport::eventAt(7, std::string("bad \xff\xfe bytes"));
    const std::string binEncoded = encodeEvent(binary);
    auto binDecoded = decodeEvent(binEncoded);
    expect(binDecoded.has_value(), "invalid utf-8 message still encodes to a readable record");
    expect(binDecoded->timestamp == binary.timestamp, "timestamp survives lossy message");

    // Corrupt and foreign records are skipped, never thrown
    expect(!decodeEvent(""), "empty record");
    expect(!decodeEvent("not json at all"), "garbage record");
    expect(!decodeEvent("{\"d\":12"), "truncated record");
    expect(!decodeEvent("[1,2,3]"), "non-object record");
    expect(!decodeEvent("{\"l\":\"INFO\",\"m\":\"no date\"}"), "missing timestamp");
    expect(!decodeEvent("{\"d\":\"yesterday\",\"l\":\"INFO\"}"), "non-numeric timestamp");
    expect(!decodeEvent("{\"d\":5,\"l\":\"CHATTY\"}"), "unknown level");
    expect(!decodeEvent("{\"d\":5,\"l\":\"INFO\",\"m\":17}"), "non-string message");

    // Older records without optional fields still decode
    auto minimal = decodeEvent("{\"d\":5,\"l\":\"ERROR\"}");
    expect(minimal && minimal->level == Level::Error && minimal->message.empty() && minimal->actor.empty(),
           "minimal record decodes with empty fields");

    expect(user.toString().find("alice") != std::string::npos, "toString names the actor");

    // API JSON form
    json wire = toJson(user);
    expect(wire["timestamp"] == 1700000000123 && wire["level"] == "WARN" && wire["actor"] == "alice", "toJson fields");
    expect(eventFromJson(wire) == user, "toJson output is accepted back");

    LogEvent stamped = eventFromJson(json{{"message", "hello"}});
    expect(stamped.level == Level::Info && stamped.isSystemEvent(), "level defaults to INFO");
    expect(toEpochMs(stamped.timestamp) > 0, "missing timestamp stamped now");

    expect(rejected(json::array()), "non-object rejected");
    expect(rejected(json{{"level", "INFO"}}), "missing message rejected");
    expect(rejected(json{{"message", 5}}), "non-string message rejected");
    expect(rejected(json{{"message", "x"}, {"timestamp", "yesterday"}}), "non-integer timestamp rejected");
    expect(rejected(json{{"message", "x"}, {"timestamp", 1.5}}), "fractional timestamp rejected");
    expect(rejected(json{{"message", "x"}, {"level", "LOUD"}}), "unknown level rejected");
    expect(rejected(json{{"message", "x"}, {"level", 3}}), "non-string level rejected");
    expect(rejected(json{{"message", "x"}, {"actor", true}}), "non-string actor rejected");

    std::cout << "All LogEvent tests passed." << std::endl;
    return 0;
}
