#include "eventlog/Settings.hpp"
#include "TestSupport.hpp"

#include <cstdlib>
#include <iostream>

using eventlog::Settings;
using testsupport::CapturedLog;
using testsupport::expect;

namespace {

void clearEnvironment() {
    for (const char* name : {"EVENTLOG_MAX_EVENTS", "EVENTLOG_MAX_AGE_MS", "EVENTLOG_FLUSH_IDLE_MS",
                             "EVENTLOG_QUEUE_CAPACITY", "EVENTLOG_AGE_PURGE_BATCH",
                             "EVENTLOG_AGE_PURGE_THRESHOLD", "EVENTLOG_DEBUG"}) {
        unsetenv(name);
    }
}

void testDefaultsWithoutEnvironment() {
    clearEnvironment();
    const Settings s = Settings::fromEnvironment();
    expect(s.maxEvents == 100 * 1000, "default maxEvents");
    expect(s.queueCapacity == 50 * 1000, "default queue capacity");
    expect(!s.debug, "debug off by default");
}

void testOverlay() {
    clearEnvironment();
    setenv("EVENTLOG_MAX_EVENTS", "500", 1);
    setenv("EVENTLOG_QUEUE_CAPACITY", "64", 1);
    setenv("EVENTLOG_DEBUG", "1", 1);
    Settings base;
    base.maxAgeMs = 0;
    const Settings s = Settings::fromEnvironment(base);
    expect(s.maxEvents == 500, "maxEvents from environment");
    expect(s.queueCapacity == 64, "queue capacity from environment");
    expect(s.debug, "debug from environment");
    expect(s.maxAgeMs == 0, "unset variables keep the base value");
    expect(s.describe().find("maxEvents=500") != std::string::npos, "describe shows overrides");
    clearEnvironment();
}

void testMalformedValuesIgnored() {
    clearEnvironment();
    CapturedLog captured;
    setenv("EVENTLOG_MAX_EVENTS", "4294967296", 1);
    setenv("EVENTLOG_QUEUE_CAPACITY", "12abc", 1);
    setenv("EVENTLOG_FLUSH_IDLE_MS", "-5", 1);
    const Settings s = Settings::fromEnvironment();
    expect(s.maxEvents == 100 * 1000, "value beyond the field's range keeps the default");
    expect(s.queueCapacity == 50 * 1000, "trailing junk keeps the default");
    expect(s.flushIdleIntervalMs == 1000, "negative value keeps the default");
    expect(captured.count(eventlog::log::Level::Warn, "ignoring malformed EVENTLOG_MAX_EVENTS") == 1, "range warning logged");
    expect(captured.count(eventlog::log::Level::Warn, "ignoring malformed") == 3, "each malformed value warned once");

    setenv("EVENTLOG_MAX_EVENTS", "99999999999999999999", 1);
    expect(Settings::fromEnvironment().maxEvents == 100 * 1000, "value beyond long long keeps the default");
    clearEnvironment();
}

} // namespace

int main() {
    testDefaultsWithoutEnvironment();
    testOverlay();
    testMalformedValuesIgnored();

    std::cout << "All Settings tests passed." << std::endl;
    return 0;
}
