#include "eventlog/Log.hpp"

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <utility>

namespace eventlog::log {

namespace {

Level levelFromEnv() {
    const char* env = std::getenv("EVENTLOG_LOG_LEVEL");
    if (!env) return Level::Info;
    std::string v;
    for (const char* p = env; *p; ++p) v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*p))));
    if (v == "trace") return Level::Trace;
    if (v == "debug") return Level::Debug;
    if (v == "warn") return Level::Warn;
    if (v == "error") return Level::Error;
    return Level::Info;
}

std::atomic<int> gThreshold{static_cast<int>(levelFromEnv())};

std::mutex& sinkMutex() {
    static std::mutex m;
    return m;
}

Sink& sinkSlot() {
    static Sink s;
    return s;
}

} // namespace

void setThreshold(Level level) {
    gThreshold.store(static_cast<int>(level));
}

Level threshold() {
    return static_cast<Level>(gThreshold.load());
}

void setSink(Sink sink) {
    std::lock_guard<std::mutex> lk(sinkMutex());
    sinkSlot() = std::move(sink);
}

const char* levelName(Level level) {
    switch (level) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
    }
    return "INFO";
}

void write(Level level, std::string_view component, const std::string& message) {
    if (static_cast<int>(level) < gThreshold.load()) return;
    std::lock_guard<std::mutex> lk(sinkMutex());
    if (sinkSlot()) {
        sinkSlot()(level, component, message);
        return;
    }
    std::cerr << component << ": ";
    if (level >= Level::Warn) std::cerr << levelName(level) << " ";
    std::cerr << message << "\n";
}

} // namespace eventlog::log
