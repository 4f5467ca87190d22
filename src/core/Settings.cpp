#include "eventlog/Settings.hpp"

#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>
#include "eventlog/Log.hpp"

namespace eventlog {

namespace {

template <typename T>
void readNumber(const char* name, T& target, long long minimum) {
    const char* env = std::getenv(name);
    if (!env) return;
    try {
        size_t pos = 0;
        long long v = std::stoll(env, &pos);
        if (pos != std::string(env).size() || v < minimum) throw std::invalid_argument("out of range");
        if (static_cast<unsigned long long>(v) > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
            throw std::out_of_range("too large");
        }
        target = static_cast<T>(v);
    } catch (const std::exception&) {
        log::warn("Settings", std::string("ignoring malformed ") + name + "=" + env);
    }
}

} // namespace

Settings Settings::fromEnvironment() {
    return fromEnvironment(Settings{});
}

Settings Settings::fromEnvironment(Settings base) {
    readNumber("EVENTLOG_MAX_EVENTS", base.maxEvents, 0);
    readNumber("EVENTLOG_MAX_AGE_MS", base.maxAgeMs, 0);
    readNumber("EVENTLOG_FLUSH_IDLE_MS", base.flushIdleIntervalMs, 0);
    readNumber("EVENTLOG_QUEUE_CAPACITY", base.queueCapacity, 1);
    readNumber("EVENTLOG_AGE_PURGE_BATCH", base.agePurgeBatchSize, 1);
    readNumber("EVENTLOG_AGE_PURGE_THRESHOLD", base.agePurgeBacklogThreshold, 0);
    if (const char* envDebug = std::getenv("EVENTLOG_DEBUG")) {
        std::string v(envDebug);
        base.debug = !(v.empty() || v == "0" || v == "false" || v == "off");
    }
    return base;
}

std::string Settings::describe() const {
    std::ostringstream os;
    os << "maxEvents=" << maxEvents
       << " maxAgeMs=" << maxAgeMs
       << " flushIdleMs=" << flushIdleIntervalMs
       << " queueCapacity=" << queueCapacity
       << " agePurge=" << agePurgeBatchSize << "@" << agePurgeBacklogThreshold
       << " debug=" << (debug ? "on" : "off");
    return os.str();
}

} // namespace eventlog
