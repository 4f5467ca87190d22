#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace eventlog {

struct Settings {
    static constexpr int kMinimumMaxEvents = 100;

    int maxEvents = 100 * 1000;
    int64_t maxAgeMs = int64_t{4} * 7 * 24 * 60 * 60 * 1000; // 4 weeks; 0 keeps everything
    int64_t flushIdleIntervalMs = 1000;
    // Per-cycle writer tracing, logged at info level so it shows at the default threshold.
    bool debug = false;

    // Age-based purge: once the oldest record is too old, remove `agePurgeBatchSize`
    // per cycle while more than `agePurgeBacklogThreshold` records are stored, else one.
    std::size_t agePurgeBacklogThreshold = 50 * 1000;
    std::size_t agePurgeBatchSize = 500;

    std::size_t queueCapacity = 50 * 1000;
    std::size_t maxRecordLength = 100 * 1024;
    int64_t transactionGoalMs = 2049;
    std::size_t transactionMinSize = 5;
    std::size_t trickleThreshold = 5;

    int64_t backpressureTimeoutMs = 30 * 1000;
    int64_t backpressurePollMs = 100;
    int64_t closeWaitMs = 60 * 1000;
    int64_t closePollMs = 1000;
    int64_t closeDrainMs = 30 * 1000;

    // Overlays EVENTLOG_* environment variables on top of `base`, or on the defaults.
    static Settings fromEnvironment(Settings base);
    static Settings fromEnvironment();

    std::string describe() const;
};

} // namespace eventlog
