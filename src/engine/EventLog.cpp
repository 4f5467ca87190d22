//EventLog.cpp
#include "EventLog.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include "eventlog/Log.hpp"

namespace eventlog {

namespace {

constexpr const char* kComponent = "EventLog";
constexpr std::chrono::milliseconds kSleepSlice{50};
constexpr std::size_t kHealthCountSlack = 5000;

using SteadyClock = std::chrono::steady_clock;

int64_t nowMs() {
    return toEpochMs(now());
}

std::string compactDuration(int64_t ms) {
    if (ms < 0) return "n/a";
    if (ms < 1000) return std::to_string(ms) + "ms";
    std::ostringstream os;
    int64_t secs = ms / 1000;
    const int64_t days = secs / 86400;
    secs %= 86400;
    const int64_t hours = secs / 3600;
    secs %= 3600;
    const int64_t minutes = secs / 60;
    secs %= 60;
    if (days) os << days << "d";
    if (hours) os << hours << "h";
    if (minutes) os << minutes << "m";
    if (secs || (!days && !hours && !minutes)) os << secs << "s";
    return os.str();
}

int64_t elapsedMs(SteadyClock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start).count();
}

} // namespace

const char* statusName(Status status) {
    switch (status) {
        case Status::New: return "NEW";
        case Status::Opening: return "OPENING";
        case Status::Open: return "OPEN";
        case Status::Closed: return "CLOSED";
    }
    return "NEW";
}

const char* healthStatusName(HealthStatus status) {
    return status == HealthStatus::Warn ? "WARN" : "CAUTION";
}

// -----------------------------------------------------------
// CTOR/DTOR
// -----------------------------------------------------------
EventLog::EventLog(const Settings& settings, std::shared_ptr<RecordStore> store)
    : settings_(settings),
      store_(std::move(store)),
      queue_(settings.queueCapacity),
      txnCalc_(std::chrono::milliseconds(settings.transactionGoalMs), settings.transactionMinSize, queue_.capacity()) {
    const auto startTime = SteadyClock::now();
    status_.store(Status::Opening);

    if (!store_) {
        throw std::invalid_argument("record store cannot be null");
    }

    if (settings_.maxEvents == 0) {
        log::info(kComponent, "maxEvents set to zero, clearing stored history; event log will remain closed");
        store_->clear();
        throw std::invalid_argument("maxEvents=0, will remain closed");
    }

    if (settings_.maxEvents < Settings::kMinimumMaxEvents) {
        log::warn(kComponent, "maxEvents less than required minimum of " + std::to_string(Settings::kMinimumMaxEvents) +
                                  ", resetting maxEvents=" + std::to_string(Settings::kMinimumMaxEvents));
        settings_.maxEvents = Settings::kMinimumMaxEvents;
    }

    // a store that cannot even report its size is unusable
    (void)store_->size();
    oldestMs_.store(readOldestTimestamp());
    lastFlushMs_.store(nowMs());

    status_.store(Status::Open);
    writerActive_.store(true);
    writer_ = std::thread([this]() { writerMain(); });

    log::info(kComponent, "open in " + compactDuration(elapsedMs(startTime)) + ", " + debugStats());
    log::debug(kComponent, "settings: " + settings_.describe());
}

EventLog::~EventLog() {
    close();
    if (writer_.joinable()) {
        writer_.join();
    }
}

// -----------------------------------------------------------
// PUBLIC: intake
// -----------------------------------------------------------
void EventLog::writeEvent(const LogEvent& event) {
    if (status_.load() != Status::Open) return;
    if (settings_.maxEvents <= 0) return;

    if (queue_.tryPush(event)) return;

    const auto start = SteadyClock::now();
    const auto poll = std::chrono::milliseconds(std::max<int64_t>(1, settings_.backpressurePollMs));
    bool success = false;
    while (!success && elapsedMs(start) < settings_.backpressureTimeoutMs && status_.load() == Status::Open) {
        std::this_thread::sleep_for(poll);
        success = queue_.tryPush(event);
    }
    if (!success) {
        droppedBackpressure_.fetch_add(1);
        log::warn(kComponent, "discarding event due to full write queue: " + event.toString());
    }
}

// -----------------------------------------------------------
// PUBLIC: search
// -----------------------------------------------------------
SearchResults EventLog::search(const SearchQuery& query) const {
    const auto startTime = SteadyClock::now();
    SearchResults results;

    const std::size_t maxReturned = std::min(query.maxCount, static_cast<std::size_t>(settings_.maxEvents));
    const algo::EventFilter filter(query.minimumLevel, query.username, query.text, query.eventType);

    try {
        const std::size_t eventsInStore = store_->size();
        auto cursor = store_->cursor();
        std::string record;
        while (status_.load() == Status::Open && results.events.size() < maxReturned && results.examined < eventsInStore) {
            if (!cursor->next(record)) break;
            ++results.examined;

            auto event = readEvent(record);
            if (event && filter.matches(*event)) {
                results.events.push_back(std::move(*event));
            }

            if (SteadyClock::now() - startTime > query.maxQueryTime) {
                results.timeExceeded = true;
                break;
            }
        }
    } catch (const std::exception& e) {
        log::error(kComponent, std::string("error reading record store during search: ") + e.what());
    }

    std::stable_sort(results.events.begin(), results.events.end(),
                     [](const LogEvent& a, const LogEvent& b) { return a.timestamp > b.timestamp; });
    results.elapsed = std::chrono::milliseconds(elapsedMs(startTime));

    if (log::threshold() <= log::Level::Trace) {
        std::ostringstream msg;
        msg << "dredged " << results.examined << " events to return " << results.events.size()
            << " events for query (" << filter.describe() << ", count=" << query.maxCount << ") in "
            << compactDuration(results.elapsed.count());
        if (results.timeExceeded) msg << " (maximum query time reached)";
        log::trace(kComponent, msg.str());
    }
    return results;
}

// -----------------------------------------------------------
// PUBLIC: status
// -----------------------------------------------------------
std::size_t EventLog::storedEventCount() const {
    try {
        return store_->size();
    } catch (const std::exception& e) {
        log::error(kComponent, std::string("error reading record store size: ") + e.what());
        return 0;
    }
}

std::size_t EventLog::pendingEventCount() const {
    return queue_.size();
}

std::optional<Timestamp> EventLog::oldestTimestamp() const {
    const int64_t ms = oldestMs_.load();
    if (ms == kUnknownTimestamp) return std::nullopt;
    return fromEpochMs(ms);
}

EventLogStats EventLog::stats() const {
    EventLogStats s;
    s.written = written_.load();
    s.purged = purged_.load();
    s.droppedOversize = droppedOversize_.load();
    s.droppedBackpressure = droppedBackpressure_.load();
    s.writeFailures = writeFailures_.load();
    s.abandonedAtClose = abandoned_.load();
    return s;
}

std::chrono::milliseconds EventLog::dirtyQueueTime() const {
    if (queue_.empty()) return std::chrono::milliseconds(0);
    return std::chrono::milliseconds(std::max<int64_t>(0, nowMs() - lastFlushMs_.load()));
}

std::vector<HealthRecord> EventLog::healthCheck() const {
    std::vector<HealthRecord> records;
    const Status current = status_.load();
    if (current != Status::Open) {
        records.push_back({HealthStatus::Warn, kComponent,
                           std::string("EventLog is not open, status is ") + statusName(current)});
        return records;
    }

    const std::size_t eventCount = storedEventCount();
    if (eventCount > static_cast<std::size_t>(settings_.maxEvents) + kHealthCountSlack) {
        records.push_back({HealthStatus::Caution, kComponent,
                           "Record count of " + std::to_string(eventCount) +
                               " records, is more than the configured maximum of " + std::to_string(settings_.maxEvents)});
    }

    const int64_t oldest = oldestMs_.load();
    if (settings_.maxAgeMs > 0 && oldest != kUnknownTimestamp) {
        const int64_t age = nowMs() - oldest;
        if (age > settings_.maxAgeMs) {
            records.push_back({HealthStatus::Caution, kComponent,
                               "Oldest record is " + compactDuration(age) + ", configured maximum is " +
                                   compactDuration(settings_.maxAgeMs)});
        }
    }
    return records;
}

std::string EventLog::debugStats() const {
    std::ostringstream os;
    const int64_t oldest = oldestMs_.load();
    os << "events=" << storedEventCount();
    os << ", oldestAge=" << (oldest == kUnknownTimestamp ? std::string("n/a") : compactDuration(nowMs() - oldest));
    os << ", maxEvents=" << settings_.maxEvents;
    os << ", maxAge=" << (settings_.maxAgeMs > 1 ? compactDuration(settings_.maxAgeMs) : std::string("none"));
    os << ", pending=" << pendingEventCount();
    return os.str();
}

std::string EventLog::sizeToDebugString() const {
    const std::size_t stored = storedEventCount();
    const double percentFull = settings_.maxEvents > 0
        ? static_cast<double>(stored) / static_cast<double>(settings_.maxEvents) * 100.0
        : 0.0;
    std::ostringstream os;
    os << stored << " / " << settings_.maxEvents << " (" << std::fixed << std::setprecision(3) << percentFull << "%)";
    return os.str();
}

// -----------------------------------------------------------
// PUBLIC: shutdown
// -----------------------------------------------------------
void EventLog::close() {
    Status expected = Status::Open;
    if (!status_.compare_exchange_strong(expected, Status::Closed)) {
        return;
    }

    try {
        log::debug(kComponent, "closing... (" + debugStats() + ")");

        { // wait for the writer to exit
            const auto start = SteadyClock::now();
            while (writerActive_.load() && elapsedMs(start) < settings_.closeWaitMs) {
                const int64_t remaining = settings_.closeWaitMs - elapsedMs(start);
                std::this_thread::sleep_for(std::chrono::milliseconds(
                    std::max<int64_t>(1, std::min(settings_.closePollMs, remaining))));
                if (writerActive_.load()) {
                    log::debug(kComponent, "waiting for writer thread to close...");
                }
            }
            if (writerActive_.load()) {
                log::warn(kComponent, "writer thread still active after " + compactDuration(settings_.closeWaitMs));
            }
        }

        if (!writerActive_.load()) {
            if (writer_.joinable()) writer_.join();
            const auto start = SteadyClock::now();
            while (!queue_.empty() && elapsedMs(start) < settings_.closeDrainMs) {
                flushQueue();
            }
        }

        const std::size_t remaining = queue_.size();
        if (remaining > 0) {
            abandoned_.fetch_add(remaining);
            log::warn(kComponent, "abandoning " + std::to_string(remaining) + " events waiting to be written to the record store");
        }

        log::debug(kComponent, "close completed (" + debugStats() + ")");
    } catch (const std::exception& e) {
        log::error(kComponent, std::string("error during close: ") + e.what());
    }
}

// -----------------------------------------------------------
// PRIVATE: writer thread
// -----------------------------------------------------------
void EventLog::writerMain() {
    log::debug(kComponent, "writer thread open");
    try {
        writerLoop();
    } catch (const std::exception& e) {
        log::error(kComponent, std::string("unexpected fatal error during event writing; writes to the record store are suspended: ") + e.what());
    }
    log::debug(kComponent, "writer thread exiting");
    writerActive_.store(false);
}

void EventLog::writerLoop() {
    while (status_.load() == Status::Open) {
        const auto loopStart = SteadyClock::now();
        const std::size_t writesDone = flushQueue();

        const std::size_t purgeCount = determineTailRemovalCount();
        std::size_t purgesDone = 0;
        if (purgeCount > 0) {
            const std::size_t removalCount = std::min(purgeCount, txnCalc_.transactionSize() + 1);
            try {
                purgesDone = store_->removeOldest(removalCount);
                purged_.fetch_add(purgesDone);
            } catch (const std::exception& e) {
                log::error(kComponent, std::string("error purging record store: ") + e.what());
            }
            oldestMs_.store(readOldestTimestamp());
        }

        const std::size_t totalWork = writesDone + purgesDone;
        if (totalWork < std::max<std::size_t>(1, settings_.trickleThreshold)) {
            if (settings_.debug) {
                log::info(kComponent, std::string(totalWork == 0 ? "no" : "minor") + " work on last cycle, sleeping for " +
                                           compactDuration(settings_.flushIdleIntervalMs) +
                                           " queue size=" + std::to_string(pendingEventCount()));
            }
            idleSleep();
        } else {
            const auto txnDuration = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - loopStart);
            txnCalc_.recordLastTransactionDuration(txnDuration);
            if (settings_.debug) {
                log::info(kComponent, "tick writes=" + std::to_string(writesDone) + ", purges=" + std::to_string(purgesDone) +
                                           ", queue=" + std::to_string(pendingEventCount()) +
                                           ", txnCalcSize=" + std::to_string(txnCalc_.transactionSize()) +
                                           ", txnDuration=" + std::to_string(txnDuration.count()));
            }
        }
    }
}

void EventLog::idleSleep() const {
    const auto deadline = SteadyClock::now() + std::chrono::milliseconds(std::max<int64_t>(1, settings_.flushIdleIntervalMs));
    while (status_.load() == Status::Open) {
        const auto current = SteadyClock::now();
        if (current >= deadline) break;
        std::this_thread::sleep_for(std::min<SteadyClock::duration>(deadline - current, kSleepSlice));
    }
}

std::size_t EventLog::flushQueue() {
    std::vector<LogEvent> batch;
    queue_.drainTo(batch, txnCalc_.transactionSize());
    if (!batch.empty()) {
        doWrite(batch);
        lastFlushMs_.store(nowMs());
    }
    return batch.size();
}

void EventLog::doWrite(const std::vector<LogEvent>& events) {
    std::vector<std::string> records;
    records.reserve(events.size());
    for (const auto& event : events) {
        std::string encoded = encodeEvent(event);
        if (encoded.size() >= settings_.maxRecordLength) {
            droppedOversize_.fetch_add(1);
            continue;
        }
        records.push_back(std::move(encoded));
    }
    if (records.empty()) return;

    try {
        store_->append(records);
        written_.fetch_add(records.size());
    } catch (const std::exception& e) {
        writeFailures_.fetch_add(1);
        log::error(kComponent, std::string("error writing to record store: ") + e.what());
        return;
    }

    // an empty store had no oldest record to cache
    if (oldestMs_.load() == kUnknownTimestamp) {
        oldestMs_.store(readOldestTimestamp());
    }
}

std::size_t EventLog::determineTailRemovalCount() const {
    const std::size_t currentItemCount = storedEventCount();

    // must keep at least one position populated
    if (currentItemCount <= 1) {
        return 0;
    }

    // purge excess events by count
    const auto maxEvents = static_cast<std::size_t>(settings_.maxEvents);
    if (currentItemCount > maxEvents) {
        return currentItemCount - maxEvents;
    }

    // purge the oldest record if its timestamp is missing or unreadable
    const int64_t oldest = oldestMs_.load();
    if (oldest == kUnknownTimestamp) {
        return 1;
    }

    // purge excess events by age
    if (settings_.maxAgeMs > 0 && nowMs() - oldest > settings_.maxAgeMs) {
        return currentItemCount > settings_.agePurgeBacklogThreshold
            ? std::max<std::size_t>(1, settings_.agePurgeBatchSize)
            : 1;
    }
    return 0;
}

int64_t EventLog::readOldestTimestamp() const {
    std::optional<std::string> record;
    try {
        record = store_->oldest();
    } catch (const std::exception& e) {
        log::error(kComponent, std::string("unexpected error attempting to determine oldest event timestamp: ") + e.what());
        return kUnknownTimestamp;
    }
    if (!record) return kUnknownTimestamp;
    auto event = readEvent(*record);
    return event ? toEpochMs(event->timestamp) : kUnknownTimestamp;
}

std::optional<LogEvent> EventLog::readEvent(const std::string& record) const {
    auto event = decodeEvent(record);
    if (!event && !shownReadError_.exchange(true)) {
        log::error(kComponent, "error reading stored event record (further read errors suppressed): " +
                                   record.substr(0, 64));
    }
    return event;
}

} // namespace eventlog
