//EventLog.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "eventlog/BoundedQueue.hpp"
#include "eventlog/LogEvent.hpp"
#include "eventlog/RecordStore.hpp"
#include "eventlog/Settings.hpp"
#include "eventlog/TransactionSizeCalculator.hpp"
#include "eventlog/algorithms/EventFilter.hpp"

namespace eventlog {

// Forward-only: New -> Opening -> Open -> Closed.
enum class Status { New, Opening, Open, Closed };
const char* statusName(Status status);

enum class HealthStatus { Warn, Caution };
const char* healthStatusName(HealthStatus status);

struct HealthRecord {
    HealthStatus status;
    std::string topic;
    std::string message;
};

using algo::EventType;

struct SearchQuery {
    std::optional<Level> minimumLevel;
    std::size_t maxCount = 100;
    std::string username;   // regex when it compiles, otherwise exact (case-insensitive)
    std::string text;       // substring of message or topic, case-insensitive
    std::chrono::milliseconds maxQueryTime{30 * 1000};
    EventType eventType = EventType::Both;
};

struct SearchResults {
    std::vector<LogEvent> events;   // newest first
    std::size_t examined = 0;
    std::chrono::milliseconds elapsed{0};
    bool timeExceeded = false;
};

struct EventLogStats {
    uint64_t written = 0;
    uint64_t purged = 0;
    uint64_t droppedOversize = 0;
    uint64_t droppedBackpressure = 0;
    uint64_t writeFailures = 0;
    uint64_t abandonedAtClose = 0;
};

// Bounded, retention-limited event log over a RecordStore.
//
// Callers enqueue events with writeEvent(); a single writer thread drains the
// queue into the store in adaptively sized batches and purges the oldest
// records by count and age. search() scans the store concurrently with the
// writer.
class EventLog {
public:
    // Throws std::invalid_argument for a null store or maxEvents == 0 (after
    // clearing the store), and StoreError when the store cannot be read.
    EventLog(const Settings& settings, std::shared_ptr<RecordStore> store);
    ~EventLog();

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    // Fire-and-forget. Waits up to backpressureTimeoutMs when the queue is full,
    // then drops the event with a warning. Never throws.
    void writeEvent(const LogEvent& event);

    SearchResults search(const SearchQuery& query) const;

    std::size_t storedEventCount() const;
    std::size_t pendingEventCount() const;
    std::optional<Timestamp> oldestTimestamp() const;

    std::vector<HealthRecord> healthCheck() const;

    // Stops the writer, drains what it can and abandons the rest. Idempotent.
    void close();

    Status status() const { return status_.load(); }
    const Settings& settings() const { return settings_; }
    EventLogStats stats() const;
    std::size_t transactionSize() const { return txnCalc_.transactionSize(); }

    // Time since the last flush while events are waiting; zero when the queue is empty.
    std::chrono::milliseconds dirtyQueueTime() const;

    std::string debugStats() const;
    std::string sizeToDebugString() const;

private:
    static constexpr int64_t kUnknownTimestamp = -1;

    Settings settings_;
    std::shared_ptr<RecordStore> store_;
    BoundedQueue<LogEvent> queue_;
    TransactionSizeCalculator txnCalc_;

    std::atomic<Status> status_{Status::New};
    std::atomic<int64_t> oldestMs_{kUnknownTimestamp};
    std::atomic<bool> writerActive_{false};
    std::atomic<int64_t> lastFlushMs_{0};
    mutable std::atomic<bool> shownReadError_{false};

    std::atomic<uint64_t> written_{0};
    std::atomic<uint64_t> purged_{0};
    std::atomic<uint64_t> droppedOversize_{0};
    std::atomic<uint64_t> droppedBackpressure_{0};
    std::atomic<uint64_t> writeFailures_{0};
    std::atomic<uint64_t> abandoned_{0};

    std::thread writer_;

    void writerMain();
    void writerLoop();
    void idleSleep() const;

    std::size_t flushQueue();
    void doWrite(const std::vector<LogEvent>& events);
    std::size_t determineTailRemovalCount() const;

    int64_t readOldestTimestamp() const;
    std::optional<LogEvent> readEvent(const std::string& record) const;
};

} // namespace eventlog
