#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace eventlog {

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Forward-only view over a store, oldest to newest. Records removed while a
// cursor is open are skipped; a cursor never throws.
class RecordCursor {
public:
    virtual ~RecordCursor() = default;
    virtual bool next(std::string& out) = 0;
};

// Ordered sequence of encoded records. One writer appends at the newest end and
// removes from the oldest end; readers may iterate concurrently.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    // Appends in order. Throws StoreError if the batch could not be persisted.
    virtual void append(const std::vector<std::string>& records) = 0;
    // Removes up to `count` oldest records; returns the number removed.
    virtual std::size_t removeOldest(std::size_t count) = 0;
    virtual std::size_t size() const = 0;
    virtual std::optional<std::string> oldest() const = 0;
    virtual std::unique_ptr<RecordCursor> cursor() const = 0;
    virtual void clear() = 0;
};

class MemoryRecordStore : public RecordStore {
public:
    MemoryRecordStore() = default;

    void append(const std::vector<std::string>& records) override;
    std::size_t removeOldest(std::size_t count) override;
    std::size_t size() const override;
    std::optional<std::string> oldest() const override;
    std::unique_ptr<RecordCursor> cursor() const override;
    void clear() override;

    // Copies the record with sequence number >= `seq` into `out` and advances
    // `seq` past it. Returns false once `seq` is beyond the newest record.
    bool readFrom(uint64_t& seq, std::string& out) const;

protected:
    // Snapshot of the live records, oldest first.
    std::vector<std::string> snapshot() const;

private:
    mutable std::shared_mutex mutex_;
    std::deque<std::string> records_;
    uint64_t firstSeq_ = 0;
};

} // namespace eventlog
