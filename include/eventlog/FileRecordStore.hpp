#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>
#include "eventlog/RecordStore.hpp"

namespace eventlog {

// Record store backed by an append-only journal with per-frame checksums.
// Live records are mirrored in memory; removals are journaled as trim frames
// and the journal is rewritten once trimmed records outnumber live ones.
class FileRecordStore : public MemoryRecordStore {
public:
    // Opens (or creates) `<dataDir>/events.log` and replays it. Throws StoreError
    // when the directory or journal cannot be opened.
    explicit FileRecordStore(const std::string& dataDir);
    ~FileRecordStore() override;

    void append(const std::vector<std::string>& records) override;
    std::size_t removeOldest(std::size_t count) override;
    void clear() override;

    const std::string& journalPath() const { return logPath_; }
    bool good() const;

    // Rewrites the journal with only the live records.
    bool compact();

private:
    enum class Op : uint8_t { Append = 1, Trim = 2, Clear = 3 };

    std::string dataDir_;
    std::string logPath_;
    mutable std::mutex journalMutex_;
    std::ofstream stream_;
    std::size_t trimmedSinceCompaction_ = 0;
    // set when a failed write could not be cut back off the journal
    bool damaged_ = false;

    void ensureOpen();
    // Returns the journal length before a batch of frames is written.
    std::uintmax_t beginWrite();
    // Flushes the batch. On failure the journal is cut back to `offset`, the
    // stream is reopened and StoreError is thrown.
    void commitWrite(std::uintmax_t offset);
    // Returns false when replay stopped early on a damaged frame.
    bool replay();
    void writeFrame(std::ostream& out, Op op, std::string_view payload);
    void maybeCompact();
    bool compactLocked();

    static uint32_t crc32(uint8_t op, std::string_view data);
};

} // namespace eventlog
