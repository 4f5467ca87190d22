#include "eventlog/FileRecordStore.hpp"

#include <algorithm>
#include <filesystem>
#include "eventlog/Log.hpp"

namespace eventlog {

namespace {

constexpr const char* kComponent = "FileRecordStore";
constexpr uint32_t kMaxFrameLength = 16 * 1024 * 1024;
constexpr std::size_t kMinCompactionTrim = 1024;

template <typename T>
void writeLE(std::ostream& out, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        char byte = static_cast<char>((static_cast<uint64_t>(value) >> (8 * i)) & 0xFFu);
        out.write(&byte, 1);
    }
}

template <typename T>
bool readLE(std::istream& in, T& value) {
    uint64_t v = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        char byte = 0;
        if (!in.read(&byte, 1)) return false;
        v |= static_cast<uint64_t>(static_cast<unsigned char>(byte)) << (8 * i);
    }
    value = static_cast<T>(v);
    return true;
}

std::string encodeCount(uint64_t count) {
    std::string out;
    for (size_t i = 0; i < sizeof(count); ++i) {
        out.push_back(static_cast<char>((count >> (8 * i)) & 0xFFu));
    }
    return out;
}

bool decodeCount(const std::string& payload, uint64_t& count) {
    if (payload.size() != sizeof(uint64_t)) return false;
    count = 0;
    for (size_t i = 0; i < sizeof(uint64_t); ++i) {
        count |= static_cast<uint64_t>(static_cast<unsigned char>(payload[i])) << (8 * i);
    }
    return true;
}

} // namespace

FileRecordStore::FileRecordStore(const std::string& dataDir) : dataDir_(dataDir) {
    if (dataDir_.empty()) throw StoreError("data directory must not be empty");
    std::error_code ec;
    std::filesystem::create_directories(dataDir_, ec);
    if (ec) throw StoreError("cannot create data directory " + dataDir_ + ": " + ec.message());
    logPath_ = (std::filesystem::path(dataDir_) / "events.log").string();

    std::lock_guard<std::mutex> lk(journalMutex_);
    const bool clean = replay();
    ensureOpen();
    if (!stream_) throw StoreError("cannot open journal " + logPath_);
    if (!clean || trimmedSinceCompaction_ > 0) {
        // drop the damaged tail and folded trims before new frames land after them
        if (!compactLocked()) throw StoreError("cannot rewrite journal " + logPath_);
    }
    log::debug(kComponent, "opened " + logPath_ + " records=" + std::to_string(size()));
}

FileRecordStore::~FileRecordStore() {
    std::lock_guard<std::mutex> lk(journalMutex_);
    if (stream_.is_open()) {
        stream_.flush();
        stream_.close();
    }
}

bool FileRecordStore::good() const {
    std::lock_guard<std::mutex> lk(journalMutex_);
    return static_cast<bool>(stream_);
}

void FileRecordStore::ensureOpen() {
    if (stream_.is_open() && stream_) return;
    if (stream_.is_open()) stream_.close();
    stream_.clear();
    stream_.open(logPath_, std::ios::binary | std::ios::app);
}

std::uintmax_t FileRecordStore::beginWrite() {
    ensureOpen();
    if (!stream_) throw StoreError("journal not writable: " + logPath_);
    if (damaged_) {
        // rebuild from the in-memory mirror before appending after a torn frame
        if (!compactLocked()) throw StoreError("cannot repair journal " + logPath_);
        damaged_ = false;
    }
    std::error_code ec;
    const auto offset = std::filesystem::file_size(logPath_, ec);
    if (ec) throw StoreError("cannot stat journal " + logPath_ + ": " + ec.message());
    return offset;
}

void FileRecordStore::commitWrite(std::uintmax_t offset) {
    stream_.flush();
    if (stream_) return;

    stream_.close();
    stream_.clear();
    std::error_code ec;
    std::filesystem::resize_file(logPath_, offset, ec);
    if (ec) {
        log::warn(kComponent, "cannot cut back journal after failed write: " + ec.message());
        damaged_ = true;
    }
    ensureOpen();
    throw StoreError("journal write failed: " + logPath_);
}

bool FileRecordStore::replay() {
    std::ifstream in(logPath_, std::ios::binary);
    if (!in) return true; // nothing to replay is not an error

    std::vector<std::string> pending;
    auto flushPending = [this, &pending]() {
        MemoryRecordStore::append(pending);
        pending.clear();
    };

    while (true) {
        uint32_t len = 0;
        if (!readLE(in, len)) break;
        if (len > kMaxFrameLength) {
            log::warn(kComponent, "suspicious frame length " + std::to_string(len) + "; stopping replay");
            flushPending();
            return false;
        }
        char opByte = 0;
        std::string payload(len, '\0');
        uint32_t storedCrc = 0;
        if (!in.read(&opByte, 1) || (len > 0 && !in.read(payload.data(), len)) || !readLE(in, storedCrc)) {
            log::warn(kComponent, "truncated frame; stopping replay");
            flushPending();
            return false;
        }
        const auto op = static_cast<uint8_t>(opByte);
        if (crc32(op, payload) != storedCrc) {
            log::warn(kComponent, "checksum mismatch; stopping replay");
            flushPending();
            return false;
        }

        switch (static_cast<Op>(op)) {
            case Op::Append:
                pending.push_back(std::move(payload));
                break;
            case Op::Trim: {
                uint64_t count = 0;
                if (!decodeCount(payload, count)) {
                    log::warn(kComponent, "malformed trim frame; stopping replay");
                    flushPending();
                    return false;
                }
                flushPending();
                trimmedSinceCompaction_ += MemoryRecordStore::removeOldest(static_cast<std::size_t>(count));
                break;
            }
            case Op::Clear:
                flushPending();
                trimmedSinceCompaction_ += MemoryRecordStore::size();
                MemoryRecordStore::clear();
                break;
            default:
                log::warn(kComponent, "unknown frame op " + std::to_string(op) + "; stopping replay");
                flushPending();
                return false;
        }
    }
    flushPending();
    return true;
}

void FileRecordStore::writeFrame(std::ostream& out, Op op, std::string_view payload) {
    const auto opValue = static_cast<uint8_t>(op);
    writeLE(out, static_cast<uint32_t>(payload.size()));
    out.write(reinterpret_cast<const char*>(&opValue), 1);
    if (!payload.empty()) out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    writeLE(out, crc32(opValue, payload));
}

void FileRecordStore::append(const std::vector<std::string>& records) {
    if (records.empty()) return;
    {
        std::lock_guard<std::mutex> lk(journalMutex_);
        for (const auto& r : records) {
            if (r.size() > kMaxFrameLength) throw StoreError("record exceeds frame limit");
        }
        const auto offset = beginWrite();
        for (const auto& r : records) writeFrame(stream_, Op::Append, r);
        commitWrite(offset);
        MemoryRecordStore::append(records);
    }
}

std::size_t FileRecordStore::removeOldest(std::size_t count) {
    std::lock_guard<std::mutex> lk(journalMutex_);
    const std::size_t n = std::min(count, MemoryRecordStore::size());
    if (n == 0) return 0;
    const auto offset = beginWrite();
    writeFrame(stream_, Op::Trim, encodeCount(n));
    commitWrite(offset);
    const std::size_t removed = MemoryRecordStore::removeOldest(n);
    trimmedSinceCompaction_ += removed;
    maybeCompact();
    return removed;
}

void FileRecordStore::clear() {
    std::lock_guard<std::mutex> lk(journalMutex_);
    const auto offset = beginWrite();
    writeFrame(stream_, Op::Clear, {});
    commitWrite(offset);
    trimmedSinceCompaction_ += MemoryRecordStore::size();
    MemoryRecordStore::clear();
    maybeCompact();
}

bool FileRecordStore::compact() {
    std::lock_guard<std::mutex> lk(journalMutex_);
    return compactLocked();
}

void FileRecordStore::maybeCompact() {
    if (trimmedSinceCompaction_ < kMinCompactionTrim) return;
    if (trimmedSinceCompaction_ < MemoryRecordStore::size()) return;
    if (!compactLocked()) {
        log::warn(kComponent, "compaction failed; keeping existing journal");
    }
}

bool FileRecordStore::compactLocked() {
    namespace fs = std::filesystem;
    const std::string tmpPath = logPath_ + ".tmp";
    const auto live = snapshot();
    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            log::warn(kComponent, "cannot open " + tmpPath);
            return false;
        }
        for (const auto& r : live) writeFrame(out, Op::Append, r);
        out.flush();
        if (!out) {
            log::warn(kComponent, "write failed for " + tmpPath);
            return false;
        }
    }

    if (stream_.is_open()) stream_.close();
    std::error_code ec;
    fs::rename(tmpPath, logPath_, ec);
    ensureOpen();
    if (ec) {
        log::warn(kComponent, "rename failed: " + ec.message());
        fs::remove(tmpPath, ec);
        return false;
    }
    log::debug(kComponent, "compacted journal; live=" + std::to_string(live.size()) +
                               " trimmed=" + std::to_string(trimmedSinceCompaction_));
    trimmedSinceCompaction_ = 0;
    return static_cast<bool>(stream_);
}

uint32_t FileRecordStore::crc32(uint8_t op, std::string_view data) {
    uint32_t crc = 0xFFFFFFFFu;
    auto feed = [&crc](unsigned char b) {
        crc ^= b;
        for (int i = 0; i < 8; ++i) {
            uint32_t mask = (crc & 1u) ? 0xFFFFFFFFu : 0u;
            crc = (crc >> 1) ^ (0xEDB88320u & mask);
        }
    };
    feed(op);
    for (unsigned char b : data) feed(b);
    return ~crc;
}

} // namespace eventlog
