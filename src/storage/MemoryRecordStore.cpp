#include "eventlog/RecordStore.hpp"

#include <algorithm>
#include <mutex>

namespace eventlog {

namespace {

class MemoryCursor : public RecordCursor {
public:
    explicit MemoryCursor(const MemoryRecordStore& store) : store_(store) {}

    bool next(std::string& out) override {
        return store_.readFrom(seq_, out);
    }

private:
    const MemoryRecordStore& store_;
    uint64_t seq_ = 0;
};

} // namespace

void MemoryRecordStore::append(const std::vector<std::string>& records) {
    if (records.empty()) return;
    std::unique_lock<std::shared_mutex> lk(mutex_);
    records_.insert(records_.end(), records.begin(), records.end());
}

std::size_t MemoryRecordStore::removeOldest(std::size_t count) {
    std::unique_lock<std::shared_mutex> lk(mutex_);
    const std::size_t n = std::min(count, records_.size());
    records_.erase(records_.begin(), records_.begin() + static_cast<std::ptrdiff_t>(n));
    firstSeq_ += n;
    return n;
}

std::size_t MemoryRecordStore::size() const {
    std::shared_lock<std::shared_mutex> lk(mutex_);
    return records_.size();
}

std::optional<std::string> MemoryRecordStore::oldest() const {
    std::shared_lock<std::shared_mutex> lk(mutex_);
    if (records_.empty()) return std::nullopt;
    return records_.front();
}

std::unique_ptr<RecordCursor> MemoryRecordStore::cursor() const {
    return std::make_unique<MemoryCursor>(*this);
}

void MemoryRecordStore::clear() {
    std::unique_lock<std::shared_mutex> lk(mutex_);
    firstSeq_ += records_.size();
    records_.clear();
}

bool MemoryRecordStore::readFrom(uint64_t& seq, std::string& out) const {
    std::shared_lock<std::shared_mutex> lk(mutex_);
    if (seq < firstSeq_) seq = firstSeq_;
    const uint64_t idx = seq - firstSeq_;
    if (idx >= records_.size()) return false;
    out = records_[static_cast<std::size_t>(idx)];
    ++seq;
    return true;
}

std::vector<std::string> MemoryRecordStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lk(mutex_);
    return std::vector<std::string>(records_.begin(), records_.end());
}

} // namespace eventlog
