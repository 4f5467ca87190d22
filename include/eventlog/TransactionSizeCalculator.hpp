#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>

namespace eventlog {

// Proposes how many queued events to write per batch so that a writer cycle
// lands near `goal`. Fed with the measured duration of each busy cycle.
class TransactionSizeCalculator {
public:
    TransactionSizeCalculator(std::chrono::milliseconds goal, std::size_t minSize, std::size_t maxSize);

    std::size_t transactionSize() const { return size_.load(); }
    std::chrono::milliseconds lastDuration() const { return std::chrono::milliseconds(lastDurationMs_.load()); }

    void recordLastTransactionDuration(std::chrono::milliseconds duration);
    void reset();

private:
    const std::chrono::milliseconds goal_;
    const std::size_t min_;
    const std::size_t max_;
    std::atomic<std::size_t> size_;
    std::atomic<long long> lastDurationMs_{0};
};

} // namespace eventlog
