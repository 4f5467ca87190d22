#include "eventlog/TransactionSizeCalculator.hpp"

#include <algorithm>
#include <stdexcept>

namespace eventlog {

namespace {
constexpr double kCloseBand = 0.15;
constexpr double kStep = 0.10;
constexpr long long kCollapseFactor = 5;
} // namespace

TransactionSizeCalculator::TransactionSizeCalculator(std::chrono::milliseconds goal,
                                                     std::size_t minSize,
                                                     std::size_t maxSize)
    : goal_(goal), min_(std::max<std::size_t>(1, minSize)), max_(std::max(std::max<std::size_t>(1, minSize), maxSize)), size_(0) {
    if (goal_.count() <= 0) throw std::invalid_argument("transaction goal must be positive");
    reset();
}

void TransactionSizeCalculator::reset() {
    size_.store(min_ + (max_ - min_) / 2);
    lastDurationMs_.store(0);
}

void TransactionSizeCalculator::recordLastTransactionDuration(std::chrono::milliseconds duration) {
    const long long d = std::max<long long>(0, duration.count());
    lastDurationMs_.store(d);

    const long long goal = goal_.count();
    const long long band = static_cast<long long>(static_cast<double>(goal) * kCloseBand);
    const std::size_t current = size_.load();
    const std::size_t delta = static_cast<std::size_t>(static_cast<double>(current) * kStep) + 1;

    std::size_t next = current;
    if (d > goal * kCollapseFactor) {
        next = min_;
    } else if (d > goal + band) {
        next = current > delta ? current - delta : min_;
    } else if (d < goal - band) {
        next = current + delta;
    }

    size_.store(std::clamp(next, min_, max_));
}

} // namespace eventlog
