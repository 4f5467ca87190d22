#include "eventlog/TransactionSizeCalculator.hpp"
#include "TestSupport.hpp"

#include <iostream>
#include <stdexcept>

using eventlog::TransactionSizeCalculator;
using testsupport::expect;
using std::chrono::milliseconds;

int main() {
    TransactionSizeCalculator calc(milliseconds(1000), 10, 1010);
    expect(calc.transactionSize() == 510, "starts halfway between floor and ceiling");

    // Fast cycles grow the batch
    const auto before = calc.transactionSize();
    calc.recordLastTransactionDuration(milliseconds(100));
    expect(calc.transactionSize() > before, "fast cycle grows size");
    expect(calc.lastDuration() == milliseconds(100), "last duration recorded");

    // Cycles close to the goal leave it alone
    const auto steady = calc.transactionSize();
    calc.recordLastTransactionDuration(milliseconds(1050));
    expect(calc.transactionSize() == steady, "on-target cycle keeps size");

    // Slow cycles shrink it
    calc.recordLastTransactionDuration(milliseconds(2000));
    expect(calc.transactionSize() < steady, "slow cycle shrinks size");

    // Pathologically slow cycles collapse to the floor
    calc.recordLastTransactionDuration(milliseconds(6000));
    expect(calc.transactionSize() == 10, "very slow cycle collapses to floor");
    calc.recordLastTransactionDuration(milliseconds(3000));
    expect(calc.transactionSize() == 10, "never below floor");

    // Repeated fast cycles saturate at the ceiling
    for (int i = 0; i < 200; ++i) calc.recordLastTransactionDuration(milliseconds(0));
    expect(calc.transactionSize() == 1010, "never above ceiling");

    calc.reset();
    expect(calc.transactionSize() == 510, "reset restores starting size");

    bool threw = false;
    try {
        TransactionSizeCalculator bad(milliseconds(0), 1, 10);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect(threw, "non-positive goal rejected");

    std::cout << "All TransactionSizeCalculator tests passed." << std::endl;
    return 0;
}
