#include "ledger/spend_ledger.hpp"

#include <utility>

namespace dp_ledger {

SpendLedger::SpendLedger(std::vector<SpendRecord> records)
    : records_(std::move(records))
{}

void SpendLedger::append(const SpendRecord& record) {
    records_.push_back(record);
}

} // namespace dp_ledger
