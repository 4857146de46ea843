#pragma once
#include "core/privacy_types.hpp"
#include <cstddef>
#include <vector>

namespace dp_ledger {

/**
 * @brief Append-only record of committed expenditures
 *
 * Performs no budget check of its own; the owning Accountant decides what
 * gets appended. Entries are never modified or removed once appended.
 */
class SpendLedger {
public:
    using const_iterator = std::vector<SpendRecord>::const_iterator;

    SpendLedger() = default;
    explicit SpendLedger(std::vector<SpendRecord> records);

    void append(const SpendRecord& record);

    // Restartable read-only view in insertion order
    const std::vector<SpendRecord>& records() const { return records_; }
    const_iterator begin() const { return records_.begin(); }
    const_iterator end() const { return records_.end(); }

    std::size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

private:
    std::vector<SpendRecord> records_;
};

} // namespace dp_ledger
