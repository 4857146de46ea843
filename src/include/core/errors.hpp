#pragma once
#include "core/privacy_types.hpp"
#include <stdexcept>
#include <string>

namespace dp_ledger {

// Malformed budget parameters, spend requests or configuration values
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief A well-formed spend that would push the composed bound past the budget
 *
 * Carries the rejected request and what the accountant had left at the time
 * of rejection, so the calling mechanism can decide whether to retry cheaper.
 */
class BudgetError : public std::runtime_error {
public:
    BudgetError(const std::string& what, PrivacyCost requested, PrivacyCost remaining)
        : std::runtime_error(what), requested_(requested), remaining_(remaining) {}

    PrivacyCost requested() const { return requested_; }
    PrivacyCost remaining() const { return remaining_; }

private:
    PrivacyCost requested_;
    PrivacyCost remaining_;
};

} // namespace dp_ledger
