#pragma once
#include <cstddef>

namespace dp_ledger {

// Relative width of the bisection bracket at which remaining() stops
constexpr double kDefaultTolerance = 1e-9;

/**
 * @brief An (epsilon, delta) pair as reported by composition
 */
struct PrivacyCost {
    double epsilon = 0.0;
    double delta = 0.0;
};

/**
 * @brief Total budget an accountant enforces
 *
 * epsilon_total >= 0, delta_total in [0, 1). Fixed once the accountant exists.
 */
struct PrivacyBudget {
    double epsilon_total = 0.0;
    double delta_total = 0.0;
};

/**
 * @brief One committed expenditure
 *
 * epsilon > 0, delta in [0, 1). Never modified after it enters a ledger.
 */
struct SpendRecord {
    double epsilon = 0.0;
    double delta = 0.0;
};

} // namespace dp_ledger
