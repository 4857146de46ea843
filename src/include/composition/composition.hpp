#pragma once
#include "core/privacy_types.hpp"
#include <cstddef>
#include <vector>

namespace dp_ledger {

// ============================================================================
// Composition of (epsilon, delta) expenditures
// ============================================================================
// Naive (basic) composition:
//
//   eps = sum_i eps_i
//   del = sum_i del_i
//
// Advanced (strong) composition with slack s in (0, 1):
//
//   eps(s) = sqrt(2 * ln(1/s) * sum_i eps_i^2) + sum_i eps_i * (exp(eps_i) - 1)
//   del(s) = sum_i del_i + s
//
// Both bounds are valid for any record set; the advanced one only pays off
// for many small-epsilon records. compose() keeps whichever epsilon is
// smaller.
//
// Both bounds are monotone non-decreasing in every eps_i and del_i, which is
// what lets max_affordable_epsilon() bisect on the admission predicate.
// ============================================================================

/**
 * @brief Running sums that fully determine both composition bounds
 *
 * add() with copies == k performs exactly the floating-point additions of k
 * separate spends, so a bound checked here holds for the real ledger too.
 */
struct CompositionSums {
    double epsilon_sum = 0.0;
    double epsilon_sq_sum = 0.0;
    double epsilon_expm1_sum = 0.0;  // sum eps_i * (exp(eps_i) - 1)
    double delta_sum = 0.0;
    std::size_t count = 0;

    void add(const SpendRecord& record, std::size_t copies = 1);
};

CompositionSums accumulate(const std::vector<SpendRecord>& records);

PrivacyCost naive_compose(const CompositionSums& sums);
PrivacyCost naive_compose(const std::vector<SpendRecord>& records);

// Throws ConfigurationError unless 0 < slack < 1
PrivacyCost advanced_compose(const CompositionSums& sums, double slack);
PrivacyCost advanced_compose(const std::vector<SpendRecord>& records, double slack);

/**
 * @brief Composed bound used for admission and reporting
 *
 * slack == 0: naive composition, exactly.
 * slack > 0:  epsilon is the smaller of the naive and advanced bounds; delta
 *             is sum_i del_i + slack either way, since the slack is set aside
 *             for the lifetime of the accountant.
 */
PrivacyCost compose(const CompositionSums& sums, double slack);
PrivacyCost compose(const std::vector<SpendRecord>& records, double slack);

/**
 * @brief Would committing `copies` copies of candidate stay within budget?
 */
bool admits(
    const CompositionSums& sums,
    const PrivacyBudget& budget,
    double slack,
    const SpendRecord& candidate,
    std::size_t copies = 1
);

bool admits(
    const std::vector<SpendRecord>& records,
    const PrivacyBudget& budget,
    double slack,
    const SpendRecord& candidate
);

/**
 * @brief Largest per-query epsilon for k further (epsilon, delta_per_query) queries
 *
 * Bisection over [0, budget.epsilon_total] until the bracket is no wider than
 * tolerance * epsilon_total. Returns the admissible end of the bracket, so the
 * answer can always be spent k times.
 *
 * k == 0 returns epsilon_total. Returns 0 when no positive epsilon fits, and
 * +inf for an infinite epsilon budget whose delta side admits the queries.
 */
double max_affordable_epsilon(
    const CompositionSums& sums,
    const PrivacyBudget& budget,
    double slack,
    std::size_t k,
    double delta_per_query,
    double tolerance = kDefaultTolerance
);

double max_affordable_epsilon(
    const std::vector<SpendRecord>& records,
    const PrivacyBudget& budget,
    double slack,
    std::size_t k,
    double delta_per_query,
    double tolerance = kDefaultTolerance
);

} // namespace dp_ledger
