#include "composition/composition.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace dp_ledger {

namespace {

// log2(1 / kDefaultTolerance) is ~30; the cap only matters for tiny tolerances
constexpr int kMaxBisectionSteps = 200;

} // namespace

void CompositionSums::add(const SpendRecord& record, std::size_t copies) {
    const double eps = record.epsilon;
    // eps == 0 would give 0 * expm1(0); skip it so inf never meets 0 here
    const double expm1_term = eps > 0.0 ? eps * std::expm1(eps) : 0.0;
    // One addition per copy, in the order the ledger would see them, so the
    // sums match accumulate() over the same records bit for bit
    for (std::size_t i = 0; i < copies; ++i) {
        epsilon_sum += eps;
        epsilon_sq_sum += eps * eps;
        epsilon_expm1_sum += expm1_term;
        delta_sum += record.delta;
    }
    count += copies;
}

CompositionSums accumulate(const std::vector<SpendRecord>& records) {
    CompositionSums sums;
    for (const auto& record : records) {
        sums.add(record);
    }
    return sums;
}

PrivacyCost naive_compose(const CompositionSums& sums) {
    PrivacyCost cost;
    cost.epsilon = sums.epsilon_sum;
    cost.delta = sums.delta_sum;
    return cost;
}

PrivacyCost naive_compose(const std::vector<SpendRecord>& records) {
    return naive_compose(accumulate(records));
}

PrivacyCost advanced_compose(const CompositionSums& sums, double slack) {
    if (!(slack > 0.0 && slack < 1.0)) {
        throw ConfigurationError("advanced_compose: slack must be in (0, 1)");
    }
    PrivacyCost cost;
    cost.epsilon = std::sqrt(2.0 * std::log(1.0 / slack) * sums.epsilon_sq_sum) +
                   sums.epsilon_expm1_sum;
    cost.delta = sums.delta_sum + slack;
    return cost;
}

PrivacyCost advanced_compose(const std::vector<SpendRecord>& records, double slack) {
    return advanced_compose(accumulate(records), slack);
}

PrivacyCost compose(const CompositionSums& sums, double slack) {
    PrivacyCost naive = naive_compose(sums);
    if (slack <= 0.0) {
        return naive;
    }

    PrivacyCost advanced = advanced_compose(sums, slack);
    PrivacyCost cost;
    cost.epsilon = std::min(naive.epsilon, advanced.epsilon);
    cost.delta = advanced.delta;
    return cost;
}

PrivacyCost compose(const std::vector<SpendRecord>& records, double slack) {
    return compose(accumulate(records), slack);
}

bool admits(
    const CompositionSums& sums,
    const PrivacyBudget& budget,
    double slack,
    const SpendRecord& candidate,
    std::size_t copies
) {
    CompositionSums extended = sums;
    extended.add(candidate, copies);
    const PrivacyCost cost = compose(extended, slack);
    return cost.epsilon <= budget.epsilon_total && cost.delta <= budget.delta_total;
}

bool admits(
    const std::vector<SpendRecord>& records,
    const PrivacyBudget& budget,
    double slack,
    const SpendRecord& candidate
) {
    return admits(accumulate(records), budget, slack, candidate, 1);
}

double max_affordable_epsilon(
    const CompositionSums& sums,
    const PrivacyBudget& budget,
    double slack,
    std::size_t k,
    double delta_per_query,
    double tolerance
) {
    if (k == 0) {
        return budget.epsilon_total;
    }

    SpendRecord probe;
    probe.delta = delta_per_query;

    // Nothing fits when even zero-epsilon queries break the delta budget
    probe.epsilon = 0.0;
    if (!admits(sums, budget, slack, probe, k)) {
        return 0.0;
    }
    if (std::isinf(budget.epsilon_total)) {
        return std::numeric_limits<double>::infinity();
    }

    double lo = 0.0;
    double hi = budget.epsilon_total;
    probe.epsilon = hi;
    if (admits(sums, budget, slack, probe, k)) {
        return hi;
    }

    // Invariant: lo is admissible, hi is not
    const double width = tolerance * budget.epsilon_total;
    for (int step = 0; step < kMaxBisectionSteps && hi - lo > width; ++step) {
        const double mid = lo + 0.5 * (hi - lo);
        probe.epsilon = mid;
        if (admits(sums, budget, slack, probe, k)) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return lo;
}

double max_affordable_epsilon(
    const std::vector<SpendRecord>& records,
    const PrivacyBudget& budget,
    double slack,
    std::size_t k,
    double delta_per_query,
    double tolerance
) {
    return max_affordable_epsilon(accumulate(records), budget, slack, k, delta_per_query, tolerance);
}

} // namespace dp_ledger
