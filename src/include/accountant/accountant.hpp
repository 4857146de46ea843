#pragma once
#include "accountant/scope_resolver.hpp"
#include "composition/composition.hpp"
#include "core/accountant_config.hpp"
#include "core/errors.hpp"
#include "core/privacy_types.hpp"
#include "ledger/spend_ledger.hpp"
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dp_ledger {

/**
 * @brief Outcome of Accountant::try_spend
 */
struct SpendResult {
    bool ok = false;
    std::string message;
    PrivacyCost requested;
    PrivacyCost remaining;
};

/**
 * @brief Tracks spends against one budget and refuses to overrun it
 *
 * Owns one SpendLedger, one PrivacyBudget and a fixed slack. The admission
 * check and the append happen under one lock, so concurrent spenders cannot
 * jointly overrun the budget. Reads take the same lock.
 *
 * Always held through std::shared_ptr so that it can be installed as a scope
 * or shared default.
 */
class Accountant : public std::enable_shared_from_this<Accountant> {
public:
    static std::shared_ptr<Accountant> create(double epsilon_total, double delta_total = 0.0, double slack = 0.0);
    static std::shared_ptr<Accountant> create(const AccountantConfig& config);
    static std::shared_ptr<Accountant> create(const AccountantConfig& config,
                                              const std::vector<SpendRecord>& spent_budget);

    // epsilon = inf, delta = 1: the fallback when nothing else resolves
    static std::shared_ptr<Accountant> unconstrained();

    Accountant(const Accountant&) = delete;
    Accountant& operator=(const Accountant&) = delete;

    /**
     * @brief Commit (epsilon, delta) if the composed bound stays within budget
     *
     * Throws ConfigurationError for epsilon <= 0 or delta outside [0, 1), and
     * BudgetError if the spend does not fit. In both cases the ledger is left
     * untouched.
     *
     * The budget check is an exact floating-point <=. Decimal epsilons may not
     * sum exactly: with a budget of 0.3, a third spend of 0.1 is refused.
     */
    Accountant& spend(double epsilon, double delta = 0.0);

    // Same as spend() but reports a rejection as a value
    SpendResult try_spend(double epsilon, double delta = 0.0);

    // Admission test without committing. Returns true or throws BudgetError.
    bool check(double epsilon, double delta = 0.0) const;

    PrivacyCost total() const;
    PrivacyCost remaining(std::size_t k = 1) const;
    std::size_t size() const;
    std::vector<SpendRecord> spent_budget() const;

    const PrivacyBudget& budget() const { return budget_; }
    double slack() const { return slack_; }
    double tolerance() const { return tolerance_; }
    bool is_unconstrained() const;

    void set_default();
    AccountantScope scope();

    std::string to_string() const;

private:
    Accountant(const PrivacyBudget& budget, double slack, double tolerance);

    static void validate_request(double epsilon, double delta);
    bool admits_locked(const SpendRecord& candidate) const;
    PrivacyCost remaining_locked(std::size_t k) const;
    std::string rejection_message(const SpendRecord& request, const PrivacyCost& left) const;

    const PrivacyBudget budget_;
    const double slack_;
    const double tolerance_;

    mutable std::mutex mutex_;
    SpendLedger ledger_;
};

std::size_t len(const Accountant& accountant);
std::ostream& operator<<(std::ostream& os, const Accountant& accountant);

/**
 * @brief Spend against the resolved accountant
 *
 * Passing an accountant always wins; otherwise the thread scope, then the
 * shared default, then an unconstrained accountant is charged. Returns the
 * accountant that was charged.
 */
std::shared_ptr<Accountant> spend(double epsilon, double delta = 0.0,
                                  std::shared_ptr<Accountant> accountant = nullptr);

} // namespace dp_ledger
