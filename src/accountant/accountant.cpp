#include "accountant/accountant.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <ostream>
#include <sstream>
#include <utility>

namespace dp_ledger {

namespace {

// Records shown by to_string() before eliding the rest
constexpr std::size_t kMaxRecordsShown = 5;

} // namespace

Accountant::Accountant(const PrivacyBudget& budget, double slack, double tolerance)
    : budget_(budget)
    , slack_(slack)
    , tolerance_(tolerance)
{}

std::shared_ptr<Accountant> Accountant::create(double epsilon_total, double delta_total, double slack) {
    AccountantConfig config;
    config.epsilon = epsilon_total;
    config.delta = delta_total;
    config.slack = slack;
    return create(config);
}

std::shared_ptr<Accountant> Accountant::create(const AccountantConfig& config) {
    config.validate();

    PrivacyBudget budget;
    budget.epsilon_total = config.epsilon;
    budget.delta_total = config.delta;

    Logger::get().debug("Accountant created: epsilon=%g delta=%g slack=%g",
                        config.epsilon, config.delta, config.slack);
    return std::shared_ptr<Accountant>(new Accountant(budget, config.slack, config.tolerance));
}

std::shared_ptr<Accountant> Accountant::create(const AccountantConfig& config,
                                               const std::vector<SpendRecord>& spent_budget) {
    std::shared_ptr<Accountant> accountant = create(config);
    for (const auto& record : spent_budget) {
        accountant->spend(record.epsilon, record.delta);
    }
    return accountant;
}

std::shared_ptr<Accountant> Accountant::unconstrained() {
    PrivacyBudget budget;
    budget.epsilon_total = std::numeric_limits<double>::infinity();
    budget.delta_total = 1.0;
    return std::shared_ptr<Accountant>(new Accountant(budget, 0.0, kDefaultTolerance));
}

void Accountant::validate_request(double epsilon, double delta) {
    if (!(epsilon > 0.0)) {
        throw ConfigurationError("Accountant::spend: epsilon must be positive");
    }
    if (!(delta >= 0.0 && delta < 1.0)) {
        throw ConfigurationError("Accountant::spend: delta must be in [0, 1)");
    }
}

bool Accountant::admits_locked(const SpendRecord& candidate) const {
    return admits(ledger_.records(), budget_, slack_, candidate);
}

PrivacyCost Accountant::remaining_locked(std::size_t k) const {
    const CompositionSums sums = accumulate(ledger_.records());
    PrivacyCost left;
    left.epsilon = max_affordable_epsilon(sums, budget_, slack_, k, 0.0, tolerance_);
    left.delta = std::max(0.0, budget_.delta_total - compose(sums, slack_).delta);
    return left;
}

std::string Accountant::rejection_message(const SpendRecord& request, const PrivacyCost& left) const {
    std::ostringstream oss;
    oss << "Privacy spend of (" << request.epsilon << ", " << request.delta
        << ") not permissible; will exceed remaining privacy budget of ("
        << left.epsilon << ", " << left.delta << ")";
    return oss.str();
}

Accountant& Accountant::spend(double epsilon, double delta) {
    validate_request(epsilon, delta);

    SpendRecord request;
    request.epsilon = epsilon;
    request.delta = delta;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!admits_locked(request)) {
        const PrivacyCost left = remaining_locked(1);
        const std::string message = rejection_message(request, left);
        Logger::get().warn("%s", message.c_str());
        throw BudgetError(message, PrivacyCost{epsilon, delta}, left);
    }
    ledger_.append(request);
    return *this;
}

SpendResult Accountant::try_spend(double epsilon, double delta) {
    validate_request(epsilon, delta);

    SpendResult result;
    result.requested.epsilon = epsilon;
    result.requested.delta = delta;

    SpendRecord request;
    request.epsilon = epsilon;
    request.delta = delta;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!admits_locked(request)) {
        result.remaining = remaining_locked(1);
        result.message = rejection_message(request, result.remaining);
        Logger::get().warn("%s", result.message.c_str());
        return result;
    }
    ledger_.append(request);
    result.ok = true;
    result.remaining = remaining_locked(1);
    return result;
}

bool Accountant::check(double epsilon, double delta) const {
    validate_request(epsilon, delta);

    SpendRecord request;
    request.epsilon = epsilon;
    request.delta = delta;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!admits_locked(request)) {
        const PrivacyCost left = remaining_locked(1);
        throw BudgetError(rejection_message(request, left), PrivacyCost{epsilon, delta}, left);
    }
    return true;
}

PrivacyCost Accountant::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return compose(ledger_.records(), slack_);
}

PrivacyCost Accountant::remaining(std::size_t k) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remaining_locked(k);
}

std::size_t Accountant::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.size();
}

std::vector<SpendRecord> Accountant::spent_budget() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.records();
}

bool Accountant::is_unconstrained() const {
    return std::isinf(budget_.epsilon_total) && budget_.delta_total >= 1.0;
}

void Accountant::set_default() {
    ScopeResolver::instance().set_default(shared_from_this());
}

AccountantScope Accountant::scope() {
    return AccountantScope(shared_from_this());
}

std::string Accountant::to_string() const {
    std::ostringstream oss;
    oss << "Accountant(epsilon=" << budget_.epsilon_total;
    if (budget_.delta_total != 0.0) {
        oss << ", delta=" << budget_.delta_total;
    }
    if (slack_ != 0.0) {
        oss << ", slack=" << slack_;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!ledger_.empty()) {
        oss << ", spent=[";
        std::size_t shown = 0;
        for (const auto& record : ledger_) {
            if (shown == kMaxRecordsShown) {
                oss << ", ...";
                break;
            }
            if (shown > 0) {
                oss << ", ";
            }
            oss << "(" << record.epsilon << ", " << record.delta << ")";
            ++shown;
        }
        oss << "]";
    }
    oss << ")";
    return oss.str();
}

std::size_t len(const Accountant& accountant) {
    return accountant.size();
}

std::ostream& operator<<(std::ostream& os, const Accountant& accountant) {
    return os << accountant.to_string();
}

std::shared_ptr<Accountant> spend(double epsilon, double delta, std::shared_ptr<Accountant> accountant) {
    std::shared_ptr<Accountant> target = ScopeResolver::instance().resolve(std::move(accountant));
    target->spend(epsilon, delta);
    return target;
}

} // namespace dp_ledger
