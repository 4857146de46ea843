#include "accountant/scope_resolver.hpp"
#include "accountant/accountant.hpp"
#include "utils/logger.hpp"

#include <iterator>
#include <utility>
#include <vector>

namespace dp_ledger {

namespace {

thread_local std::vector<std::shared_ptr<Accountant>> t_scope_stack;

} // namespace

ScopeResolver& ScopeResolver::instance() {
    static ScopeResolver resolver;
    return resolver;
}

std::shared_ptr<Accountant> ScopeResolver::resolve(std::shared_ptr<Accountant> explicit_accountant) const {
    if (explicit_accountant) {
        return explicit_accountant;
    }
    if (!t_scope_stack.empty()) {
        return t_scope_stack.back();
    }
    {
        std::lock_guard<std::mutex> lock(default_mutex_);
        if (default_) {
            return default_;
        }
    }
    Logger::get().debug("No accountant in scope; spending against an unconstrained accountant");
    return Accountant::unconstrained();
}

void ScopeResolver::push_scope(std::shared_ptr<Accountant> accountant) {
    t_scope_stack.push_back(std::move(accountant));
}

void ScopeResolver::pop_scope(const Accountant* accountant) {
    // Guards normally unwind in LIFO order; search from the top for the rest
    for (auto it = t_scope_stack.rbegin(); it != t_scope_stack.rend(); ++it) {
        if (it->get() == accountant) {
            t_scope_stack.erase(std::next(it).base());
            return;
        }
    }
}

std::size_t ScopeResolver::scope_depth() const {
    return t_scope_stack.size();
}

std::shared_ptr<Accountant> ScopeResolver::current_scope() const {
    return t_scope_stack.empty() ? nullptr : t_scope_stack.back();
}

void ScopeResolver::set_default(std::shared_ptr<Accountant> accountant) {
    std::lock_guard<std::mutex> lock(default_mutex_);
    default_ = std::move(accountant);
}

std::shared_ptr<Accountant> ScopeResolver::default_accountant() const {
    std::lock_guard<std::mutex> lock(default_mutex_);
    return default_;
}

std::shared_ptr<Accountant> ScopeResolver::pop_default() {
    std::lock_guard<std::mutex> lock(default_mutex_);
    std::shared_ptr<Accountant> previous = std::move(default_);
    default_.reset();
    return previous;
}

AccountantScope::AccountantScope(std::shared_ptr<Accountant> accountant)
    : accountant_(std::move(accountant))
{
    if (!accountant_) {
        throw ConfigurationError("AccountantScope: accountant must not be null");
    }
    ScopeResolver::instance().push_scope(accountant_);
}

Accountant& AccountantScope::accountant() const {
    return *accountant_;
}

AccountantScope::~AccountantScope() {
    ScopeResolver::instance().pop_scope(accountant_.get());
}

} // namespace dp_ledger
