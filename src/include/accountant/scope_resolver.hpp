#pragma once
#include <cstddef>
#include <memory>
#include <mutex>

namespace dp_ledger {

class Accountant;

/**
 * @brief Decides which Accountant a call site uses when none is passed
 *
 * Resolution order:
 *   1. the explicitly passed accountant
 *   2. the innermost AccountantScope active on the calling thread
 *   3. the shared default installed with set_default()
 *   4. a fresh unconstrained accountant (epsilon = inf, delta = 1)
 *
 * Scope stacks are per thread; the shared default is visible to every thread
 * that has no scope of its own.
 */
class ScopeResolver {
public:
    static ScopeResolver& instance();

    std::shared_ptr<Accountant> resolve(std::shared_ptr<Accountant> explicit_accountant = nullptr) const;

    void push_scope(std::shared_ptr<Accountant> accountant);
    void pop_scope(const Accountant* accountant);
    std::size_t scope_depth() const;
    std::shared_ptr<Accountant> current_scope() const;

    void set_default(std::shared_ptr<Accountant> accountant);
    std::shared_ptr<Accountant> default_accountant() const;
    std::shared_ptr<Accountant> pop_default();

private:
    ScopeResolver() = default;

    mutable std::mutex default_mutex_;
    std::shared_ptr<Accountant> default_;
};

/**
 * @brief Makes an accountant the resolution target for the current thread
 *
 * Pushed on construction, popped on destruction, so the previous target is
 * restored on every exit path including exceptions.
 */
class AccountantScope {
public:
    explicit AccountantScope(std::shared_ptr<Accountant> accountant);
    ~AccountantScope();

    AccountantScope(const AccountantScope&) = delete;
    AccountantScope& operator=(const AccountantScope&) = delete;

    Accountant& accountant() const;

private:
    std::shared_ptr<Accountant> accountant_;
};

} // namespace dp_ledger
