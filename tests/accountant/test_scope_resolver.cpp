#include <gtest/gtest.h>
#include "accountant/accountant.hpp"
#include "accountant/scope_resolver.hpp"
#include <stdexcept>
#include <thread>

using dp_ledger::Accountant;
using dp_ledger::ScopeResolver;

class ScopeResolverTest : public ::testing::Test {
protected:
    void SetUp() override { ScopeResolver::instance().pop_default(); }
    void TearDown() override { ScopeResolver::instance().pop_default(); }
};

TEST_F(ScopeResolverTest, ThreeResolutionStylesAreEquivalent) {
    // Explicit parameter
    auto explicit_acc = Accountant::create(5.0, 0.0);
    dp_ledger::spend(1.618, 0.0, explicit_acc);
    EXPECT_DOUBLE_EQ(explicit_acc->total().epsilon, 1.618);

    // Shared default
    auto default_acc = Accountant::create(5.0, 0.0);
    default_acc->set_default();
    dp_ledger::spend(2.718);
    EXPECT_DOUBLE_EQ(default_acc->total().epsilon, 2.718);

    // Scoped acquisition
    auto scoped_acc = Accountant::create(5.0, 0.0);
    {
        auto scope = scoped_acc->scope();
        dp_ledger::spend(1.5705);
        dp_ledger::spend(1.5705);
    }
    EXPECT_DOUBLE_EQ(scoped_acc->total().epsilon, 3.141);

    EXPECT_EQ(explicit_acc->size(), 1u);
    EXPECT_EQ(default_acc->size(), 1u);
    EXPECT_EQ(scoped_acc->size(), 2u);
}

TEST_F(ScopeResolverTest, ExplicitAccountantWinsOverScopeAndDefault) {
    auto default_acc = Accountant::create(5.0);
    default_acc->set_default();
    auto scoped_acc = Accountant::create(5.0);
    auto explicit_acc = Accountant::create(5.0);

    dp_ledger::AccountantScope scope(scoped_acc);
    auto charged = dp_ledger::spend(1.0, 0.0, explicit_acc);

    EXPECT_EQ(charged, explicit_acc);
    EXPECT_EQ(explicit_acc->size(), 1u);
    EXPECT_EQ(scoped_acc->size(), 0u);
    EXPECT_EQ(default_acc->size(), 0u);
}

TEST_F(ScopeResolverTest, ScopeWinsOverDefault) {
    auto default_acc = Accountant::create(5.0);
    default_acc->set_default();
    auto scoped_acc = Accountant::create(5.0);

    {
        auto scope = scoped_acc->scope();
        EXPECT_EQ(ScopeResolver::instance().resolve(), scoped_acc);
        dp_ledger::spend(0.5);
    }
    EXPECT_EQ(ScopeResolver::instance().resolve(), default_acc);
    dp_ledger::spend(0.25);

    EXPECT_DOUBLE_EQ(scoped_acc->total().epsilon, 0.5);
    EXPECT_DOUBLE_EQ(default_acc->total().epsilon, 0.25);
}

TEST_F(ScopeResolverTest, NestedScopesRestoreOuterTarget) {
    auto outer = Accountant::create(5.0);
    auto inner = Accountant::create(5.0);

    auto outer_scope = outer->scope();
    EXPECT_EQ(ScopeResolver::instance().scope_depth(), 1u);
    {
        auto inner_scope = inner->scope();
        EXPECT_EQ(ScopeResolver::instance().scope_depth(), 2u);
        dp_ledger::spend(1.0);
    }
    EXPECT_EQ(ScopeResolver::instance().scope_depth(), 1u);
    EXPECT_EQ(ScopeResolver::instance().current_scope(), outer);
    dp_ledger::spend(2.0);

    EXPECT_DOUBLE_EQ(inner->total().epsilon, 1.0);
    EXPECT_DOUBLE_EQ(outer->total().epsilon, 2.0);
}

TEST_F(ScopeResolverTest, ScopeIsRestoredWhenBudgetErrorUnwinds) {
    auto previous = Accountant::create(5.0);
    previous->set_default();
    auto tight = Accountant::create(1.0);

    EXPECT_THROW({
        auto scope = tight->scope();
        dp_ledger::spend(0.75);
        dp_ledger::spend(0.75);
    }, dp_ledger::BudgetError);

    EXPECT_EQ(ScopeResolver::instance().scope_depth(), 0u);
    EXPECT_EQ(ScopeResolver::instance().resolve(), previous);
    EXPECT_EQ(tight->size(), 1u);
}

TEST_F(ScopeResolverTest, ScopeIsRestoredOnForeignException) {
    auto acc = Accountant::create(5.0);
    try {
        auto scope = acc->scope();
        dp_ledger::spend(1.0);
        throw std::runtime_error("mechanism failed");
    } catch (const std::runtime_error&) {
    }
    EXPECT_EQ(ScopeResolver::instance().scope_depth(), 0u);
    EXPECT_EQ(acc->size(), 1u);
}

TEST_F(ScopeResolverTest, SetDefaultReplacesPreviousDefault) {
    auto first = Accountant::create(5.0);
    auto second = Accountant::create(5.0);

    first->set_default();
    EXPECT_EQ(ScopeResolver::instance().default_accountant(), first);
    second->set_default();
    EXPECT_EQ(ScopeResolver::instance().default_accountant(), second);

    EXPECT_EQ(ScopeResolver::instance().pop_default(), second);
    EXPECT_EQ(ScopeResolver::instance().default_accountant(), nullptr);
}

TEST_F(ScopeResolverTest, FallsBackToUnconstrainedAccountant) {
    auto first = ScopeResolver::instance().resolve();
    ASSERT_NE(first, nullptr);
    EXPECT_TRUE(first->is_unconstrained());

    auto charged = dp_ledger::spend(1e6, 0.5);
    EXPECT_TRUE(charged->is_unconstrained());
    EXPECT_DOUBLE_EQ(charged->total().epsilon, 1e6);

    // Each fallback is a fresh ephemeral accountant
    EXPECT_NE(ScopeResolver::instance().resolve(), charged);
}

TEST_F(ScopeResolverTest, NullScopeIsRejected) {
    EXPECT_THROW(dp_ledger::AccountantScope scope(nullptr), dp_ledger::ConfigurationError);
    EXPECT_EQ(ScopeResolver::instance().scope_depth(), 0u);
}

TEST_F(ScopeResolverTest, ThreadScopesDoNotLeakButDefaultIsShared) {
    auto default_acc = Accountant::create(5.0);
    default_acc->set_default();
    auto main_scoped = Accountant::create(5.0);
    auto worker_scoped = Accountant::create(5.0);

    auto scope = main_scoped->scope();

    std::shared_ptr<Accountant> seen_by_worker_without_scope;
    std::shared_ptr<Accountant> seen_by_worker_with_scope;
    std::thread worker([&]() {
        seen_by_worker_without_scope = ScopeResolver::instance().resolve();
        dp_ledger::spend(0.5);
        auto worker_scope = worker_scoped->scope();
        seen_by_worker_with_scope = ScopeResolver::instance().resolve();
        dp_ledger::spend(0.25);
    });
    worker.join();

    EXPECT_EQ(seen_by_worker_without_scope, default_acc);
    EXPECT_EQ(seen_by_worker_with_scope, worker_scoped);
    EXPECT_EQ(ScopeResolver::instance().resolve(), main_scoped);
    EXPECT_DOUBLE_EQ(default_acc->total().epsilon, 0.5);
    EXPECT_DOUBLE_EQ(worker_scoped->total().epsilon, 0.25);
    EXPECT_EQ(main_scoped->size(), 0u);
}
