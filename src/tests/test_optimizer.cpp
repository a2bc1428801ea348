#include <gtest/gtest.h>
#include "core/logger.hpp"
#include "server/balance_ledger.hpp"
#include "server/executor.hpp"
#include "server/ledger.hpp"
#include "server/membership.hpp"
#include "server/settlement_optimizer.hpp"
using namespace std;

// applies the plan to the balances, which must leave every member at zero
static LedgerState applyPlan(LedgerState balances, const SettlementPlan& plan) {
    for (const auto& t : plan) {
        balances[t.debtor] += (SignedAmount) t.amount;
        balances[t.creditor] -= (SignedAmount) t.amount;
    }
    return balances;
}

static void expectSettles(const LedgerState& balances, const SettlementPlan& plan) {
    size_t creditors = 0, debtors = 0;
    TransactionAmount owed = 0;
    for (const auto& entry : balances) {
        if (entry.second > 0) {
            creditors++;
            owed += entry.second;
        }
        if (entry.second < 0) debtors++;
    }
    for (const auto& t : plan) {
        EXPECT_GT(t.amount, 0);
        EXPECT_NE(t.debtor, t.creditor);
        EXPECT_LT(balances.at(t.debtor), 0);
        EXPECT_GT(balances.at(t.creditor), 0);
    }
    for (const auto& entry : applyPlan(balances, plan)) {
        EXPECT_EQ(entry.second, 0) << entry.first;
    }
    if (creditors + debtors > 0) {
        EXPECT_LE(plan.size(), creditors + debtors - 1);
    }
    EXPECT_EQ(SettlementOptimizer::planTotal(plan), owed);
}

TEST(optimizer, one_creditor_two_debtors) {
    LedgerState balances = {{"alice", 100}, {"bob", -50}, {"carol", -50}};
    SettlementPlan plan = SettlementOptimizer::planFor(balances);
    ASSERT_EQ(plan.size(), 2);
    // equal debts go to the smaller member id first
    EXPECT_EQ(plan[0].debtor, "bob");
    EXPECT_EQ(plan[0].creditor, "alice");
    EXPECT_EQ(plan[0].amount, 50);
    EXPECT_EQ(plan[1].debtor, "carol");
    EXPECT_EQ(plan[1].creditor, "alice");
    EXPECT_EQ(plan[1].amount, 50);
    expectSettles(balances, plan);
}

TEST(optimizer, largest_pairs_first) {
    LedgerState balances = {{"alice", 70}, {"bob", 30}, {"carol", -60}, {"dave", -40}};
    SettlementPlan plan = SettlementOptimizer::planFor(balances);
    ASSERT_EQ(plan.size(), 3);
    EXPECT_EQ(plan[0].debtor, "carol");
    EXPECT_EQ(plan[0].creditor, "alice");
    EXPECT_EQ(plan[0].amount, 60);
    EXPECT_EQ(plan[1].debtor, "dave");
    EXPECT_EQ(plan[1].creditor, "bob");
    EXPECT_EQ(plan[1].amount, 30);
    EXPECT_EQ(plan[2].debtor, "dave");
    EXPECT_EQ(plan[2].creditor, "alice");
    EXPECT_EQ(plan[2].amount, 10);
    expectSettles(balances, plan);
}

TEST(optimizer, tie_break_is_independent_of_insertion) {
    LedgerState forward, backward;
    vector<MemberId> names = {"erin", "bob", "dave", "alice", "carol", "frank"};
    for (size_t i = 0; i < names.size(); i++) forward[names[i]] = i % 2 == 0 ? 25 : -25;
    for (auto it = names.rbegin(); it != names.rend(); ++it) backward[*it] = forward[*it];

    SettlementPlan a = SettlementOptimizer::planFor(forward);
    SettlementPlan b = SettlementOptimizer::planFor(backward);
    ASSERT_EQ(a.size(), 3);
    ASSERT_EQ(b.size(), a.size());
    for (size_t i = 0; i < a.size(); i++) {
        EXPECT_EQ(a[i].debtor, b[i].debtor);
        EXPECT_EQ(a[i].creditor, b[i].creditor);
        EXPECT_EQ(a[i].amount, b[i].amount);
    }
    // creditors erin, dave, carol; debtors alice, bob, frank
    EXPECT_EQ(a[0].creditor, "carol");
    EXPECT_EQ(a[0].debtor, "alice");
    expectSettles(forward, a);
}

TEST(optimizer, empty_and_settled_groups) {
    EXPECT_TRUE(SettlementOptimizer::planFor(LedgerState()).empty());
    EXPECT_TRUE(SettlementOptimizer::planFor(LedgerState({{"alice", 0}, {"bob", 0}})).empty());
}

TEST(optimizer, many_parties_settle) {
    LedgerState balances;
    SignedAmount running = 0;
    for (int i = 0; i < 40; i++) {
        SignedAmount value = ((i * 7919) % 1000) - 500;
        balances["m" + std::to_string(i)] = value;
        running += value;
    }
    balances["last"] = -running;
    expectSettles(balances, SettlementOptimizer::planFor(balances));
}

TEST(optimizer, non_zero_sum_is_corruption) {
    Logger::setQuiet(true);
    EXPECT_THROW(SettlementOptimizer::planFor(LedgerState({{"alice", 100}, {"bob", -40}})), LedgerCorruption);
}

TEST(optimizer, plan_from_ledger) {
    Logger::setQuiet(true);
    Ledger ledger;
    ledger.init("./test-data/optimizer");
    ledger.deleteDB();
    ledger.init("./test-data/optimizer");
    StaticMembership membership(json::parse(R"({"7": ["alice", "bob", "carol"]})"));
    BalanceLedger balances(ledger, membership, []() { return (Timestamp) 1; });
    SettlementOptimizer optimizer(balances);

    Expense expense;
    ASSERT_EQ(balances.applyExpense(7, "alice", 150, {"alice", "bob", "carol"}, expense), SUCCESS);
    SettlementPlan plan = optimizer.computePlan(7);
    ASSERT_EQ(plan.size(), 2);
    EXPECT_EQ(plan[0].toJson()["debtor"], "bob");
    EXPECT_EQ(plan[1].toJson()["debtor"], "carol");
    EXPECT_EQ(plan[1].toJson()["amount"], 50);
    EXPECT_TRUE(optimizer.computePlan(8).empty());
    ledger.deleteDB();
}
