#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include "core/config.hpp"
#include "core/logger.hpp"
#include "server/membership.hpp"
#include "server/split_node.hpp"
#include "server/transfer.hpp"
using namespace std;

static json nodeConfig() {
    json config = defaultConfig();
    config["dataPath"] = string("./test-data/node/") + ::testing::UnitTest::GetInstance()->current_test_info()->name();
    config["settlementTtl"] = 600;
    config["transferTimeoutMs"] = 1000;
    config["transferRetries"] = 1;
    config["retryBackoffMs"] = 10;
    return config;
}

class SplitNodeTest : public ::testing::Test {
    protected:
        SplitNodeTest()
            : now(5000),
              membership(json::parse(R"({"1": ["alice", "bob", "carol"], "2": ["alice", "dave"]})")),
              network([this]() { return now.load(); }) {
            node.reset(new SplitNode(nodeConfig(), membership, network, [this]() { return now.load(); }));
        }

        void SetUp() override {
            Logger::setQuiet(true);
            node->init();
            node->deleteData();
            node->init();
            network.loadAccounts(json::parse(R"({"alice": 500, "bob": 500, "carol": 500, "dave": 500})"));
        }

        void TearDown() override {
            node->deleteData();
        }

        void reopen(const json& config = nodeConfig()) {
            node->shutdown();
            node.reset(new SplitNode(config, membership, network, [this]() { return now.load(); }));
            node->init();
        }

        std::atomic<Timestamp> now;
        StaticMembership membership;
        LocalTransferNetwork network;
        std::unique_ptr<SplitNode> node;
};

TEST_F(SplitNodeTest, expense_plan_and_settle) {
    Expense expense;
    ASSERT_EQ(node->applyExpense(1, "alice", 150, {"alice", "bob", "carol"}, expense), SUCCESS);
    SettlementPlan plan = node->computePlan(1);
    ASSERT_EQ(plan.size(), 2);

    for (const auto& t : plan) {
        SettlementRequest req;
        req.debtor = t.debtor;
        req.creditor = t.creditor;
        req.amount = t.amount;
        req.ttl = 0;
        req.group = 1;
        Settlement s;
        ASSERT_EQ(node->initiateSettlement(t.debtor, req, s), SUCCESS);
        EXPECT_EQ(s.getExpiresAt(), 5000 + 600);
        ASSERT_EQ(node->executeSettlement(s.getId(), t.debtor, s), SUCCESS);
        EXPECT_EQ(s.getState(), SETTLEMENT_COMPLETED);
    }
    EXPECT_EQ(network.getAccountBalance("alice"), 600);
    EXPECT_EQ(network.getAccountBalance("bob"), 450);
    EXPECT_EQ(network.getAccountBalance("carol"), 450);

    // settlements move funds outside the ledger, expense balances keep their history
    EXPECT_EQ(node->getBalance(1, "alice"), 100);
    EXPECT_EQ(node->listMemberSettlements("alice", 1, SETTLEMENT_COMPLETED).size(), 2);
}

TEST_F(SplitNodeTest, executed_settlement_marks_referenced_expense) {
    Expense expense;
    ASSERT_EQ(node->applyExpense(2, "dave", 80, {"alice", "dave"}, expense), SUCCESS);

    SettlementRequest req;
    req.debtor = "alice";
    req.creditor = "dave";
    req.amount = 40;
    req.ttl = 0;
    req.group = 2;
    req.expenseRef = 99;
    Settlement s;
    EXPECT_EQ(node->initiateSettlement("alice", req, s), NOT_FOUND);

    req.expenseRef = expense.getId();
    ASSERT_EQ(node->initiateSettlement("alice", req, s), SUCCESS);
    EXPECT_FALSE(node->isExpenseSettled(expense.getId()));
    ASSERT_EQ(node->executeSettlement(s.getId(), "alice", s), SUCCESS);
    EXPECT_TRUE(node->isExpenseSettled(expense.getId()));
    EXPECT_TRUE(node->listGroupExpenses(2, false).empty());
    EXPECT_EQ(node->getBalance(2, "alice"), -40);
}

TEST_F(SplitNodeTest, state_survives_restart) {
    Expense expense;
    ASSERT_EQ(node->applyExpense(1, "bob", 90, {"alice", "bob", "carol"}, expense), SUCCESS);
    SettlementRequest req;
    req.debtor = "carol";
    req.creditor = "bob";
    req.amount = 30;
    req.ttl = 100;
    Settlement pending;
    ASSERT_EQ(node->initiateSettlement("carol", req, pending), SUCCESS);

    reopen();
    EXPECT_EQ(node->getBalance(1, "bob"), 60);
    EXPECT_EQ(node->getGroupBalances(1).size(), 3);
    EXPECT_TRUE(node->verifyGroup(1));
    EXPECT_FALSE(node->rebuildBalances(1));
    EXPECT_EQ(node->countGroupExpenses(1), 1);

    Settlement loaded;
    ASSERT_EQ(node->getSettlement(pending.getId(), loaded), SUCCESS);
    EXPECT_EQ(loaded.getState(), SETTLEMENT_PENDING);
    EXPECT_EQ(loaded.getExpiresAt(), 5100);

    now = 5101;
    EXPECT_EQ(node->executeSettlement(pending.getId(), "carol", loaded), SETTLEMENT_EXPIRED);
    EXPECT_EQ(node->reclaimExpiredSettlements(), 1);
    EXPECT_EQ(node->getSettlement(pending.getId(), loaded), NOT_FOUND);
}

TEST_F(SplitNodeTest, cancel_and_reclaim_through_node) {
    SettlementRequest req;
    req.debtor = "bob";
    req.creditor = "alice";
    req.amount = 10;
    req.ttl = 50;
    Settlement first, second;
    ASSERT_EQ(node->initiateSettlement("bob", req, first), SUCCESS);
    ASSERT_EQ(node->initiateSettlement("bob", req, second), SUCCESS);
    ASSERT_EQ(node->cancelSettlement(first.getId(), "bob", first), SUCCESS);

    now = 5051;
    ASSERT_EQ(node->reclaimSettlement(second.getId(), second), SUCCESS);
    EXPECT_EQ(second.getState(), SETTLEMENT_RECLAIMED);
    EXPECT_EQ(node->reclaimSettlement(first.getId(), first), SETTLEMENT_CANCELLED);
    EXPECT_EQ(network.confirmedCount(), 0);
}

TEST_F(SplitNodeTest, late_confirmation_marks_referenced_expense) {
    json config = nodeConfig();
    config["transferTimeoutMs"] = 10;
    config["transferRetries"] = 0;
    reopen(config);
    network.setConfirmationDelay(std::chrono::milliseconds(150));

    Expense expense;
    ASSERT_EQ(node->applyExpense(2, "dave", 80, {"alice", "dave"}, expense), SUCCESS);
    SettlementRequest req;
    req.debtor = "alice";
    req.creditor = "dave";
    req.amount = 40;
    req.ttl = 0;
    req.expenseRef = expense.getId();
    Settlement s;
    ASSERT_EQ(node->initiateSettlement("alice", req, s), SUCCESS);
    EXPECT_EQ(node->executeSettlement(s.getId(), "alice", s), TRANSFER_TIMEOUT);
    EXPECT_FALSE(node->isExpenseSettled(expense.getId()));

    network.waitForPending();
    EXPECT_EQ(node->executeSettlement(s.getId(), "alice", s), ALREADY_EXECUTED);
    EXPECT_EQ(s.getState(), SETTLEMENT_COMPLETED);
    EXPECT_TRUE(node->isExpenseSettled(expense.getId()));
    EXPECT_EQ(network.confirmedCount(), 1);
}

TEST_F(SplitNodeTest, wiped_data_never_reuses_transfer_references) {
    SettlementRequest req;
    req.debtor = "bob";
    req.creditor = "alice";
    req.amount = 50;
    req.ttl = 0;
    Settlement first;
    ASSERT_EQ(node->initiateSettlement("bob", req, first), SUCCESS);
    ASSERT_EQ(node->executeSettlement(first.getId(), "bob", first), SUCCESS);

    node->deleteData();
    node->init();
    Settlement second;
    ASSERT_EQ(node->initiateSettlement("bob", req, second), SUCCESS);
    EXPECT_EQ(second.getId(), first.getId());
    ASSERT_EQ(node->executeSettlement(second.getId(), "bob", second), SUCCESS);
    EXPECT_EQ(network.getAccountBalance("bob"), 400);
    EXPECT_EQ(network.getAccountBalance("alice"), 600);
    EXPECT_EQ(network.confirmedCount(), 2);
}
