#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <vector>
#include "../core/common.hpp"
#include "../core/expense.hpp"
#include "../core/settlement.hpp"
#include "../core/status.hpp"
#include "balance_ledger.hpp"
#include "ledger.hpp"
#include "membership.hpp"
#include "settlement_manager.hpp"
#include "settlement_optimizer.hpp"
#include "settlement_store.hpp"
#include "transfer.hpp"

/*
    Entry point for the request layer. Owns the ledger and settlement
    stores for its lifetime (init() at start, shutdown() at exit) and
    borrows the membership oracle and transfer primitive.
*/
class SplitNode {
    public:
        SplitNode(const json& config, const MembershipOracle& membership, TransferPrimitive& transfers, TimeSource clock);
        ~SplitNode();
        void init();
        void shutdown();
        void deleteData();

        ExecutionStatus applyExpense(GroupId group, const MemberId& payer, TransactionAmount amount, const std::vector<MemberId>& participants, Expense& expense, SplitPolicy policy = SPLIT_IN_GIVEN_ORDER);
        SignedAmount getBalance(GroupId group, const MemberId& member) const;
        LedgerState getGroupBalances(GroupId group) const;
        SettlementPlan computePlan(GroupId group) const;
        bool rebuildBalances(GroupId group);
        bool verifyGroup(GroupId group) const;

        bool getExpense(ExpenseId id, Expense& expense) const;
        std::vector<Expense> listGroupExpenses(GroupId group, bool includeSettled = true, size_t limit = DEFAULT_LIST_LIMIT, size_t offset = 0) const;
        std::vector<Expense> listMemberExpenses(const MemberId& member, std::optional<GroupId> group = std::nullopt, size_t limit = DEFAULT_LIST_LIMIT) const;
        size_t countGroupExpenses(GroupId group) const;
        bool isExpenseSettled(ExpenseId id) const;
        ExecutionStatus markExpenseSettled(ExpenseId id);

        ExecutionStatus initiateSettlement(const MemberId& caller, const SettlementRequest& request, Settlement& settlement);
        ExecutionStatus executeSettlement(SettlementId id, const MemberId& caller, Settlement& settlement);
        ExecutionStatus cancelSettlement(SettlementId id, const MemberId& caller, Settlement& settlement);
        ExecutionStatus reclaimSettlement(SettlementId id, Settlement& settlement);
        size_t reclaimExpiredSettlements();
        ExecutionStatus getSettlement(SettlementId id, Settlement& settlement) const;
        std::vector<Settlement> listMemberSettlements(const MemberId& member, std::optional<GroupId> group = std::nullopt, std::optional<SettlementState> state = std::nullopt, size_t limit = DEFAULT_LIST_LIMIT) const;

    protected:
        json config;
        Ledger ledger;
        SettlementStore settlementStore;
        BalanceLedger balances;
        SettlementOptimizer optimizer;
        SettlementManager settlements;
        TransferPrimitive& transfers;
        std::chrono::milliseconds transferTimeout;
        size_t transferRetries;
        std::chrono::milliseconds retryBackoff;
        bool running;
};
