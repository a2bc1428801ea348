#pragma once
#include "../core/common.hpp"
#include "../core/expense.hpp"
#include "data_store.hpp"
#include <mutex>
#include <map>
#include <vector>
#include "ledger_state.hpp"

/*
    Durable store for expenses, splits and the cached per (group, member)
    balances. Balances are persisted in the unsigned offset encoding and
    mirrored in memory so reads never touch history.
*/
class Ledger : public DataStore {
    public:
        Ledger();
        void init(const std::string& dbPath) override;
        SignedAmount getBalance(GroupId group, const MemberId& member) const;
        LedgerState getState(GroupId group) const;

        // Assigns the expense id and writes expense, splits, indexes and
        // balance deltas as one batch.
        ExpenseId commitExpense(Expense& expense, const LedgerState& deltas);
        void replaceGroupBalances(GroupId group, const LedgerState& state);

        bool getExpense(ExpenseId id, Expense& expense) const;
        std::vector<Expense> getGroupExpenses(GroupId group) const;
        std::vector<ExpenseId> getMemberExpenseIds(const MemberId& member) const;
        size_t countGroupExpenses(GroupId group) const;
        bool isExpenseSettled(ExpenseId id) const;
        void markExpenseSettled(ExpenseId id);
        ExpenseId getLastExpenseId() const;

    protected:
        void loadBalances();
        std::map<GroupId, LedgerState> balances;
        ExpenseId lastExpenseId;
        mutable std::mutex ledger_mutex;
};
