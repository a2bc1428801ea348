#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "../core/common.hpp"
#include "../core/constants.hpp"
#include "../core/expense.hpp"
#include "../core/split.hpp"
#include "../core/status.hpp"
#include "ledger.hpp"
#include "ledger_state.hpp"
#include "membership.hpp"

/*
    Posts expenses against the per group balances. Mutations of one group
    are serialised by that group's mutex, different groups proceed in
    parallel. After every mutation the group must still sum to zero,
    otherwise LedgerCorruption is thrown.
*/
class BalanceLedger {
    public:
        BalanceLedger(Ledger& ledger, const MembershipOracle& membership, TimeSource clock, size_t maxParticipants = MAX_SPLIT_PARTICIPANTS);
        ExecutionStatus applyExpense(GroupId group, const MemberId& payer, TransactionAmount amount, const std::vector<MemberId>& participants, Expense& expense, SplitPolicy policy = SPLIT_IN_GIVEN_ORDER);
        SignedAmount getBalance(GroupId group, const MemberId& member) const;
        // members with a non-zero balance only
        LedgerState getGroupBalances(GroupId group) const;
        bool verifyGroup(GroupId group) const;
        // replays the group's expenses, returns true when the cache had drifted
        bool rebuildBalances(GroupId group);

        bool getExpense(ExpenseId id, Expense& expense) const;
        std::vector<Expense> listGroupExpenses(GroupId group, bool includeSettled = true, size_t limit = DEFAULT_LIST_LIMIT, size_t offset = 0) const;
        std::vector<Expense> listMemberExpenses(const MemberId& member, std::optional<GroupId> group = std::nullopt, size_t limit = DEFAULT_LIST_LIMIT) const;
        size_t countGroupExpenses(GroupId group) const;
        ExecutionStatus markExpenseSettled(ExpenseId id);
        bool isExpenseSettled(ExpenseId id) const;
    protected:
        ExecutionStatus validate(GroupId group, const MemberId& payer, TransactionAmount amount, const std::vector<MemberId>& participants) const;
        std::mutex& groupLock(GroupId group);
        Ledger& ledger;
        const MembershipOracle& membership;
        TimeSource clock;
        size_t maxParticipants;
        std::map<GroupId, std::unique_ptr<std::mutex>> groupLocks;
        std::mutex groupLocksMutex;
};

std::string balanceStatus(SignedAmount balance);
