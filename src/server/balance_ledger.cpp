#include <set>
#include "../core/helpers.hpp"
#include "../core/logger.hpp"
#include "executor.hpp"
#include "balance_ledger.hpp"
using namespace std;

string balanceStatus(SignedAmount balance) {
    if (balance > 0) return "owed";
    if (balance < 0) return "owes";
    return "settled";
}

BalanceLedger::BalanceLedger(Ledger& ledger, const MembershipOracle& membership, TimeSource clock, size_t maxParticipants)
    : ledger(ledger), membership(membership), clock(clock), maxParticipants(maxParticipants) {
}

std::mutex& BalanceLedger::groupLock(GroupId group) {
    std::lock_guard<std::mutex> lock(groupLocksMutex);
    auto it = groupLocks.find(group);
    if (it == groupLocks.end()) {
        it = groupLocks.emplace(group, std::make_unique<std::mutex>()).first;
    }
    return *it->second;
}

ExecutionStatus BalanceLedger::validate(GroupId group, const MemberId& payer, TransactionAmount amount, const vector<MemberId>& participants) const {
    if (amount == 0 || amount >= BALANCE_MAX_MAGNITUDE) return INVALID_AMOUNT;
    if (participants.empty()) return EMPTY_PARTICIPANTS;
    if (participants.size() > maxParticipants) return TOO_MANY_PARTICIPANTS;

    std::set<MemberId> seen;
    for (const auto& p : participants) {
        if (!seen.insert(p).second) return DUPLICATE_PARTICIPANT;
    }
    if (seen.count(payer) == 0) return PAYER_NOT_PARTICIPANT;
    for (const auto& p : participants) {
        if (!membership.isMember(group, p)) return NOT_A_MEMBER;
    }
    return SUCCESS;
}

ExecutionStatus BalanceLedger::applyExpense(GroupId group, const MemberId& payer, TransactionAmount amount, const vector<MemberId>& participants, Expense& expense, SplitPolicy policy) {
    ExecutionStatus status = validate(group, payer, amount, participants);
    if (status != SUCCESS) {
        Logger::logStatus("Rejected expense in group " + std::to_string(group) + ": " + executionStatusAsString(status));
        return status;
    }

    SplitShares shares;
    status = computeSplit(amount, orderParticipants(payer, participants, policy), shares, maxParticipants);
    if (status != SUCCESS) return status;

    std::lock_guard<std::mutex> lock(groupLock(group));
    Expense pending(group, payer, amount, shares, clock());
    LedgerState deltas;
    status = Executor::ExecuteExpense(pending, deltas);
    if (status != SUCCESS) return status;
    Executor::CheckZeroSum(deltas, "expense deltas for group " + std::to_string(group));

    ledger.commitExpense(pending, deltas);
    Executor::CheckZeroSum(ledger.getState(group), "group " + std::to_string(group) + " after expense " + std::to_string(pending.getId()));

    Logger::logStatus("Posted expense " + std::to_string(pending.getId()) + " in group " + std::to_string(group) +
        ". Payer: " + payer + ". Amount: " + std::to_string(amount) + ". Split: " + memberListToString(pending.getParticipants()));
    expense = pending;
    return SUCCESS;
}

SignedAmount BalanceLedger::getBalance(GroupId group, const MemberId& member) const {
    return ledger.getBalance(group, member);
}

LedgerState BalanceLedger::getGroupBalances(GroupId group) const {
    LedgerState nonZero;
    for (const auto& entry : ledger.getState(group)) {
        if (entry.second != 0) nonZero[entry.first] = entry.second;
    }
    return nonZero;
}

bool BalanceLedger::verifyGroup(GroupId group) const {
    return Executor::Total(ledger.getState(group)) == 0;
}

bool BalanceLedger::rebuildBalances(GroupId group) {
    std::lock_guard<std::mutex> lock(groupLock(group));
    LedgerState replayed = Executor::ReplayExpenses(ledger.getGroupExpenses(group));
    Executor::CheckZeroSum(replayed, "replay of group " + std::to_string(group));

    LedgerState cached = ledger.getState(group);
    bool drifted = false;
    for (const auto& entry : replayed) {
        auto it = cached.find(entry.first);
        if (it == cached.end() || it->second != entry.second) drifted = true;
    }
    for (const auto& entry : cached) {
        if (replayed.find(entry.first) == replayed.end() && entry.second != 0) drifted = true;
    }
    ledger.replaceGroupBalances(group, replayed);
    if (drifted) {
        Logger::logWarning("Balances of group " + std::to_string(group) + " drifted from history, rebuilt from " +
            std::to_string(ledger.countGroupExpenses(group)) + " expenses");
    } else {
        Logger::logStatus("Balances of group " + std::to_string(group) + " match history");
    }
    return drifted;
}

bool BalanceLedger::getExpense(ExpenseId id, Expense& expense) const {
    return ledger.getExpense(id, expense);
}

vector<Expense> BalanceLedger::listGroupExpenses(GroupId group, bool includeSettled, size_t limit, size_t offset) const {
    vector<Expense> all = ledger.getGroupExpenses(group);
    vector<Expense> ret;
    size_t skipped = 0;
    // newest first
    for (auto it = all.rbegin(); it != all.rend() && ret.size() < limit; ++it) {
        if (!includeSettled && ledger.isExpenseSettled(it->getId())) continue;
        if (skipped < offset) {
            skipped++;
            continue;
        }
        ret.push_back(*it);
    }
    return ret;
}

vector<Expense> BalanceLedger::listMemberExpenses(const MemberId& member, optional<GroupId> group, size_t limit) const {
    vector<ExpenseId> ids = ledger.getMemberExpenseIds(member);
    vector<Expense> ret;
    for (auto it = ids.rbegin(); it != ids.rend() && ret.size() < limit; ++it) {
        Expense e;
        if (!ledger.getExpense(*it, e)) continue;
        if (group && e.getGroup() != *group) continue;
        ret.push_back(e);
    }
    return ret;
}

size_t BalanceLedger::countGroupExpenses(GroupId group) const {
    return ledger.countGroupExpenses(group);
}

ExecutionStatus BalanceLedger::markExpenseSettled(ExpenseId id) {
    Expense e;
    if (!ledger.getExpense(id, e)) return NOT_FOUND;
    ledger.markExpenseSettled(id);
    Logger::logStatus("Expense " + std::to_string(id) + " marked settled");
    return SUCCESS;
}

bool BalanceLedger::isExpenseSettled(ExpenseId id) const {
    return ledger.isExpenseSettled(id);
}
