#include "../core/constants.hpp"
#include "../core/logger.hpp"
#include "executor.hpp"
using namespace std;

static void deposit(const MemberId& to, TransactionAmount amt, LedgerState& deltas) {
    auto receiverDelta = deltas.find(to);
    if (receiverDelta == deltas.end()) {
        deltas.insert(pair<MemberId, SignedAmount>(to, (SignedAmount) amt));
    } else {
        receiverDelta->second += (SignedAmount) amt;
    }
}

static void withdraw(const MemberId& from, TransactionAmount amt, LedgerState& deltas) {
    auto senderDelta = deltas.find(from);
    if (senderDelta == deltas.end()) {
        deltas.insert(pair<MemberId, SignedAmount>(from, -(SignedAmount) amt));
    } else {
        senderDelta->second -= (SignedAmount) amt;
    }
}

ExecutionStatus Executor::ExecuteExpense(const Expense& expense, LedgerState& deltas) {
    if (expense.getAmount() == 0) return INVALID_AMOUNT;
    if (expense.getSplits().empty()) return EMPTY_PARTICIPANTS;

    TransactionAmount distributed = 0;
    deposit(expense.getPayer(), expense.getAmount(), deltas);
    for (const auto& split : expense.getSplits()) {
        withdraw(split.member, split.owed, deltas);
        distributed += split.owed;
    }
    if (distributed != expense.getAmount()) {
        throw LedgerCorruption("splits of expense " + std::to_string(expense.getId()) + " sum to " +
            std::to_string(distributed) + ", expected " + std::to_string(expense.getAmount()));
    }
    return SUCCESS;
}

LedgerState Executor::ReplayExpenses(const vector<Expense>& expenses) {
    LedgerState state;
    for (const auto& expense : expenses) {
        ExecutionStatus status = ExecuteExpense(expense, state);
        if (status != SUCCESS) {
            throw LedgerCorruption("stored expense " + std::to_string(expense.getId()) + " fails to replay: " + executionStatusAsString(status));
        }
    }
    return state;
}

SignedAmount Executor::Total(const LedgerState& state) {
    // credits and debits summed apart as magnitudes, each kept below 2^63
    uint64_t credits = 0;
    uint64_t debits = 0;
    for (const auto& entry : state) {
        if (entry.second >= 0) {
            credits += (uint64_t) entry.second;
        } else {
            debits += (uint64_t) (-(entry.second + 1)) + 1;
        }
        if (credits >= BALANCE_SIGN_OFFSET || debits >= BALANCE_SIGN_OFFSET) {
            throw LedgerCorruption("balances exceed the representable group total at member " + entry.first);
        }
    }
    if (credits >= debits) return (SignedAmount) (credits - debits);
    return -(SignedAmount) (debits - credits);
}

void Executor::CheckZeroSum(const LedgerState& state, const string& context) {
    SignedAmount total = Total(state);
    if (total != 0) {
        Logger::logError(RED + "[FATAL]" + RESET, context + ": balances sum to " + std::to_string(total));
        throw LedgerCorruption(context + ": balances sum to " + std::to_string(total));
    }
}
