#pragma once
#include <vector>
#include "../core/common.hpp"
#include "../core/expense.hpp"
#include "../core/status.hpp"
#include "ledger_state.hpp"

class Executor {
    public:
        // credits the payer with the full amount and debits every split
        static ExecutionStatus ExecuteExpense(const Expense& expense, LedgerState& deltas);
        static LedgerState ReplayExpenses(const std::vector<Expense>& expenses);
        static SignedAmount Total(const LedgerState& state);
        // throws LedgerCorruption unless the state sums to zero
        static void CheckZeroSum(const LedgerState& state, const std::string& context);
};
