#include <algorithm>
#include <set>
#include "../core/logger.hpp"
#include "../core/status.hpp"
#include "balance_ledger.hpp"
#include "executor.hpp"
#include "settlement_optimizer.hpp"
using namespace std;

json PlannedTransfer::toJson() const {
    json result;
    result["debtor"] = debtor;
    result["creditor"] = creditor;
    result["amount"] = amount;
    return result;
}

typedef pair<TransactionAmount, MemberId> Party;

// largest amount first, ties go to the smaller member id
struct PartyComparator {
    bool operator()(const Party& a, const Party& b) const {
        if (a.first != b.first) {
            return a.first > b.first;
        }
        return a.second < b.second;
    }
};

SettlementOptimizer::SettlementOptimizer(const BalanceLedger& ledger) : ledger(ledger) {
}

SettlementPlan SettlementOptimizer::computePlan(GroupId group) const {
    SettlementPlan plan = planFor(ledger.getGroupBalances(group));
    Logger::logStatus("Calculated " + std::to_string(plan.size()) + " settlements for group " + std::to_string(group));
    return plan;
}

SettlementPlan SettlementOptimizer::planFor(const LedgerState& balances) {
    Executor::CheckZeroSum(balances, "settlement plan input");

    std::set<Party, PartyComparator> creditors;
    std::set<Party, PartyComparator> debtors;
    for (const auto& entry : balances) {
        if (entry.second > 0) {
            creditors.insert(make_pair((TransactionAmount) entry.second, entry.first));
        } else if (entry.second < 0) {
            debtors.insert(make_pair((TransactionAmount) (-entry.second), entry.first));
        }
    }

    SettlementPlan plan;
    while (!creditors.empty() && !debtors.empty()) {
        Party creditor = *creditors.begin();
        Party debtor = *debtors.begin();
        creditors.erase(creditors.begin());
        debtors.erase(debtors.begin());

        TransactionAmount amount = std::min(creditor.first, debtor.first);
        plan.push_back(PlannedTransfer{debtor.second, creditor.second, amount});

        if (creditor.first > amount) creditors.insert(make_pair(creditor.first - amount, creditor.second));
        if (debtor.first > amount) debtors.insert(make_pair(debtor.first - amount, debtor.second));
    }

    if (!creditors.empty() || !debtors.empty()) {
        throw LedgerCorruption("settlement plan left unmatched balances");
    }
    return plan;
}

TransactionAmount SettlementOptimizer::planTotal(const SettlementPlan& plan) {
    TransactionAmount total = 0;
    for (const auto& t : plan) total += t.amount;
    return total;
}
