#pragma once
#include <vector>
#include "../core/common.hpp"
#include "ledger_state.hpp"

struct PlannedTransfer {
    MemberId debtor;
    MemberId creditor;
    TransactionAmount amount;
    json toJson() const;
};

typedef std::vector<PlannedTransfer> SettlementPlan;

class BalanceLedger;

/*
    Greedy debt netting: the largest remaining creditor is repeatedly paired
    with the largest remaining debtor. Equal amounts are broken by the
    lexicographically smaller member id. Each round zeroes at least one
    party so at most (#creditors + #debtors - 1) transfers are produced.
    The plan zeroes every balance but is not guaranteed to be the shortest.
*/
class SettlementOptimizer {
    public:
        explicit SettlementOptimizer(const BalanceLedger& ledger);
        SettlementPlan computePlan(GroupId group) const;
        static SettlementPlan planFor(const LedgerState& balances);
        static TransactionAmount planTotal(const SettlementPlan& plan);
    protected:
        const BalanceLedger& ledger;
};
