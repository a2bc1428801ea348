#pragma once
#include <vector>
#include "common.hpp"
#include "split.hpp"

struct Split {
    ExpenseId expenseId;
    MemberId member;
    TransactionAmount owed;
    json toJson() const;
};

class Expense {
    public:
        Expense();
        Expense(const json& data);
        Expense(GroupId group, const MemberId& payer, TransactionAmount amount, const SplitShares& shares, Timestamp createdAt);
        json toJson() const;
        ExpenseId getId() const;
        void setId(ExpenseId id);
        GroupId getGroup() const;
        MemberId getPayer() const;
        TransactionAmount getAmount() const;
        Timestamp getCreatedAt() const;
        std::vector<MemberId> getParticipants() const;
        const std::vector<Split>& getSplits() const;
        TransactionAmount getShare(const MemberId& member) const;
    protected:
        ExpenseId id;
        GroupId group;
        MemberId payer;
        TransactionAmount amount;
        Timestamp createdAt;
        std::vector<Split> splits;
};

bool operator==(const Split& a, const Split& b);
