#include "expense.hpp"
using namespace std;

json Split::toJson() const {
    json result;
    result["expenseId"] = expenseId;
    result["member"] = member;
    result["owed"] = owed;
    return result;
}

bool operator==(const Split& a, const Split& b) {
    return a.expenseId == b.expenseId && a.member == b.member && a.owed == b.owed;
}

Expense::Expense() : id(NULL_EXPENSE), group(NULL_GROUP), amount(0), createdAt(0) {
}

Expense::Expense(GroupId group, const MemberId& payer, TransactionAmount amount, const SplitShares& shares, Timestamp createdAt)
    : id(NULL_EXPENSE), group(group), payer(payer), amount(amount), createdAt(createdAt) {
    for (const auto& share : shares) {
        splits.push_back(Split{NULL_EXPENSE, share.first, share.second});
    }
}

Expense::Expense(const json& data) {
    id = data["id"];
    group = data["group"];
    payer = data["payer"].get<string>();
    amount = data["amount"];
    createdAt = data["createdAt"];
    for (const auto& s : data["splits"]) {
        splits.push_back(Split{id, s["member"].get<string>(), s["owed"].get<TransactionAmount>()});
    }
}

json Expense::toJson() const {
    json result;
    result["id"] = id;
    result["group"] = group;
    result["payer"] = payer;
    result["amount"] = amount;
    result["createdAt"] = createdAt;
    result["splits"] = json::array();
    for (const auto& s : splits) {
        result["splits"].push_back(s.toJson());
    }
    return result;
}

ExpenseId Expense::getId() const {
    return id;
}

void Expense::setId(ExpenseId newId) {
    id = newId;
    for (auto& s : splits) {
        s.expenseId = newId;
    }
}

GroupId Expense::getGroup() const {
    return group;
}

MemberId Expense::getPayer() const {
    return payer;
}

TransactionAmount Expense::getAmount() const {
    return amount;
}

Timestamp Expense::getCreatedAt() const {
    return createdAt;
}

vector<MemberId> Expense::getParticipants() const {
    vector<MemberId> ret;
    for (const auto& s : splits) ret.push_back(s.member);
    return ret;
}

const vector<Split>& Expense::getSplits() const {
    return splits;
}

TransactionAmount Expense::getShare(const MemberId& member) const {
    for (const auto& s : splits) {
        if (s.member == member) return s.owed;
    }
    return 0;
}
