#include <stdexcept>
#include "settlement.hpp"
using namespace std;

string settlementStateAsString(SettlementState state) {
    switch(state) {
        case SETTLEMENT_PENDING:
            return "pending";
        case SETTLEMENT_COMPLETED:
            return "completed";
        case SETTLEMENT_CANCELLED:
            return "cancelled";
        case SETTLEMENT_RECLAIMED:
            return "reclaimed";
    }
    return "unknown";
}

SettlementState settlementStateFromString(const string& state) {
    if (state == "pending") return SETTLEMENT_PENDING;
    if (state == "completed") return SETTLEMENT_COMPLETED;
    if (state == "cancelled") return SETTLEMENT_CANCELLED;
    if (state == "reclaimed") return SETTLEMENT_RECLAIMED;
    throw std::runtime_error("Unknown settlement state: " + state);
}

json TransferProof::toJson() const {
    json result;
    result["transferId"] = transferId;
    result["reference"] = reference;
    result["from"] = from;
    result["to"] = to;
    result["amount"] = amount;
    result["confirmedAt"] = confirmedAt;
    return result;
}

TransferProof TransferProof::fromJson(const json& data) {
    TransferProof proof;
    proof.transferId = data["transferId"].get<string>();
    proof.reference = data["reference"].get<string>();
    proof.from = data["from"].get<string>();
    proof.to = data["to"].get<string>();
    proof.amount = data["amount"];
    proof.confirmedAt = data["confirmedAt"];
    return proof;
}

Settlement::Settlement() : id(NULL_SETTLEMENT), amount(0), state(SETTLEMENT_PENDING), createdAt(0), expiresAt(0), completedAt(0) {
}

Settlement::Settlement(SettlementId id, const string& origin, const SettlementRequest& request, Timestamp createdAt)
    : id(id), origin(origin), debtor(request.debtor), creditor(request.creditor), amount(request.amount),
      group(request.group), expenseRef(request.expenseRef), state(SETTLEMENT_PENDING),
      createdAt(createdAt), expiresAt(createdAt + request.ttl), completedAt(0) {
}

Settlement::Settlement(const json& data) {
    id = data["id"];
    origin = data["origin"].get<string>();
    debtor = data["debtor"].get<string>();
    creditor = data["creditor"].get<string>();
    amount = data["amount"];
    if (!data["group"].is_null()) group = data["group"].get<GroupId>();
    if (!data["expenseRef"].is_null()) expenseRef = data["expenseRef"].get<ExpenseId>();
    state = settlementStateFromString(data["state"].get<string>());
    createdAt = data["createdAt"];
    expiresAt = data["expiresAt"];
    completedAt = data["completedAt"];
    if (!data["transferProof"].is_null()) proof = TransferProof::fromJson(data["transferProof"]);
}

json Settlement::toJson() const {
    json result;
    result["id"] = id;
    result["origin"] = origin;
    result["debtor"] = debtor;
    result["creditor"] = creditor;
    result["amount"] = amount;
    result["group"] = group ? json(*group) : json(nullptr);
    result["expenseRef"] = expenseRef ? json(*expenseRef) : json(nullptr);
    result["state"] = settlementStateAsString(state);
    result["createdAt"] = createdAt;
    result["expiresAt"] = expiresAt;
    result["completedAt"] = completedAt;
    result["transferProof"] = proof ? proof->toJson() : json(nullptr);
    return result;
}

SettlementId Settlement::getId() const {
    return id;
}

const string& Settlement::getOrigin() const {
    return origin;
}

const MemberId& Settlement::getDebtor() const {
    return debtor;
}

const MemberId& Settlement::getCreditor() const {
    return creditor;
}

TransactionAmount Settlement::getAmount() const {
    return amount;
}

optional<GroupId> Settlement::getGroup() const {
    return group;
}

optional<ExpenseId> Settlement::getExpenseRef() const {
    return expenseRef;
}

SettlementState Settlement::getState() const {
    return state;
}

Timestamp Settlement::getCreatedAt() const {
    return createdAt;
}

Timestamp Settlement::getExpiresAt() const {
    return expiresAt;
}

Timestamp Settlement::getCompletedAt() const {
    return completedAt;
}

const optional<TransferProof>& Settlement::getTransferProof() const {
    return proof;
}

bool Settlement::isExpired(Timestamp now) const {
    return now > expiresAt;
}

string Settlement::transferReference() const {
    return "settlement:" + origin + ":" + std::to_string(id);
}

void Settlement::markCompleted(const TransferProof& transferProof, Timestamp now) {
    state = SETTLEMENT_COMPLETED;
    proof = transferProof;
    completedAt = now;
}

void Settlement::markCancelled() {
    state = SETTLEMENT_CANCELLED;
}

void Settlement::markReclaimed() {
    state = SETTLEMENT_RECLAIMED;
}
