#pragma once
#include <optional>
#include "common.hpp"

enum SettlementState {
    SETTLEMENT_PENDING,
    SETTLEMENT_COMPLETED,
    SETTLEMENT_CANCELLED,
    SETTLEMENT_RECLAIMED
};

std::string settlementStateAsString(SettlementState state);
SettlementState settlementStateFromString(const std::string& state);

struct TransferProof {
    std::string transferId;
    std::string reference;
    MemberId from;
    MemberId to;
    TransactionAmount amount;
    Timestamp confirmedAt;
    json toJson() const;
    static TransferProof fromJson(const json& data);
};

struct SettlementRequest {
    MemberId debtor;
    MemberId creditor;
    TransactionAmount amount;
    uint64_t ttl;
    std::optional<GroupId> group;
    std::optional<ExpenseId> expenseRef;
};

class Settlement {
    public:
        Settlement();
        Settlement(const json& data);
        // origin identifies the store that issued id, so references stay unique
        // across stores and across a wiped store that restarts its ids
        Settlement(SettlementId id, const std::string& origin, const SettlementRequest& request, Timestamp createdAt);
        json toJson() const;
        SettlementId getId() const;
        const std::string& getOrigin() const;
        const MemberId& getDebtor() const;
        const MemberId& getCreditor() const;
        TransactionAmount getAmount() const;
        std::optional<GroupId> getGroup() const;
        std::optional<ExpenseId> getExpenseRef() const;
        SettlementState getState() const;
        Timestamp getCreatedAt() const;
        Timestamp getExpiresAt() const;
        Timestamp getCompletedAt() const;
        const std::optional<TransferProof>& getTransferProof() const;
        bool isExpired(Timestamp now) const;
        // reference the transfer primitive uses to deduplicate submissions
        std::string transferReference() const;

        void markCompleted(const TransferProof& proof, Timestamp now);
        void markCancelled();
        void markReclaimed();
    protected:
        SettlementId id;
        std::string origin;
        MemberId debtor;
        MemberId creditor;
        TransactionAmount amount;
        std::optional<GroupId> group;
        std::optional<ExpenseId> expenseRef;
        SettlementState state;
        Timestamp createdAt;
        Timestamp expiresAt;
        Timestamp completedAt;
        std::optional<TransferProof> proof;
};
