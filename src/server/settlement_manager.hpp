#pragma once
#include <chrono>
#include <mutex>
#include <optional>
#include <set>
#include <vector>
#include "../core/common.hpp"
#include "../core/constants.hpp"
#include "../core/settlement.hpp"
#include "../core/status.hpp"
#include "settlement_store.hpp"
#include "transfer.hpp"

/*
    Settlement lifecycle: PENDING -> COMPLETED | CANCELLED | RECLAIMED.

    execute() never holds the settlement lock across the transfer. The
    state flip to COMPLETED happens inside the transfer's commit hook as a
    compare-and-set on PENDING, so whichever of execute / cancel / reclaim
    gets there first wins and the others observe the changed state.
*/
class SettlementManager {
    public:
        SettlementManager(SettlementStore& store, TransferPrimitive& transfers, TimeSource clock, uint64_t defaultTtl = DEFAULT_SETTLEMENT_TTL_SEC);
        ExecutionStatus initiate(const MemberId& caller, const SettlementRequest& request, Settlement& settlement);
        ExecutionStatus execute(SettlementId id, const MemberId& caller, std::chrono::milliseconds timeout, Settlement& settlement);
        // retries execute after TRANSFER_TIMEOUT / TRANSFER_FAILED with doubling backoff
        ExecutionStatus executeWithRetry(SettlementId id, const MemberId& caller, std::chrono::milliseconds timeout, size_t retries, std::chrono::milliseconds backoff, Settlement& settlement);
        ExecutionStatus cancel(SettlementId id, const MemberId& caller, Settlement& settlement);
        ExecutionStatus reclaim(SettlementId id, Settlement& settlement);
        size_t reclaimExpired();
        ExecutionStatus getSettlement(SettlementId id, Settlement& settlement) const;
        bool isExecuted(SettlementId id) const;
        std::vector<Settlement> listMemberSettlements(const MemberId& member, std::optional<GroupId> group = std::nullopt, std::optional<SettlementState> state = std::nullopt, size_t limit = DEFAULT_LIST_LIMIT) const;
    protected:
        bool commitTransfer(const Settlement& expected, const TransferProof& proof, bool enforceExpiry, ExecutionStatus& reason);
        ExecutionStatus pendingStatus(const Settlement& settlement) const;
        void finishExecuting(SettlementId id);
        void reload(SettlementId id, Settlement& settlement) const;
        SettlementStore& store;
        TransferPrimitive& transfers;
        TimeSource clock;
        uint64_t defaultTtl;
        std::set<SettlementId> executing;
        mutable std::mutex settlement_mutex;
};
