#include <algorithm>
#include <memory>
#include <thread>
#include "../core/logger.hpp"
#include "settlement_manager.hpp"
using namespace std;

namespace {

// releases the in-flight claim on every exit path of execute()
class ExecutingClaim {
    public:
        ExecutingClaim(std::function<void()> release) : release(release) {}
        ~ExecutingClaim() { release(); }
    private:
        std::function<void()> release;
};

}

SettlementManager::SettlementManager(SettlementStore& store, TransferPrimitive& transfers, TimeSource clock, uint64_t defaultTtl)
    : store(store), transfers(transfers), clock(clock), defaultTtl(defaultTtl) {
}

ExecutionStatus SettlementManager::pendingStatus(const Settlement& settlement) const {
    switch(settlement.getState()) {
        case SETTLEMENT_PENDING:
            return SUCCESS;
        case SETTLEMENT_COMPLETED:
            return ALREADY_EXECUTED;
        case SETTLEMENT_CANCELLED:
            return SETTLEMENT_CANCELLED;
        case SETTLEMENT_RECLAIMED:
            return NOT_FOUND;
    }
    return NOT_FOUND;
}

ExecutionStatus SettlementManager::initiate(const MemberId& caller, const SettlementRequest& request, Settlement& settlement) {
    if (request.amount == 0 || request.amount >= BALANCE_MAX_MAGNITUDE) return INVALID_AMOUNT;
    if (request.debtor == request.creditor) return SAME_PARTIES;
    if (caller != request.debtor) return NOT_AUTHORIZED;

    SettlementRequest normalized = request;
    if (normalized.ttl == 0) normalized.ttl = defaultTtl;

    std::lock_guard<std::mutex> lock(settlement_mutex);
    Settlement created(store.nextId(), store.getInstanceId(), normalized, clock());
    store.create(created);
    Logger::logStatus("Initiated settlement " + std::to_string(created.getId()) + ". Debtor: " + created.getDebtor() +
        ". Creditor: " + created.getCreditor() + ". Amount: " + std::to_string(created.getAmount()) +
        ". Expires at: " + std::to_string(created.getExpiresAt()));
    settlement = created;
    return SUCCESS;
}

void SettlementManager::finishExecuting(SettlementId id) {
    std::lock_guard<std::mutex> lock(settlement_mutex);
    executing.erase(id);
}

bool SettlementManager::commitTransfer(const Settlement& expected, const TransferProof& proof, bool enforceExpiry, ExecutionStatus& reason) {
    if (proof.from != expected.getDebtor() || proof.to != expected.getCreditor() ||
        proof.amount != expected.getAmount() || proof.reference != expected.transferReference()) {
        Logger::logError(RED + "[ERROR]" + RESET, "Transfer " + proof.transferId + " does not match settlement " +
            std::to_string(expected.getId()) + ": " + proof.from + " -> " + proof.to + " " + std::to_string(proof.amount));
        reason = TRANSFER_MISMATCH;
        return false;
    }

    std::lock_guard<std::mutex> lock(settlement_mutex);
    Settlement current;
    if (!store.read(expected.getId(), current)) {
        reason = NOT_FOUND;
        return false;
    }
    reason = pendingStatus(current);
    if (reason != SUCCESS) return false;

    Timestamp now = clock();
    if (enforceExpiry && current.isExpired(now)) {
        reason = SETTLEMENT_EXPIRED;
        return false;
    }
    current.markCompleted(proof, now);
    store.update(current);
    return true;
}

ExecutionStatus SettlementManager::execute(SettlementId id, const MemberId& caller, std::chrono::milliseconds timeout, Settlement& settlement) {
    Settlement expected;
    {
        std::lock_guard<std::mutex> lock(settlement_mutex);
        if (!store.read(id, expected)) return NOT_FOUND;
        settlement = expected;
        if (caller != expected.getDebtor()) return NOT_AUTHORIZED;
        ExecutionStatus status = pendingStatus(expected);
        if (status != SUCCESS) return status;
        if (executing.count(id) > 0) return SETTLEMENT_BUSY;
        if (expected.isExpired(clock())) return SETTLEMENT_EXPIRED;
        executing.insert(id);
    }
    ExecutingClaim claim([this, id]() { finishExecuting(id); });

    auto reason = std::make_shared<ExecutionStatus>(SUCCESS);

    // a previous attempt may have landed after its caller stopped waiting
    TransferProof landed;
    if (transfers.findConfirmed(expected.transferReference(), landed)) {
        if (!commitTransfer(expected, landed, false, *reason)) {
            reload(id, settlement);
            return *reason;
        }
        Logger::logStatus("Settlement " + std::to_string(id) + " reconciled with confirmed transfer " + landed.transferId);
        reload(id, settlement);
        return SUCCESS;
    }

    TransferRequest request;
    request.from = expected.getDebtor();
    request.to = expected.getCreditor();
    request.amount = expected.getAmount();
    request.reference = expected.transferReference();

    CommitHook hook = [this, expected, reason](const TransferProof& proof) {
        return commitTransfer(expected, proof, true, *reason);
    };

    TransferOutcome outcome;
    try {
        outcome = transfers.transfer(request, hook, timeout);
    } catch (const LedgerCorruption&) {
        throw;
    } catch (const std::exception& e) {
        Logger::logError(RED + "[ERROR]" + RESET, "Transfer for settlement " + std::to_string(id) + " failed: " + e.what());
        reload(id, settlement);
        return TRANSFER_FAILED;
    }

    ExecutionStatus status;
    switch(outcome.status) {
        case TRANSFER_CONFIRMED:
            status = SUCCESS;
            break;
        case TRANSFER_ALREADY_CONFIRMED:
            status = commitTransfer(expected, outcome.proof, false, *reason) ? SUCCESS : *reason;
            break;
        case TRANSFER_PENDING:
            status = TRANSFER_TIMEOUT;
            break;
        case TRANSFER_REJECTED:
            status = *reason == SUCCESS ? TRANSFER_FAILED : *reason;
            break;
        case TRANSFER_NO_FUNDS:
            status = INSUFFICIENT_FUNDS;
            break;
        default:
            Logger::logWarning("Transfer for settlement " + std::to_string(id) + " returned " + transferStatusAsString(outcome.status));
            status = TRANSFER_FAILED;
            break;
    }

    reload(id, settlement);
    if (status == SUCCESS) {
        Logger::logStatus("Executed settlement " + std::to_string(id) + ". Transfer: " + outcome.proof.transferId +
            ". " + expected.getDebtor() + " -> " + expected.getCreditor() + " " + std::to_string(expected.getAmount()));
    } else {
        Logger::logStatus("Settlement " + std::to_string(id) + " not executed: " + executionStatusAsString(status));
    }
    return status;
}

ExecutionStatus SettlementManager::executeWithRetry(SettlementId id, const MemberId& caller, std::chrono::milliseconds timeout, size_t retries, std::chrono::milliseconds backoff, Settlement& settlement) {
    ExecutionStatus status = execute(id, caller, timeout, settlement);
    bool timedOut = false;
    for (size_t attempt = 1; attempt <= retries; attempt++) {
        if (status != TRANSFER_TIMEOUT && status != TRANSFER_FAILED) break;
        if (status == TRANSFER_TIMEOUT) timedOut = true;
        Logger::logWarning("execute settlement " + std::to_string(id) + " failed (attempt " + std::to_string(attempt) + "/" +
            std::to_string(retries) + "): " + executionStatusAsString(status) + ". Retrying in " + std::to_string(backoff.count()) + "ms");
        std::this_thread::sleep_for(backoff);
        backoff *= RETRY_BACKOFF_MULTIPLIER;
        status = execute(id, caller, timeout, settlement);
    }
    // the bundle of a timed out attempt landed while we were backing off
    if (timedOut && status == ALREADY_EXECUTED) {
        Logger::logStatus("Settlement " + std::to_string(id) + " completed by an earlier attempt");
        return SUCCESS;
    }
    return status;
}

ExecutionStatus SettlementManager::cancel(SettlementId id, const MemberId& caller, Settlement& settlement) {
    std::lock_guard<std::mutex> lock(settlement_mutex);
    if (!store.read(id, settlement)) return NOT_FOUND;
    if (caller != settlement.getDebtor()) return NOT_AUTHORIZED;
    ExecutionStatus status = pendingStatus(settlement);
    if (status != SUCCESS) return status;
    if (executing.count(id) > 0) return SETTLEMENT_BUSY;

    settlement.markCancelled();
    store.update(settlement);
    Logger::logStatus("Cancelled settlement " + std::to_string(id));
    return SUCCESS;
}

ExecutionStatus SettlementManager::reclaim(SettlementId id, Settlement& settlement) {
    std::lock_guard<std::mutex> lock(settlement_mutex);
    if (!store.read(id, settlement)) return NOT_FOUND;
    ExecutionStatus status = pendingStatus(settlement);
    if (status != SUCCESS) return status;
    if (executing.count(id) > 0) return SETTLEMENT_BUSY;
    if (!settlement.isExpired(clock())) return NOT_EXPIRED;

    store.erase(settlement);
    settlement.markReclaimed();
    Logger::logStatus("Reclaimed expired settlement " + std::to_string(id));
    return SUCCESS;
}

size_t SettlementManager::reclaimExpired() {
    vector<Settlement> all;
    {
        std::lock_guard<std::mutex> lock(settlement_mutex);
        all = store.getAll();
    }
    Timestamp now = clock();
    size_t reclaimed = 0;
    for (const auto& s : all) {
        if (s.getState() != SETTLEMENT_PENDING || !s.isExpired(now)) continue;
        Settlement out;
        if (reclaim(s.getId(), out) == SUCCESS) reclaimed++;
    }
    return reclaimed;
}

void SettlementManager::reload(SettlementId id, Settlement& settlement) const {
    std::lock_guard<std::mutex> lock(settlement_mutex);
    if (!store.read(id, settlement)) {
        // erased by a concurrent reclaim
        settlement.markReclaimed();
    }
}

ExecutionStatus SettlementManager::getSettlement(SettlementId id, Settlement& settlement) const {
    std::lock_guard<std::mutex> lock(settlement_mutex);
    if (!store.read(id, settlement)) return NOT_FOUND;
    return SUCCESS;
}

bool SettlementManager::isExecuted(SettlementId id) const {
    Settlement s;
    if (getSettlement(id, s) != SUCCESS) return false;
    return s.getState() == SETTLEMENT_COMPLETED;
}

vector<Settlement> SettlementManager::listMemberSettlements(const MemberId& member, optional<GroupId> group, optional<SettlementState> state, size_t limit) const {
    std::lock_guard<std::mutex> lock(settlement_mutex);
    std::set<SettlementId> ids;
    for (auto id : store.getDebtorIds(member)) ids.insert(id);
    for (auto id : store.getCreditorIds(member)) ids.insert(id);

    vector<Settlement> ret;
    for (auto it = ids.rbegin(); it != ids.rend() && ret.size() < limit; ++it) {
        Settlement s;
        if (!store.read(*it, s)) continue;
        if (group && s.getGroup() != group) continue;
        if (state && s.getState() != *state) continue;
        ret.push_back(s);
    }
    return ret;
}
