#include <filesystem>
#include "../core/logger.hpp"
#include "split_node.hpp"
using namespace std;

static string storePath(const json& config, const char* dirName) {
    return (std::filesystem::path(config["dataPath"].get<string>()) / dirName).string();
}

SplitNode::SplitNode(const json& config, const MembershipOracle& membership, TransferPrimitive& transfers, TimeSource clock)
    : config(config),
      balances(ledger, membership, clock, config["maxParticipants"].get<size_t>()),
      optimizer(balances),
      settlements(settlementStore, transfers, clock, config["settlementTtl"].get<uint64_t>()),
      transfers(transfers),
      transferTimeout(config["transferTimeoutMs"].get<uint64_t>()),
      transferRetries(config["transferRetries"].get<size_t>()),
      retryBackoff(config["retryBackoffMs"].get<uint64_t>()),
      running(false) {
}

SplitNode::~SplitNode() {
    shutdown();
}

void SplitNode::init() {
    ledger.init(storePath(config, LEDGER_DIR_NAME));
    settlementStore.init(storePath(config, SETTLEMENTS_DIR_NAME));
    running = true;
    Logger::logStatus("Opened ledger at " + config["dataPath"].get<string>());
}

void SplitNode::shutdown() {
    if (!running) return;
    // late bundles still commit into the settlement store
    transfers.waitForPending();
    ledger.closeDB();
    settlementStore.closeDB();
    running = false;
    Logger::logStatus("Closed ledger at " + config["dataPath"].get<string>());
}

void SplitNode::deleteData() {
    transfers.waitForPending();
    running = false;
    ledger.deleteDB();
    settlementStore.deleteDB();
}

ExecutionStatus SplitNode::applyExpense(GroupId group, const MemberId& payer, TransactionAmount amount, const vector<MemberId>& participants, Expense& expense, SplitPolicy policy) {
    return balances.applyExpense(group, payer, amount, participants, expense, policy);
}

SignedAmount SplitNode::getBalance(GroupId group, const MemberId& member) const {
    return balances.getBalance(group, member);
}

LedgerState SplitNode::getGroupBalances(GroupId group) const {
    return balances.getGroupBalances(group);
}

SettlementPlan SplitNode::computePlan(GroupId group) const {
    return optimizer.computePlan(group);
}

bool SplitNode::rebuildBalances(GroupId group) {
    return balances.rebuildBalances(group);
}

bool SplitNode::verifyGroup(GroupId group) const {
    return balances.verifyGroup(group);
}

bool SplitNode::getExpense(ExpenseId id, Expense& expense) const {
    return balances.getExpense(id, expense);
}

vector<Expense> SplitNode::listGroupExpenses(GroupId group, bool includeSettled, size_t limit, size_t offset) const {
    return balances.listGroupExpenses(group, includeSettled, limit, offset);
}

vector<Expense> SplitNode::listMemberExpenses(const MemberId& member, optional<GroupId> group, size_t limit) const {
    return balances.listMemberExpenses(member, group, limit);
}

size_t SplitNode::countGroupExpenses(GroupId group) const {
    return balances.countGroupExpenses(group);
}

bool SplitNode::isExpenseSettled(ExpenseId id) const {
    return balances.isExpenseSettled(id);
}

ExecutionStatus SplitNode::markExpenseSettled(ExpenseId id) {
    return balances.markExpenseSettled(id);
}

ExecutionStatus SplitNode::initiateSettlement(const MemberId& caller, const SettlementRequest& request, Settlement& settlement) {
    if (request.expenseRef) {
        Expense referenced;
        if (!balances.getExpense(*request.expenseRef, referenced)) return NOT_FOUND;
    }
    return settlements.initiate(caller, request, settlement);
}

ExecutionStatus SplitNode::executeSettlement(SettlementId id, const MemberId& caller, Settlement& settlement) {
    ExecutionStatus status = settlements.executeWithRetry(id, caller, transferTimeout, transferRetries, retryBackoff, settlement);
    // ALREADY_EXECUTED covers a bundle that landed after an earlier call timed out
    bool completed = status == SUCCESS || (status == ALREADY_EXECUTED && settlement.getState() == SETTLEMENT_COMPLETED);
    if (completed && settlement.getExpenseRef()) {
        // the settled marker is separate from balances, which keep their full history
        ExecutionStatus marked = balances.markExpenseSettled(*settlement.getExpenseRef());
        if (marked != SUCCESS) {
            Logger::logWarning("Settlement " + std::to_string(id) + " references expense " + std::to_string(*settlement.getExpenseRef()) +
                " which could not be marked settled: " + executionStatusAsString(marked));
        }
    }
    return status;
}

ExecutionStatus SplitNode::cancelSettlement(SettlementId id, const MemberId& caller, Settlement& settlement) {
    return settlements.cancel(id, caller, settlement);
}

ExecutionStatus SplitNode::reclaimSettlement(SettlementId id, Settlement& settlement) {
    return settlements.reclaim(id, settlement);
}

size_t SplitNode::reclaimExpiredSettlements() {
    return settlements.reclaimExpired();
}

ExecutionStatus SplitNode::getSettlement(SettlementId id, Settlement& settlement) const {
    return settlements.getSettlement(id, settlement);
}

vector<Settlement> SplitNode::listMemberSettlements(const MemberId& member, optional<GroupId> group, optional<SettlementState> state, size_t limit) const {
    return settlements.listMemberSettlements(member, group, state, limit);
}
