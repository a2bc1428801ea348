#include <cstring>
#include <stdexcept>
#include "../core/helpers.hpp"
#include "../core/logger.hpp"
#include "../core/signed_balance.hpp"
#include "../core/status.hpp"
#include "ledger.hpp"
using namespace std;

#define BALANCE_PREFIX "b/"
#define EXPENSE_PREFIX "e/"
#define SPLIT_PREFIX "p/"
#define GROUP_INDEX_PREFIX "g/"
#define MEMBER_INDEX_PREFIX "m/"
#define SETTLED_PREFIX "x/"
#define EXPENSE_COUNTER_KEY "c/expense"

static string balanceKey(GroupId group, const MemberId& member) {
    return string(BALANCE_PREFIX) + uint64ToKey(group) + "/" + member;
}

static string expenseKey(ExpenseId id) {
    return string(EXPENSE_PREFIX) + uint64ToKey(id);
}

// length prefixed so one member id can never be a prefix of another
static string memberIndexPrefix(const MemberId& member) {
    return string(MEMBER_INDEX_PREFIX) + uint64ToKey(member.size()) + member + "/";
}

static string encodedToBytes(EncodedBalance value) {
    return string((const char*) &value, sizeof(EncodedBalance));
}

static EncodedBalance bytesToEncoded(const string& bytes) {
    if (bytes.size() != sizeof(EncodedBalance)) throw LedgerCorruption("malformed balance record");
    EncodedBalance value;
    std::memcpy(&value, bytes.data(), sizeof(EncodedBalance));
    return value;
}

Ledger::Ledger() : lastExpenseId(NULL_EXPENSE) {
}

void Ledger::init(const string& path) {
    DataStore::init(path);
    std::lock_guard<std::mutex> lock(ledger_mutex);
    string value;
    lastExpenseId = readKey(EXPENSE_COUNTER_KEY, value) ? std::stoull(value) : NULL_EXPENSE;
    loadBalances();
}

void Ledger::loadBalances() {
    balances.clear();
    const size_t groupStart = strlen(BALANCE_PREFIX);
    forEachWithPrefix(BALANCE_PREFIX, [&](const string& key, const string& value) {
        GroupId group = std::stoull(key.substr(groupStart, 20));
        MemberId member = key.substr(groupStart + 21);
        balances[group][member] = decodeBalance(bytesToEncoded(value));
        return true;
    });
    Logger::logStatus("Loaded balances for " + std::to_string(balances.size()) + " groups");
}

SignedAmount Ledger::getBalance(GroupId group, const MemberId& member) const {
    std::lock_guard<std::mutex> lock(ledger_mutex);
    auto g = balances.find(group);
    if (g == balances.end()) return 0;
    auto m = g->second.find(member);
    if (m == g->second.end()) return 0;
    return m->second;
}

LedgerState Ledger::getState(GroupId group) const {
    std::lock_guard<std::mutex> lock(ledger_mutex);
    auto g = balances.find(group);
    if (g == balances.end()) return LedgerState();
    return g->second;
}

ExpenseId Ledger::commitExpense(Expense& expense, const LedgerState& deltas) {
    std::lock_guard<std::mutex> lock(ledger_mutex);
    ExpenseId id = lastExpenseId + 1;
    expense.setId(id);

    leveldb::WriteBatch batch;
    batch.Put(expenseKey(id), expense.toJson().dump());
    const vector<Split>& splits = expense.getSplits();
    for (size_t i = 0; i < splits.size(); i++) {
        batch.Put(string(SPLIT_PREFIX) + uint64ToKey(id) + "/" + uint64ToKey(i), splits[i].toJson().dump());
    }
    batch.Put(string(GROUP_INDEX_PREFIX) + uint64ToKey(expense.getGroup()) + "/" + uint64ToKey(id), "");
    for (const auto& member : expense.getParticipants()) {
        batch.Put(memberIndexPrefix(member) + uint64ToKey(id), "");
    }
    batch.Put(EXPENSE_COUNTER_KEY, std::to_string(id));

    // apply deltas on the encoded form, nothing is cached until the batch lands
    LedgerState& current = balances[expense.getGroup()];
    LedgerState updated;
    for (const auto& delta : deltas) {
        auto it = current.find(delta.first);
        EncodedBalance encoded = encodeBalance(it == current.end() ? 0 : it->second);
        if (delta.second >= 0) {
            encoded = applyBalanceDelta(encoded, (TransactionAmount) delta.second, true);
        } else {
            encoded = applyBalanceDelta(encoded, (TransactionAmount) (-delta.second), false);
        }
        batch.Put(balanceKey(expense.getGroup(), delta.first), encodedToBytes(encoded));
        updated[delta.first] = decodeBalance(encoded);
    }
    commit(batch);

    lastExpenseId = id;
    for (const auto& u : updated) {
        current[u.first] = u.second;
    }
    return id;
}

void Ledger::replaceGroupBalances(GroupId group, const LedgerState& state) {
    std::lock_guard<std::mutex> lock(ledger_mutex);
    leveldb::WriteBatch batch;
    LedgerState& current = balances[group];
    for (const auto& entry : current) {
        if (state.find(entry.first) == state.end()) {
            batch.Delete(balanceKey(group, entry.first));
        }
    }
    for (const auto& entry : state) {
        batch.Put(balanceKey(group, entry.first), encodedToBytes(encodeBalance(entry.second)));
    }
    commit(batch);
    current = state;
}

bool Ledger::getExpense(ExpenseId id, Expense& expense) const {
    string value;
    if (!readKey(expenseKey(id), value)) return false;
    expense = Expense(json::parse(value));
    return true;
}

vector<Expense> Ledger::getGroupExpenses(GroupId group) const {
    vector<Expense> expenses;
    string prefix = string(GROUP_INDEX_PREFIX) + uint64ToKey(group) + "/";
    vector<ExpenseId> ids;
    forEachWithPrefix(prefix, [&](const string& key, const string&) {
        ids.push_back(std::stoull(key.substr(prefix.size())));
        return true;
    });
    for (auto id : ids) {
        Expense e;
        if (!getExpense(id, e)) throw LedgerCorruption("group index points at missing expense " + std::to_string(id));
        expenses.push_back(e);
    }
    return expenses;
}

vector<ExpenseId> Ledger::getMemberExpenseIds(const MemberId& member) const {
    vector<ExpenseId> ids;
    string prefix = memberIndexPrefix(member);
    forEachWithPrefix(prefix, [&](const string& key, const string&) {
        ids.push_back(std::stoull(key.substr(prefix.size())));
        return true;
    });
    return ids;
}

size_t Ledger::countGroupExpenses(GroupId group) const {
    size_t count = 0;
    forEachWithPrefix(string(GROUP_INDEX_PREFIX) + uint64ToKey(group) + "/", [&](const string&, const string&) {
        count++;
        return true;
    });
    return count;
}

bool Ledger::isExpenseSettled(ExpenseId id) const {
    return hasKey(string(SETTLED_PREFIX) + uint64ToKey(id));
}

void Ledger::markExpenseSettled(ExpenseId id) {
    leveldb::WriteBatch batch;
    batch.Put(string(SETTLED_PREFIX) + uint64ToKey(id), "1");
    commit(batch);
}

ExpenseId Ledger::getLastExpenseId() const {
    std::lock_guard<std::mutex> lock(ledger_mutex);
    return lastExpenseId;
}
