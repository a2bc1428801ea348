#include <iomanip>
#include <random>
#include <sstream>
#include "../core/helpers.hpp"
#include "settlement_store.hpp"
using namespace std;

#define SETTLEMENT_PREFIX "s/"
#define DEBTOR_INDEX_PREFIX "d/"
#define CREDITOR_INDEX_PREFIX "r/"
#define SETTLEMENT_COUNTER_KEY "c/settlement"
#define INSTANCE_ID_KEY "c/instance"

static string settlementKey(SettlementId id) {
    return string(SETTLEMENT_PREFIX) + uint64ToKey(id);
}

static string indexPrefix(const char* prefix, const MemberId& member) {
    return string(prefix) + uint64ToKey(member.size()) + member + "/";
}

static string randomInstanceId() {
    std::random_device rd;
    std::mt19937_64 gen(((uint64_t) rd() << 32) ^ rd());
    std::stringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << gen();
    return ss.str();
}

SettlementStore::SettlementStore() {
}

void SettlementStore::init(const string& path) {
    DataStore::init(path);
    loadInstanceId();
}

void SettlementStore::clear() {
    DataStore::clear();
    loadInstanceId();
}

void SettlementStore::loadInstanceId() {
    if (readKey(INSTANCE_ID_KEY, instanceId)) return;
    instanceId = randomInstanceId();
    leveldb::WriteBatch batch;
    batch.Put(INSTANCE_ID_KEY, instanceId);
    commit(batch);
}

const string& SettlementStore::getInstanceId() const {
    return instanceId;
}

void SettlementStore::create(const Settlement& settlement) {
    leveldb::WriteBatch batch;
    batch.Put(settlementKey(settlement.getId()), settlement.toJson().dump());
    batch.Put(indexPrefix(DEBTOR_INDEX_PREFIX, settlement.getDebtor()) + uint64ToKey(settlement.getId()), "");
    batch.Put(indexPrefix(CREDITOR_INDEX_PREFIX, settlement.getCreditor()) + uint64ToKey(settlement.getId()), "");
    batch.Put(SETTLEMENT_COUNTER_KEY, std::to_string(settlement.getId()));
    commit(batch);
}

void SettlementStore::update(const Settlement& settlement) {
    leveldb::WriteBatch batch;
    batch.Put(settlementKey(settlement.getId()), settlement.toJson().dump());
    commit(batch);
}

void SettlementStore::erase(const Settlement& settlement) {
    leveldb::WriteBatch batch;
    batch.Delete(settlementKey(settlement.getId()));
    batch.Delete(indexPrefix(DEBTOR_INDEX_PREFIX, settlement.getDebtor()) + uint64ToKey(settlement.getId()));
    batch.Delete(indexPrefix(CREDITOR_INDEX_PREFIX, settlement.getCreditor()) + uint64ToKey(settlement.getId()));
    commit(batch);
}

bool SettlementStore::read(SettlementId id, Settlement& settlement) const {
    string value;
    if (!readKey(settlementKey(id), value)) return false;
    settlement = Settlement(json::parse(value));
    return true;
}

SettlementId SettlementStore::nextId() const {
    string value;
    if (!readKey(SETTLEMENT_COUNTER_KEY, value)) return 1;
    return std::stoull(value) + 1;
}

vector<SettlementId> SettlementStore::readIndex(const string& prefix) const {
    vector<SettlementId> ids;
    forEachWithPrefix(prefix, [&](const string& key, const string&) {
        ids.push_back(std::stoull(key.substr(prefix.size())));
        return true;
    });
    return ids;
}

vector<SettlementId> SettlementStore::getDebtorIds(const MemberId& debtor) const {
    return readIndex(indexPrefix(DEBTOR_INDEX_PREFIX, debtor));
}

vector<SettlementId> SettlementStore::getCreditorIds(const MemberId& creditor) const {
    return readIndex(indexPrefix(CREDITOR_INDEX_PREFIX, creditor));
}

vector<Settlement> SettlementStore::getAll() const {
    vector<Settlement> ret;
    forEachWithPrefix(SETTLEMENT_PREFIX, [&](const string&, const string& value) {
        ret.push_back(Settlement(json::parse(value)));
        return true;
    });
    return ret;
}
