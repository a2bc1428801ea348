#include <filesystem>
#include <stdexcept>
#include "data_store.hpp"
using namespace std;

DataStore::DataStore() {
}

DataStore::~DataStore() {
    closeDB();
}

void DataStore::init(const string& path) {
    if (db) closeDB();
    dbPath = path;
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

    leveldb::Options options;
    options.create_if_missing = true;
    leveldb::DB* raw = nullptr;
    leveldb::Status status = leveldb::DB::Open(options, path, &raw);
    if (!status.ok()) throw std::runtime_error("Could not open DataStore db " + path + ": " + status.ToString());
    db.reset(raw);
}

void DataStore::closeDB() {
    db.reset();
}

void DataStore::deleteDB() {
    closeDB();
    leveldb::Options options;
    leveldb::Status status = leveldb::DestroyDB(dbPath, options);
    if (!status.ok()) throw std::runtime_error("Could not delete DataStore db " + dbPath + ": " + status.ToString());
}

void DataStore::clear() {
    if (!db) throw std::runtime_error("DataStore not open");
    leveldb::WriteBatch batch;
    std::unique_ptr<leveldb::Iterator> it(db->NewIterator(leveldb::ReadOptions()));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        batch.Delete(it->key());
    }
    commit(batch);
}

bool DataStore::readKey(const string& key, string& value) const {
    if (!db) throw std::runtime_error("DataStore not open");
    leveldb::Status status = db->Get(leveldb::ReadOptions(), key, &value);
    if (status.IsNotFound()) return false;
    if (!status.ok()) throw std::runtime_error("Read failed: " + status.ToString());
    return true;
}

bool DataStore::hasKey(const string& key) const {
    string value;
    return readKey(key, value);
}

void DataStore::commit(leveldb::WriteBatch& batch) {
    if (!db) throw std::runtime_error("DataStore not open");
    leveldb::WriteOptions options;
    options.sync = true;
    leveldb::Status status = db->Write(options, &batch);
    if (!status.ok()) throw std::runtime_error("Write failed: " + status.ToString());
}

void DataStore::forEachWithPrefix(const string& prefix, std::function<bool(const string&, const string&)> func) const {
    if (!db) throw std::runtime_error("DataStore not open");
    std::unique_ptr<leveldb::Iterator> it(db->NewIterator(leveldb::ReadOptions()));
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        if (!func(it->key().ToString(), it->value().ToString())) break;
    }
    if (!it->status().ok()) throw std::runtime_error("Iteration failed: " + it->status().ToString());
}
