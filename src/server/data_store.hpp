#pragma once
#include <string>
#include <memory>
#include <functional>
#include <leveldb/db.h>
#include <leveldb/write_batch.h>

class DataStore {
    public:
        DataStore();
        virtual ~DataStore();
        virtual void init(const std::string& path);
        void closeDB();
        void deleteDB();
        virtual void clear();
    protected:
        bool readKey(const std::string& key, std::string& value) const;
        bool hasKey(const std::string& key) const;
        void commit(leveldb::WriteBatch& batch);
        // visits keys starting with prefix in order, stops when the callback returns false
        void forEachWithPrefix(const std::string& prefix, std::function<bool(const std::string&, const std::string&)> func) const;
        std::unique_ptr<leveldb::DB> db;
        std::string dbPath;
};
