#pragma once
#include <vector>
#include "../core/common.hpp"
#include "../core/settlement.hpp"
#include "data_store.hpp"

class SettlementStore : public DataStore {
    public:
        SettlementStore();
        void init(const std::string& path) override;
        // also issues a fresh instance id, a wiped store never reuses transfer references
        void clear() override;
        const std::string& getInstanceId() const;
        // writes the record, its debtor / creditor index entries and the id counter in one batch
        void create(const Settlement& settlement);
        void update(const Settlement& settlement);
        void erase(const Settlement& settlement);
        bool read(SettlementId id, Settlement& settlement) const;
        SettlementId nextId() const;
        std::vector<SettlementId> getDebtorIds(const MemberId& debtor) const;
        std::vector<SettlementId> getCreditorIds(const MemberId& creditor) const;
        std::vector<Settlement> getAll() const;
    protected:
        std::vector<SettlementId> readIndex(const std::string& prefix) const;
        void loadInstanceId();
        std::string instanceId;
};
