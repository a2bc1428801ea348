#pragma once
#include <map>
#include <set>
#include <mutex>
#include <vector>
#include "../core/common.hpp"

// Group membership is owned outside the ledger; the ledger only asks.
class MembershipOracle {
    public:
        virtual ~MembershipOracle() {}
        virtual bool isMember(GroupId group, const MemberId& member) const = 0;
        virtual std::vector<MemberId> members(GroupId group) const = 0;
};

// In-memory registry, typically loaded from the "groups" config key
class StaticMembership : public MembershipOracle {
    public:
        StaticMembership();
        explicit StaticMembership(const json& groups);
        void addMember(GroupId group, const MemberId& member);
        void removeMember(GroupId group, const MemberId& member);
        bool isMember(GroupId group, const MemberId& member) const override;
        std::vector<MemberId> members(GroupId group) const override;
    protected:
        std::map<GroupId, std::set<MemberId>> groups;
        mutable std::mutex lock;
};
