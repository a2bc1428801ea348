#include <stdexcept>
#include "membership.hpp"
using namespace std;

StaticMembership::StaticMembership() {
}

StaticMembership::StaticMembership(const json& config) {
    if (!config.is_object()) throw std::runtime_error("groups config must map group ids to member arrays");
    for (auto it = config.begin(); it != config.end(); ++it) {
        GroupId group = std::stoull(it.key());
        for (const auto& member : it.value()) {
            groups[group].insert(member.get<string>());
        }
    }
}

void StaticMembership::addMember(GroupId group, const MemberId& member) {
    std::lock_guard<std::mutex> guard(lock);
    groups[group].insert(member);
}

void StaticMembership::removeMember(GroupId group, const MemberId& member) {
    std::lock_guard<std::mutex> guard(lock);
    auto g = groups.find(group);
    if (g != groups.end()) g->second.erase(member);
}

bool StaticMembership::isMember(GroupId group, const MemberId& member) const {
    std::lock_guard<std::mutex> guard(lock);
    auto g = groups.find(group);
    if (g == groups.end()) return false;
    return g->second.count(member) > 0;
}

vector<MemberId> StaticMembership::members(GroupId group) const {
    std::lock_guard<std::mutex> guard(lock);
    vector<MemberId> ret;
    auto g = groups.find(group);
    if (g == groups.end()) return ret;
    ret.assign(g->second.begin(), g->second.end());
    return ret;
}
