#include <algorithm>
#include "split.hpp"
using namespace std;

ExecutionStatus computeSplit(TransactionAmount amount, const vector<MemberId>& participants, SplitShares& shares, size_t maxParticipants) {
    shares.clear();
    if (amount == 0 || amount >= BALANCE_MAX_MAGNITUDE) return INVALID_AMOUNT;
    if (participants.empty()) return EMPTY_PARTICIPANTS;
    if (participants.size() > maxParticipants) return TOO_MANY_PARTICIPANTS;

    TransactionAmount count = participants.size();
    TransactionAmount base = amount / count;
    TransactionAmount remainder = amount % count;

    shares.reserve(participants.size());
    for (size_t i = 0; i < participants.size(); i++) {
        TransactionAmount share = base + (i < remainder ? 1 : 0);
        shares.push_back(make_pair(participants[i], share));
    }
    return SUCCESS;
}

vector<MemberId> orderParticipants(const MemberId& payer, const vector<MemberId>& participants, SplitPolicy policy) {
    if (policy == SPLIT_IN_GIVEN_ORDER) return participants;

    vector<MemberId> others;
    bool hasPayer = false;
    for (const auto& p : participants) {
        if (p == payer) {
            hasPayer = true;
        } else {
            others.push_back(p);
        }
    }
    std::sort(others.begin(), others.end());
    vector<MemberId> ordered;
    if (hasPayer) ordered.push_back(payer);
    ordered.insert(ordered.end(), others.begin(), others.end());
    return ordered;
}
