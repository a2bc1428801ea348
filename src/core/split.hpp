#pragma once
#include <vector>
#include <utility>
#include "common.hpp"
#include "constants.hpp"
#include "status.hpp"

typedef std::vector<std::pair<MemberId, TransactionAmount>> SplitShares;

enum SplitPolicy {
    // participants keep the order the caller supplied
    SPLIT_IN_GIVEN_ORDER,
    // payer first, remaining participants sorted by member id
    SPLIT_PAYER_FIRST
};

/*
    Divides amount across participants in order. The first (amount mod N)
    participants receive one extra unit, so the shares always sum to amount.
*/
ExecutionStatus computeSplit(TransactionAmount amount, const std::vector<MemberId>& participants, SplitShares& shares, size_t maxParticipants = MAX_SPLIT_PARTICIPANTS);

std::vector<MemberId> orderParticipants(const MemberId& payer, const std::vector<MemberId>& participants, SplitPolicy policy);
