#include "signed_balance.hpp"
#include "constants.hpp"
#include "status.hpp"
using namespace std;

static void checkMagnitude(uint64_t magnitude) {
    if (magnitude >= BALANCE_MAX_MAGNITUDE) {
        throw LedgerCorruption("balance magnitude " + std::to_string(magnitude) + " exceeds ceiling");
    }
}

EncodedBalance encodeBalance(SignedAmount value) {
    if (value >= 0) {
        checkMagnitude((uint64_t)value);
        return (EncodedBalance)value;
    }
    // -(value + 1) + 1 avoids overflow on INT64_MIN
    uint64_t magnitude = (uint64_t)(-(value + 1)) + 1;
    checkMagnitude(magnitude);
    return BALANCE_SIGN_OFFSET + magnitude;
}

SignedAmount decodeBalance(EncodedBalance encoded) {
    if (encoded >= BALANCE_SIGN_OFFSET) {
        uint64_t magnitude = encoded - BALANCE_SIGN_OFFSET;
        checkMagnitude(magnitude);
        return -(SignedAmount)magnitude;
    }
    checkMagnitude(encoded);
    return (SignedAmount)encoded;
}

EncodedBalance applyBalanceDelta(EncodedBalance current, TransactionAmount delta, bool isCredit) {
    checkMagnitude(delta);
    bool isNegative = current >= BALANCE_SIGN_OFFSET;
    uint64_t magnitude = isNegative ? current - BALANCE_SIGN_OFFSET : current;
    checkMagnitude(magnitude);

    if (isCredit) {
        if (isNegative) {
            if (delta >= magnitude) {
                // debt paid off, flips to non-negative
                return delta - magnitude;
            }
            return BALANCE_SIGN_OFFSET + (magnitude - delta);
        }
        uint64_t newMagnitude = magnitude + delta;
        checkMagnitude(newMagnitude);
        return newMagnitude;
    }

    if (isNegative) {
        uint64_t newMagnitude = magnitude + delta;
        checkMagnitude(newMagnitude);
        return BALANCE_SIGN_OFFSET + newMagnitude;
    }
    if (delta > magnitude) {
        // credit exhausted, flips to negative
        return BALANCE_SIGN_OFFSET + (delta - magnitude);
    }
    return magnitude - delta;
}
